/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_MANAGER_HPP
#define EVENT_MANAGER_HPP

/**
 * @file EventManager.hpp
 * @brief Typed publish/subscribe bus with queued dispatch and bounded history
 *
 * Dispatch order for one event:
 * 1. timestamp (from the attached clock) and sequence number are assigned
 * 2. global listeners run
 * 3. handlers for the event's type (or custom name) run
 * 4. the event is appended to history; the oldest entries are dropped once
 *    the history exceeds its cap
 *
 * Handler exceptions are caught per handler, logged and returned in the
 * DispatchReport so one faulty handler never stops the others.
 */

#include "events/Event.hpp"
#include "events/EventTypeId.hpp"

#include <array>
#include <boost/circular_buffer.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Realmforge {

class JsonValue;

using EventHandler = std::function<void(const Event &)>;

class EventManager {
public:
  static constexpr size_t DEFAULT_MAX_HISTORY = 1000;
  static constexpr size_t DEFAULT_MAX_QUEUE = 8192;
  static constexpr size_t SUMMARY_EVENT_COUNT = 20;

  // Dispatch control for handler execution
  enum class DispatchMode : uint8_t { Deferred = 0, Immediate = 1 };

  // Token-based handler management
  struct HandlerToken {
    EventTypeId typeId;
    uint64_t id;
    bool forName{false};
    std::string name;
    bool global{false};
  };

  struct HandlerFailure {
    std::string eventId;
    std::string eventType;
    uint64_t handlerId;
    std::string message;
  };

  struct DispatchReport {
    size_t processed{0};
    std::vector<HandlerFailure> failures;

    void merge(DispatchReport &&other);
  };

  using Clock = std::function<int64_t()>;

  explicit EventManager(size_t maxHistory = DEFAULT_MAX_HISTORY,
                        size_t maxQueue = DEFAULT_MAX_QUEUE);

  EventManager(const EventManager &) = delete;
  EventManager &operator=(const EventManager &) = delete;

  HandlerToken subscribe(EventTypeId typeId, EventHandler handler);
  // Handlers for Custom events published under this name
  HandlerToken subscribe(const std::string &customName, EventHandler handler);
  // Listener invoked for every event, before type handlers
  HandlerToken addGlobalListener(EventHandler listener);
  bool unsubscribe(const HandlerToken &token);
  void clearAllHandlers();
  size_t getHandlerCount(EventTypeId typeId) const;

  /**
   * @brief Publishes an event
   *
   * Immediate dispatches before returning. Deferred appends to the queue;
   * when the queue is full the oldest queued event is dropped with a
   * warning.
   *
   * @return Report for an immediate dispatch; empty for a deferred one
   */
  DispatchReport publish(Event event, DispatchMode mode = DispatchMode::Deferred);

  // Convenience wrapper building the Event in place
  DispatchReport publishEvent(EventTypeId typeId, JsonObject data = {},
                              std::optional<std::string> sourceId = std::nullopt,
                              std::optional<std::string> targetId = std::nullopt,
                              std::optional<std::string> locationId = std::nullopt,
                              DispatchMode mode = DispatchMode::Deferred);

  /**
   * @brief Dispatches queued events oldest first
   * @param maxEvents Upper bound; nullopt drains events queued before the call
   *
   * Events published by handlers during the drain stay queued for the next
   * call.
   */
  DispatchReport processEvents(std::optional<size_t> maxEvents = std::nullopt);

  // History readers, most recent first; limit nullopt returns every match
  std::vector<Event> getEventsByType(EventTypeId typeId,
                                     std::optional<size_t> limit = std::nullopt) const;
  std::vector<Event> getEventsByName(const std::string &typeName,
                                     std::optional<size_t> limit = std::nullopt) const;
  std::vector<Event> getEventsBySource(const std::string &sourceId,
                                       std::optional<size_t> limit = std::nullopt) const;
  std::vector<Event> getEventsByLocation(const std::string &locationId,
                                         std::optional<size_t> limit = std::nullopt) const;
  std::vector<Event> getRecentEvents(size_t limit = 10) const;

  // Full history, oldest first
  std::vector<Event> getHistory() const;
  size_t getHistorySize() const { return m_history.size(); }

  void clearHistory() { m_history.clear(); }
  void clearQueue() { m_queue.clear(); }
  size_t getQueueSize() const { return m_queue.size(); }

  // Keeps the newest entries when shrinking
  void setMaxHistory(size_t maxHistory);
  size_t getMaxHistory() const { return m_history.capacity(); }
  void setMaxQueue(size_t maxQueue);
  size_t getMaxQueue() const { return m_maxQueue; }

  // Source of dispatch timestamps; without one events carry no timestamp
  void setClock(Clock clock) { m_clock = std::move(clock); }

  /**
   * @brief Summary used in snapshots
   *
   * Fields: queue_size, history_size, max_history, recent_events (newest
   * first, at most recentLimit), queued_events (oldest first).
   */
  JsonValue toJson(size_t recentLimit = SUMMARY_EVENT_COUNT) const;

  /**
   * @brief Rebuilds history and the pending queue from a toJson() summary
   * @return false if the summary is malformed
   */
  bool restoreHistory(const JsonValue &json);

private:
  struct HandlerEntry {
    uint64_t id;
    EventHandler handler;
  };

  template <typename Pred>
  std::vector<Event> collect(Pred &&predicate, std::optional<size_t> limit) const;

  void dispatch(Event &event, DispatchReport &report);
  void reserveEventId(const std::string &id);
  void invoke(const std::vector<HandlerEntry> &handlers, const Event &event,
              DispatchReport &report);

  std::array<std::vector<HandlerEntry>, EVENT_TYPE_COUNT> m_handlersByType;
  std::unordered_map<std::string, std::vector<HandlerEntry>> m_nameHandlers;
  std::vector<HandlerEntry> m_globalListeners;
  uint64_t m_nextHandlerId{1};

  std::deque<Event> m_queue;
  size_t m_maxQueue;
  boost::circular_buffer<Event> m_history;

  uint64_t m_nextEventId{1};
  uint64_t m_nextSequence{1};
  Clock m_clock;
};

} // namespace Realmforge

#endif // EVENT_MANAGER_HPP
