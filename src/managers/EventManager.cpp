/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EventManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <stdexcept>

namespace Realmforge {

void EventManager::DispatchReport::merge(DispatchReport &&other) {
  processed += other.processed;
  failures.insert(failures.end(), std::make_move_iterator(other.failures.begin()),
                  std::make_move_iterator(other.failures.end()));
}

EventManager::EventManager(size_t maxHistory, size_t maxQueue)
    : m_maxQueue(std::max<size_t>(1, maxQueue)),
      m_history(std::max<size_t>(1, maxHistory)) {}

EventManager::HandlerToken EventManager::subscribe(EventTypeId typeId,
                                                   EventHandler handler) {
  const size_t idx = static_cast<size_t>(typeId);
  if (idx >= m_handlersByType.size()) {
    throw std::invalid_argument(
        std::format("EventManager::subscribe - invalid event type {}", idx));
  }
  const uint64_t id = m_nextHandlerId++;
  m_handlersByType[idx].push_back(HandlerEntry{id, std::move(handler)});
  return HandlerToken{typeId, id, false, {}, false};
}

EventManager::HandlerToken EventManager::subscribe(const std::string &customName,
                                                   EventHandler handler) {
  const uint64_t id = m_nextHandlerId++;
  m_nameHandlers[customName].push_back(HandlerEntry{id, std::move(handler)});
  return HandlerToken{EventTypeId::Custom, id, true, customName, false};
}

EventManager::HandlerToken EventManager::addGlobalListener(EventHandler listener) {
  const uint64_t id = m_nextHandlerId++;
  m_globalListeners.push_back(HandlerEntry{id, std::move(listener)});
  return HandlerToken{EventTypeId::COUNT, id, false, {}, true};
}

bool EventManager::unsubscribe(const HandlerToken &token) {
  auto removeById = [&token](std::vector<HandlerEntry> &entries) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&token](const HandlerEntry &entry) {
                             return entry.id == token.id;
                           });
    if (it == entries.end()) {
      return false;
    }
    entries.erase(it);
    return true;
  };

  if (token.global) {
    return removeById(m_globalListeners);
  }
  if (token.forName) {
    auto it = m_nameHandlers.find(token.name);
    if (it == m_nameHandlers.end()) {
      return false;
    }
    const bool removed = removeById(it->second);
    if (it->second.empty()) {
      m_nameHandlers.erase(it);
    }
    return removed;
  }

  const size_t idx = static_cast<size_t>(token.typeId);
  if (idx >= m_handlersByType.size()) {
    return false;
  }
  return removeById(m_handlersByType[idx]);
}

void EventManager::clearAllHandlers() {
  for (auto &handlers : m_handlersByType) {
    handlers.clear();
  }
  m_nameHandlers.clear();
  m_globalListeners.clear();
}

size_t EventManager::getHandlerCount(EventTypeId typeId) const {
  const size_t idx = static_cast<size_t>(typeId);
  return idx < m_handlersByType.size() ? m_handlersByType[idx].size() : 0;
}

EventManager::DispatchReport EventManager::publish(Event event, DispatchMode mode) {
  DispatchReport report;
  if (event.id.empty()) {
    event.id = std::format("evt_{}", m_nextEventId++);
  }

  if (mode == DispatchMode::Immediate) {
    dispatch(event, report);
    return report;
  }

  if (m_queue.size() >= m_maxQueue) {
    EVENT_WARN(std::format("Event queue full ({}), dropping oldest '{}'",
                           m_maxQueue, m_queue.front().getTypeName()));
    m_queue.pop_front();
  }
  m_queue.push_back(std::move(event));
  return report;
}

EventManager::DispatchReport
EventManager::publishEvent(EventTypeId typeId, JsonObject data,
                           std::optional<std::string> sourceId,
                           std::optional<std::string> targetId,
                           std::optional<std::string> locationId,
                           DispatchMode mode) {
  Event event(typeId, std::move(data));
  event.sourceId = std::move(sourceId);
  event.targetId = std::move(targetId);
  event.locationId = std::move(locationId);
  return publish(std::move(event), mode);
}

EventManager::DispatchReport
EventManager::processEvents(std::optional<size_t> maxEvents) {
  DispatchReport report;

  // Only events queued before this call; handlers may publish more
  size_t budget = m_queue.size();
  if (maxEvents) {
    budget = std::min(budget, *maxEvents);
  }

  for (size_t i = 0; i < budget && !m_queue.empty(); ++i) {
    Event event = std::move(m_queue.front());
    m_queue.pop_front();
    dispatch(event, report);
  }
  return report;
}

void EventManager::invoke(const std::vector<HandlerEntry> &handlers,
                          const Event &event, DispatchReport &report) {
  // Copy so handlers may subscribe or unsubscribe while we iterate
  const std::vector<HandlerEntry> snapshot = handlers;
  for (const auto &entry : snapshot) {
    if (!entry.handler) {
      continue;
    }
    try {
      entry.handler(event);
    } catch (const std::exception &e) {
      EVENT_ERROR(std::format("Handler {} failed on {} '{}': {}", entry.id,
                              event.id, event.getTypeName(), e.what()));
      report.failures.push_back(
          HandlerFailure{event.id, event.getTypeName(), entry.id, e.what()});
    }
  }
}

void EventManager::dispatch(Event &event, DispatchReport &report) {
  if (m_clock) {
    event.timestamp = m_clock();
  }
  event.sequence = m_nextSequence++;

  invoke(m_globalListeners, event, report);

  invoke(m_handlersByType[static_cast<size_t>(event.type)], event, report);
  if (event.type == EventTypeId::Custom && !event.customType.empty()) {
    auto it = m_nameHandlers.find(event.customType);
    if (it != m_nameHandlers.end()) {
      invoke(it->second, event, report);
    }
  }

  m_history.push_back(event);
  ++report.processed;
}

template <typename Pred>
std::vector<Event> EventManager::collect(Pred &&predicate,
                                         std::optional<size_t> limit) const {
  std::vector<Event> result;
  for (auto it = m_history.rbegin(); it != m_history.rend(); ++it) {
    if (limit && result.size() >= *limit) {
      break;
    }
    if (predicate(*it)) {
      result.push_back(*it);
    }
  }
  return result;
}

std::vector<Event> EventManager::getEventsByType(EventTypeId typeId,
                                                 std::optional<size_t> limit) const {
  return collect([typeId](const Event &e) { return e.type == typeId; }, limit);
}

std::vector<Event> EventManager::getEventsByName(const std::string &typeName,
                                                 std::optional<size_t> limit) const {
  return collect(
      [&typeName](const Event &e) { return e.getTypeName() == typeName; }, limit);
}

std::vector<Event> EventManager::getEventsBySource(const std::string &sourceId,
                                                   std::optional<size_t> limit) const {
  return collect(
      [&sourceId](const Event &e) { return e.sourceId == sourceId; }, limit);
}

std::vector<Event>
EventManager::getEventsByLocation(const std::string &locationId,
                                  std::optional<size_t> limit) const {
  return collect(
      [&locationId](const Event &e) { return e.locationId == locationId; },
      limit);
}

std::vector<Event> EventManager::getRecentEvents(size_t limit) const {
  return collect([](const Event &) { return true; }, limit);
}

std::vector<Event> EventManager::getHistory() const {
  return std::vector<Event>(m_history.begin(), m_history.end());
}

void EventManager::setMaxHistory(size_t maxHistory) {
  if (maxHistory == 0) {
    EVENT_WARN("History cap of 0 requested, keeping 1 event");
    maxHistory = 1;
  }
  // rset_capacity drops from the front, keeping the newest events
  m_history.rset_capacity(maxHistory);
}

void EventManager::setMaxQueue(size_t maxQueue) {
  m_maxQueue = std::max<size_t>(1, maxQueue);
  while (m_queue.size() > m_maxQueue) {
    m_queue.pop_front();
  }
}

JsonValue EventManager::toJson(size_t recentLimit) const {
  JsonObject obj;
  obj["queue_size"] = JsonValue(m_queue.size());
  obj["history_size"] = JsonValue(m_history.size());
  obj["max_history"] = JsonValue(m_history.capacity());

  JsonArray recent;
  for (const auto &event : getRecentEvents(recentLimit)) {
    recent.push_back(event.toJson());
  }
  obj["recent_events"] = JsonValue(std::move(recent));

  JsonArray queued;
  for (const auto &event : m_queue) {
    queued.push_back(event.toJson());
  }
  obj["queued_events"] = JsonValue(std::move(queued));
  return JsonValue(std::move(obj));
}

void EventManager::reserveEventId(const std::string &id) {
  // Keep new ids clear of restored "evt_<n>" ids
  if (id.rfind("evt_", 0) != 0) {
    return;
  }
  uint64_t serial = 0;
  const char *first = id.data() + 4;
  const char *last = id.data() + id.size();
  if (std::from_chars(first, last, serial).ec == std::errc{}) {
    m_nextEventId = std::max(m_nextEventId, serial + 1);
  }
}

bool EventManager::restoreHistory(const JsonValue &json) {
  auto parseList = [](const JsonValue &list, std::vector<Event> &out) {
    const JsonArray *entries = list.tryAsArray();
    if (!entries) {
      return list.isNull();
    }
    for (const auto &entry : *entries) {
      auto event = Event::fromJson(entry);
      if (!event) {
        return false;
      }
      out.push_back(std::move(*event));
    }
    return true;
  };

  std::vector<Event> recent;
  std::vector<Event> queued;
  if (!json["recent_events"].isArray() ||
      !parseList(json["recent_events"], recent) ||
      !parseList(json["queued_events"], queued)) {
    EVENT_ERROR("Event summary is malformed");
    return false;
  }

  if (auto cap = json["max_history"].tryAsInt(); cap && *cap > 0) {
    setMaxHistory(static_cast<size_t>(*cap));
  }

  // Stored newest first
  m_history.clear();
  for (auto it = recent.rbegin(); it != recent.rend(); ++it) {
    it->sequence = m_nextSequence++;
    reserveEventId(it->id);
    m_history.push_back(std::move(*it));
  }

  m_queue.clear();
  for (auto &event : queued) {
    reserveEventId(event.id);
    m_queue.push_back(std::move(event));
  }
  return true;
}

} // namespace Realmforge
