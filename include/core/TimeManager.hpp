/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TIME_MANAGER_HPP
#define TIME_MANAGER_HPP

/**
 * @file TimeManager.hpp
 * @brief Step-driven simulation calendar with minute-exact scheduled callbacks
 *
 * Calendar layout:
 * - 60 minutes per hour, 24 hours per day
 * - 30-day months, 12 months, 360-day years
 * - Four 90-day seasons starting with Spring on day 1
 *
 * Time only moves when advanceMinutes() (or one of its wrappers) is called.
 */

#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace Realmforge {

class JsonValue;

/**
 * @brief Type-safe season enumeration
 */
enum class Season : uint8_t {
  Spring = 0,
  Summer = 1,
  Fall = 2,
  Winter = 3
};

enum class TimeOfDay : uint8_t {
  Night = 0,     // 00:00 - 06:00
  Dawn = 1,      // 06:00 - 08:00
  Morning = 2,   // 08:00 - 12:00
  Afternoon = 3, // 12:00 - 17:00
  Dusk = 4,      // 17:00 - 19:00
  Evening = 5    // 19:00 - 24:00
};

const char *seasonName(Season season);
const char *timeOfDayName(TimeOfDay period);

inline std::ostream &operator<<(std::ostream &os, Season season) {
  return os << seasonName(season);
}

inline std::ostream &operator<<(std::ostream &os, TimeOfDay period) {
  return os << timeOfDayName(period);
}

/**
 * @brief What happens to scheduled callbacks whose tick is jumped over
 *
 * ExactTickOnly fires only the entry whose key equals the new total; an
 * entry skipped by a multi-minute advance stays pending and never fires.
 * FireOnOrAfter fires every entry at or before the new total, in tick order.
 */
enum class MissedCallbackPolicy : uint8_t { ExactTickOnly, FireOnOrAfter };

class TimeManager {
public:
  static constexpr int MINUTES_PER_HOUR = 60;
  static constexpr int HOURS_PER_DAY = 24;
  static constexpr int DAYS_PER_MONTH = 30;
  static constexpr int DAYS_PER_YEAR = 360;
  static constexpr int DAYS_PER_SEASON = 90;
  static constexpr int WORK_START_HOUR = 8;
  static constexpr int WORK_END_HOUR = 17;
  static constexpr int DAYLIGHT_START_HOUR = 6;
  static constexpr int DAYLIGHT_END_HOUR = 19;

  using Callback = std::function<void()>;

  struct CallbackFailure {
    uint64_t callbackId;
    std::string label;
    int64_t tick;
    std::string message;
  };

  struct AdvanceResult {
    int64_t minutesAdvanced{0};
    size_t callbacksFired{0};
    std::vector<CallbackFailure> failures;
  };

  /**
   * @throws std::invalid_argument if day is outside 1..360 or hour outside
   * 0..23
   */
  explicit TimeManager(int startYear = 1, int startDay = 1, int startHour = 8,
                       MissedCallbackPolicy policy =
                           MissedCallbackPolicy::ExactTickOnly);

  /**
   * @brief Advances the clock with minute/hour/day/year carry, then fires
   * due callbacks
   *
   * Callbacks are detached from the table before they run, so a callback may
   * schedule new ones. Exceptions thrown by a callback are caught, logged and
   * reported in the result; remaining callbacks still run.
   *
   * @throws std::invalid_argument on a negative minute count
   */
  AdvanceResult advanceMinutes(int64_t minutes);
  AdvanceResult advanceHours(int64_t hours);
  AdvanceResult advanceDays(int64_t days);

  /**
   * @brief Advances to the next occurrence of hour:minute
   *
   * A target equal to the current time means the same time tomorrow.
   */
  AdvanceResult advanceToTime(int hour, int minute = 0);

  /**
   * @brief Schedules a callback minutesFromNow minutes ahead
   * @return Id usable with cancelScheduled()
   */
  uint64_t scheduleIn(int64_t minutesFromNow, Callback callback,
                      std::string label = {});
  uint64_t scheduleAt(int64_t absoluteTick, Callback callback,
                      std::string label = {});
  bool cancelScheduled(uint64_t callbackId);
  size_t getScheduledCount() const;
  void clearScheduled() { m_scheduled.clear(); }

  void setMissedCallbackPolicy(MissedCallbackPolicy policy) {
    m_policy = policy;
  }
  MissedCallbackPolicy getMissedCallbackPolicy() const { return m_policy; }

  // Calendar state
  int getYear() const { return m_year; }
  int getDay() const { return m_day; }
  int getHour() const { return m_hour; }
  int getMinute() const { return m_minute; }
  int64_t getTotalMinutes() const { return m_totalMinutes; }

  /**
   * @brief Jumps the calendar without touching total minutes or callbacks
   * @throws std::invalid_argument on out-of-range fields
   */
  void setTime(int year, int day, int hour, int minute = 0);

  double getTimeScale() const { return m_timeScale; }
  void setTimeScale(double scale) { m_timeScale = scale; }

  // Derived values
  Season getSeason() const;
  const char *getSeasonName() const { return seasonName(getSeason()); }
  TimeOfDay getTimeOfDay() const;
  const char *getTimeOfDayName() const { return timeOfDayName(getTimeOfDay()); }
  int getMonth() const { return (m_day - 1) / DAYS_PER_MONTH + 1; }
  int getDayOfMonth() const { return (m_day - 1) % DAYS_PER_MONTH + 1; }
  bool isDaytime() const {
    return m_hour >= DAYLIGHT_START_HOUR && m_hour < DAYLIGHT_END_HOUR;
  }
  bool isNighttime() const { return !isDaytime(); }
  bool isWorkingHours() const {
    return m_hour >= WORK_START_HOUR && m_hour < WORK_END_HOUR;
  }

  // "HH:MM"
  std::string formatTime() const;
  // "Year Y, Day D"
  std::string formatDate() const;
  // "Year Y, Season, Month M, Day d - HH:MM (period)"
  std::string formatDateTime() const;

  /**
   * @brief Serializes the calendar (not the callback table)
   *
   * Fields: current_year, current_day, current_hour, current_minute,
   * total_minutes, time_scale
   */
  JsonValue toJson() const;

  /**
   * @brief Restores calendar fields written by toJson()
   * @return false (state unchanged) if a field is missing or out of range
   */
  bool loadFromJson(const JsonValue &json);

private:
  struct ScheduledEntry {
    uint64_t id;
    std::string label;
    Callback callback;
  };

  void validateCalendar(int year, int day, int hour, int minute) const;
  void runCallbacks(std::vector<ScheduledEntry> &due, int64_t tick,
                    AdvanceResult &result);

  int m_year{1};
  int m_day{1};
  int m_hour{8};
  int m_minute{0};
  int64_t m_totalMinutes{0};
  double m_timeScale{1.0};

  MissedCallbackPolicy m_policy{MissedCallbackPolicy::ExactTickOnly};
  std::map<int64_t, std::vector<ScheduledEntry>> m_scheduled;
  uint64_t m_nextCallbackId{1};
};

} // namespace Realmforge

#endif // TIME_MANAGER_HPP
