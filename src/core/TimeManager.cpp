/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/TimeManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <format>
#include <stdexcept>

namespace Realmforge {

const char *seasonName(Season season) {
  switch (season) {
  case Season::Spring:
    return "Spring";
  case Season::Summer:
    return "Summer";
  case Season::Fall:
    return "Fall";
  case Season::Winter:
    return "Winter";
  }
  return "Unknown";
}

const char *timeOfDayName(TimeOfDay period) {
  switch (period) {
  case TimeOfDay::Night:
    return "night";
  case TimeOfDay::Dawn:
    return "dawn";
  case TimeOfDay::Morning:
    return "morning";
  case TimeOfDay::Afternoon:
    return "afternoon";
  case TimeOfDay::Dusk:
    return "dusk";
  case TimeOfDay::Evening:
    return "evening";
  }
  return "unknown";
}

TimeManager::TimeManager(int startYear, int startDay, int startHour,
                         MissedCallbackPolicy policy)
    : m_policy(policy) {
  validateCalendar(startYear, startDay, startHour, 0);
  m_year = startYear;
  m_day = startDay;
  m_hour = startHour;
}

void TimeManager::validateCalendar(int year, int day, int hour,
                                   int minute) const {
  if (year < 1) {
    throw std::invalid_argument(std::format("Invalid year {}", year));
  }
  if (day < 1 || day > DAYS_PER_YEAR) {
    throw std::invalid_argument(std::format("Invalid day of year {}", day));
  }
  if (hour < 0 || hour >= HOURS_PER_DAY) {
    throw std::invalid_argument(std::format("Invalid hour {}", hour));
  }
  if (minute < 0 || minute >= MINUTES_PER_HOUR) {
    throw std::invalid_argument(std::format("Invalid minute {}", minute));
  }
}

void TimeManager::setTime(int year, int day, int hour, int minute) {
  validateCalendar(year, day, hour, minute);
  m_year = year;
  m_day = day;
  m_hour = hour;
  m_minute = minute;
}

TimeManager::AdvanceResult TimeManager::advanceMinutes(int64_t minutes) {
  if (minutes < 0) {
    throw std::invalid_argument(
        std::format("Cannot advance time by {} minutes", minutes));
  }

  AdvanceResult result;
  result.minutesAdvanced = minutes;

  m_totalMinutes += minutes;

  // Carry minute -> hour -> day -> year
  int64_t minuteTotal = m_minute + minutes;
  int64_t hourTotal = m_hour + minuteTotal / MINUTES_PER_HOUR;
  m_minute = static_cast<int>(minuteTotal % MINUTES_PER_HOUR);
  int64_t dayTotal = (m_day - 1) + hourTotal / HOURS_PER_DAY;
  m_hour = static_cast<int>(hourTotal % HOURS_PER_DAY);
  m_year += static_cast<int>(dayTotal / DAYS_PER_YEAR);
  m_day = static_cast<int>(dayTotal % DAYS_PER_YEAR) + 1;

  if (m_policy == MissedCallbackPolicy::ExactTickOnly) {
    auto it = m_scheduled.find(m_totalMinutes);
    if (it != m_scheduled.end()) {
      std::vector<ScheduledEntry> due = std::move(it->second);
      m_scheduled.erase(it);
      runCallbacks(due, m_totalMinutes, result);
    }
  } else {
    // Detach one tick at a time so callbacks scheduling into the past of the
    // new total are still picked up in order
    while (!m_scheduled.empty() &&
           m_scheduled.begin()->first <= m_totalMinutes) {
      auto it = m_scheduled.begin();
      const int64_t tick = it->first;
      std::vector<ScheduledEntry> due = std::move(it->second);
      m_scheduled.erase(it);
      runCallbacks(due, tick, result);
    }
  }

  return result;
}

void TimeManager::runCallbacks(std::vector<ScheduledEntry> &due, int64_t tick,
                               AdvanceResult &result) {
  for (auto &entry : due) {
    try {
      entry.callback();
      ++result.callbacksFired;
    } catch (const std::exception &e) {
      TIME_ERROR(std::format("Scheduled callback {} '{}' at tick {} failed: {}",
                             entry.id, entry.label, tick, e.what()));
      result.failures.push_back(
          CallbackFailure{entry.id, entry.label, tick, e.what()});
    }
  }
}

TimeManager::AdvanceResult TimeManager::advanceHours(int64_t hours) {
  return advanceMinutes(hours * MINUTES_PER_HOUR);
}

TimeManager::AdvanceResult TimeManager::advanceDays(int64_t days) {
  return advanceHours(days * HOURS_PER_DAY);
}

TimeManager::AdvanceResult TimeManager::advanceToTime(int hour, int minute) {
  if (hour < 0 || hour >= HOURS_PER_DAY || minute < 0 ||
      minute >= MINUTES_PER_HOUR) {
    throw std::invalid_argument(
        std::format("Invalid target time {:02d}:{:02d}", hour, minute));
  }

  const int target = hour * MINUTES_PER_HOUR + minute;
  const int current = m_hour * MINUTES_PER_HOUR + m_minute;
  const int minutesPerDay = HOURS_PER_DAY * MINUTES_PER_HOUR;

  const int delta =
      (target > current) ? target - current : minutesPerDay - current + target;
  return advanceMinutes(delta);
}

uint64_t TimeManager::scheduleIn(int64_t minutesFromNow, Callback callback,
                                 std::string label) {
  return scheduleAt(m_totalMinutes + minutesFromNow, std::move(callback),
                    std::move(label));
}

uint64_t TimeManager::scheduleAt(int64_t absoluteTick, Callback callback,
                                 std::string label) {
  const uint64_t id = m_nextCallbackId++;
  m_scheduled[absoluteTick].push_back(
      ScheduledEntry{id, std::move(label), std::move(callback)});
  if (absoluteTick <= m_totalMinutes) {
    TIME_DEBUG(std::format("Callback {} scheduled for tick {} which is not in "
                           "the future (now {})",
                           id, absoluteTick, m_totalMinutes));
  }
  return id;
}

bool TimeManager::cancelScheduled(uint64_t callbackId) {
  for (auto it = m_scheduled.begin(); it != m_scheduled.end(); ++it) {
    auto &entries = it->second;
    for (auto entry = entries.begin(); entry != entries.end(); ++entry) {
      if (entry->id == callbackId) {
        entries.erase(entry);
        if (entries.empty()) {
          m_scheduled.erase(it);
        }
        return true;
      }
    }
  }
  return false;
}

size_t TimeManager::getScheduledCount() const {
  size_t count = 0;
  for (const auto &[tick, entries] : m_scheduled) {
    count += entries.size();
  }
  return count;
}

Season TimeManager::getSeason() const {
  return static_cast<Season>(((m_day - 1) / DAYS_PER_SEASON) % 4);
}

TimeOfDay TimeManager::getTimeOfDay() const {
  if (m_hour < 6) {
    return TimeOfDay::Night;
  }
  if (m_hour < 8) {
    return TimeOfDay::Dawn;
  }
  if (m_hour < 12) {
    return TimeOfDay::Morning;
  }
  if (m_hour < 17) {
    return TimeOfDay::Afternoon;
  }
  if (m_hour < 19) {
    return TimeOfDay::Dusk;
  }
  return TimeOfDay::Evening;
}

std::string TimeManager::formatTime() const {
  return std::format("{:02d}:{:02d}", m_hour, m_minute);
}

std::string TimeManager::formatDate() const {
  return std::format("Year {}, Day {}", m_year, m_day);
}

std::string TimeManager::formatDateTime() const {
  return std::format("Year {}, {}, Month {}, Day {} - {} ({})", m_year,
                     getSeasonName(), getMonth(), getDayOfMonth(), formatTime(),
                     getTimeOfDayName());
}

JsonValue TimeManager::toJson() const {
  JsonObject obj;
  obj["current_year"] = JsonValue(m_year);
  obj["current_day"] = JsonValue(m_day);
  obj["current_hour"] = JsonValue(m_hour);
  obj["current_minute"] = JsonValue(m_minute);
  obj["total_minutes"] = JsonValue(m_totalMinutes);
  obj["time_scale"] = JsonValue(m_timeScale);
  return JsonValue(std::move(obj));
}

bool TimeManager::loadFromJson(const JsonValue &json) {
  const char *required[] = {"current_year", "current_day", "current_hour",
                            "current_minute", "total_minutes"};
  for (const char *key : required) {
    if (!json[key].tryAsInt64()) {
      TIME_ERROR(std::format("Time state is missing integral '{}'", key));
      return false;
    }
  }

  const auto year = json["current_year"].tryAsInt();
  const auto day = json["current_day"].tryAsInt();
  const auto hour = json["current_hour"].tryAsInt();
  const auto minute = json["current_minute"].tryAsInt();
  if (!year || !day || !hour || !minute) {
    TIME_ERROR("Time state has calendar fields out of range");
    return false;
  }
  try {
    validateCalendar(*year, *day, *hour, *minute);
  } catch (const std::invalid_argument &e) {
    TIME_ERROR(std::string("Time state rejected: ") + e.what());
    return false;
  }

  m_year = *year;
  m_day = *day;
  m_hour = *hour;
  m_minute = *minute;
  m_totalMinutes = *json["total_minutes"].tryAsInt64();
  m_timeScale = json["time_scale"].tryAsNumber().value_or(1.0);
  return true;
}

} // namespace Realmforge
