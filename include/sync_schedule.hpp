/**
 * @file sync_schedule.hpp
 * @brief Cloud sync schedule record (continuous or hour window).
 */

#ifndef SYNC_SCHEDULE_HPP
#define SYNC_SCHEDULE_HPP

#include <string>
#include <json/json.h>

enum class SyncMode {
    Continuous,
    Windowed
};

/**
 * @brief Returns whether an hour lies in the window [startHour, endHour).
 *
 * A window with startHour > endHour wraps past midnight (22..6 covers 22:00-05:59).
 * A window with startHour == endHour is empty.
 */
bool isHourInWindow(int hour, int startHour, int endHour);

/**
 * @brief The schedule record read by the cloud sync job: {mode, start_hour, end_hour}.
 *
 * Loading never fails: a missing file, unparseable content or missing fields fall
 * back to a windowed 22:00-06:00 schedule.
 */
struct SyncSchedule {
    SyncMode mode = SyncMode::Windowed;
    int startHour = 22;
    int endHour = 6;

    static SyncSchedule load(const std::string& scheduleFile);
    static SyncSchedule fromJson(const Json::Value& json);

    Json::Value toJson() const;

    /// Continuous schedules are always in window.
    bool allows(int hour) const;

    std::string describe() const;
};

#endif // SYNC_SCHEDULE_HPP
