#include "sync_schedule.hpp"
#include <fstream>
#include <fmt/format.h>

namespace {

bool validHour(const Json::Value& value) {
    return value.isInt() && value.asInt() >= 0 && value.asInt() <= 23;
}

} // namespace

bool isHourInWindow(int hour, int startHour, int endHour) {
    if (startHour > endHour) {
        return hour >= startHour || hour < endHour;
    }
    return hour >= startHour && hour < endHour;
}

SyncSchedule SyncSchedule::load(const std::string& scheduleFile) {
    std::ifstream file(scheduleFile);
    if (!file.is_open()) {
        return SyncSchedule{};
    }
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &json, &errors) || !json.isObject()) {
        return SyncSchedule{};
    }
    return fromJson(json);
}

SyncSchedule SyncSchedule::fromJson(const Json::Value& json) {
    SyncSchedule schedule;
    if (!json.isObject()) {
        return schedule;
    }
    // "24hr" and "night" are the names the touch UI writes
    std::string mode = json.get("mode", "windowed").asString();
    if (mode == "continuous" || mode == "24hr") {
        schedule.mode = SyncMode::Continuous;
    } else if (mode == "night") {
        schedule.mode = SyncMode::Windowed;
        return schedule;
    }
    if (validHour(json["start_hour"])) {
        schedule.startHour = json["start_hour"].asInt();
    }
    if (validHour(json["end_hour"])) {
        schedule.endHour = json["end_hour"].asInt();
    }
    return schedule;
}

Json::Value SyncSchedule::toJson() const {
    Json::Value json;
    json["mode"] = mode == SyncMode::Continuous ? "continuous" : "windowed";
    json["start_hour"] = startHour;
    json["end_hour"] = endHour;
    return json;
}

bool SyncSchedule::allows(int hour) const {
    return mode == SyncMode::Continuous || isHourInWindow(hour, startHour, endHour);
}

std::string SyncSchedule::describe() const {
    if (mode == SyncMode::Continuous) {
        return "continuous";
    }
    return fmt::format("windowed {:02d}:00-{:02d}:00", startHour, endHour);
}
