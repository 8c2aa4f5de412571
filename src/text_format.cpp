#include "text_format.hpp"
#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fmt/format.h>

std::string formatLocalTime(std::chrono::system_clock::time_point timePoint, const char* pattern) {
    auto timeT = std::chrono::system_clock::to_time_t(timePoint);
    std::tm localTm {};
    localtime_r(&timeT, &localTm);
    char timeBuf[64];
    std::size_t length = std::strftime(timeBuf, sizeof(timeBuf), pattern, &localTm);
    return std::string(timeBuf, length);
}

std::string isoTimestamp(std::chrono::system_clock::time_point timePoint) {
    // strftime gives "+0100"; ISO-8601 extended format wants "+01:00"
    std::string stamp = formatLocalTime(timePoint, "%Y-%m-%dT%H:%M:%S%z");
    if (stamp.size() >= 5) {
        stamp.insert(stamp.size() - 2, ":");
    }
    return stamp;
}

std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const std::string& text) {
    std::tm parsed {};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &parsed.tm_year, &parsed.tm_mon, &parsed.tm_mday,
                    &parsed.tm_hour, &parsed.tm_min, &parsed.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    parsed.tm_year -= 1900;
    parsed.tm_mon -= 1;

    long offsetSeconds = 0;
    std::string rest = text.substr(static_cast<std::size_t>(consumed));
    if (!rest.empty() && rest != "Z") {
        char sign = rest[0];
        if (sign != '+' && sign != '-') {
            return std::nullopt;
        }
        std::string digits;
        for (std::size_t i = 1; i < rest.size(); ++i) {
            if (rest[i] == ':') continue;
            if (!std::isdigit(static_cast<unsigned char>(rest[i]))) {
                return std::nullopt;
            }
            digits.push_back(rest[i]);
        }
        if (digits.size() != 4) {
            return std::nullopt;
        }
        offsetSeconds = std::stol(digits.substr(0, 2)) * 3600 + std::stol(digits.substr(2, 2)) * 60;
        if (sign == '-') {
            offsetSeconds = -offsetSeconds;
        }
    }

    std::time_t utc = timegm(&parsed);
    if (utc == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(utc - offsetSeconds);
}

std::string formatBytesIec(std::uint64_t bytes) {
    static constexpr std::array<const char*, 6> units = {"Ki", "Mi", "Gi", "Ti", "Pi", "Ei"};
    if (bytes < 1024) {
        return fmt::format("{}B", bytes);
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    value /= 1024.0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    if (value < 10.0) {
        return fmt::format("{:.1f}{}B", value, units[unit]);
    }
    return fmt::format("{:.0f}{}B", value, units[unit]);
}

std::string truncateForDisplay(const std::string& text, std::size_t maxLength) {
    if (text.size() <= maxLength) {
        return text;
    }
    return text.substr(0, maxLength) + "...";
}

std::string trim(const std::string& text) {
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && isSpace(text[begin])) ++begin;
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}
