/**
 * @file text_format.hpp
 * @brief Time stamp and size formatting helpers used in logs and status records.
 */

#ifndef TEXT_FORMAT_HPP
#define TEXT_FORMAT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Formats a time point in local time with a strftime pattern.
 *
 * @param timePoint Time to format.
 * @param pattern strftime pattern (e.g. "%Y%m%d_%H%M%S").
 * @return std::string The formatted text, empty if the pattern produced nothing.
 */
std::string formatLocalTime(std::chrono::system_clock::time_point timePoint, const char* pattern);

/**
 * @brief Formats a time point as ISO-8601 local time with offset ("2025-03-01T22:15:03+01:00").
 */
std::string isoTimestamp(std::chrono::system_clock::time_point timePoint);

/**
 * @brief Parses a timestamp produced by isoTimestamp().
 *
 * Accepts a "Z" suffix, "+hh:mm", "+hhmm" or no offset (treated as UTC).
 *
 * @return The time point, or std::nullopt for text that is not a timestamp.
 */
std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const std::string& text);

/**
 * @brief Formats a byte count with IEC units ("512B", "3.4KiB", "17GiB").
 */
std::string formatBytesIec(std::uint64_t bytes);

/// Cuts text to maxLength characters and appends "..." when it was longer.
std::string truncateForDisplay(const std::string& text, std::size_t maxLength);

/// Strips leading and trailing whitespace.
std::string trim(const std::string& text);

#endif // TEXT_FORMAT_HPP
