/**
 * @file progress_parser.hpp
 * @brief Turns the line output of the copy and sync tools into progress updates.
 *
 * A grammar describes how a tool prints its meter: a percent token, a throughput
 * token, a remaining-time token, and the banner lines that must not be taken for
 * file names. Lines that are neither meter nor banner are remembered as the item
 * the tool is currently working on.
 */

#ifndef PROGRESS_PARSER_HPP
#define PROGRESS_PARSER_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

/**
 * @brief Output grammar of one external tool.
 */
struct ParserGrammar {
    std::regex percentPattern;                ///< First capture group is the integer percent.
    std::regex speedPattern;                  ///< Whole match (or group 1) is the throughput.
    std::regex etaPattern;                    ///< Whole match (or group 1) is the remaining time.
    std::vector<std::string> bannerPrefixes;  ///< Lines starting with these are never file names.

    /// rsync with --info=progress2.
    static ParserGrammar rsync();
    /// rclone with --stats-one-line.
    static ParserGrammar rclone();
};

/**
 * @brief One rate-limited progress emission.
 */
struct ProgressUpdate {
    int percent = 0;
    std::size_t filesDone = 0;
    std::size_t filesTotal = 0;
    std::string speed;
    std::string eta;
    std::string currentFile;
};

/**
 * @brief Stateful line parser with a minimum interval between emissions.
 *
 * Emitted percentages never decrease: a meter that jumps back (rsync restarts its
 * estimate when the file list grows) keeps reporting the highest value seen.
 */
class ProgressParser {
public:
    /**
     * @param grammar Tool output grammar.
     * @param filesTotal File count used to estimate files_done from the percent.
     * @param minInterval Minimum time between two emissions; the first is never held back.
     */
    ProgressParser(ParserGrammar grammar, std::size_t filesTotal,
                   std::chrono::milliseconds minInterval = std::chrono::milliseconds(1000));

    /**
     * @brief Consumes one output line.
     *
     * @param line Line without its terminator.
     * @param now Current time, used by the rate limiter.
     * @return An update when the line carried a percent and the interval has elapsed.
     */
    std::optional<ProgressUpdate> feed(const std::string& line, std::chrono::steady_clock::time_point now);

    std::optional<ProgressUpdate> feed(const std::string& line);

private:
    bool isBanner(const std::string& line) const;

    ParserGrammar grammar;
    std::size_t filesTotal;
    std::chrono::milliseconds minInterval;
    std::optional<std::chrono::steady_clock::time_point> lastEmitTime;
    std::string lastKnownFilename;
    int highest = 0;
};

#endif // PROGRESS_PARSER_HPP
