/**
 * @file activity_log.hpp
 * @brief Timestamped activity and error logging for the UsbVault jobs.
 *
 * Each job process writes to its own activity log (transfer.log, gdrive-backup.log)
 * and all jobs share one error log. Entries are echoed to the console so they are
 * captured by the journal when the jobs run under systemd.
 */

#ifndef ACTIVITY_LOG_HPP
#define ACTIVITY_LOG_HPP

#include <mutex>
#include <string>

/**
 * @brief Append-only log with the "[YYYY-mm-dd HH:MM:SS] message" entry format.
 *
 * Thread-safe: the cloud sync poller and the sync main task log concurrently.
 */
class ActivityLog {
public:
    /**
     * @brief Constructs a log writing to the given files.
     *
     * Creates the parent directories of both files if they do not exist.
     *
     * @param logFile Path of the activity log.
     * @param errorLogFile Path of the shared error log.
     * @param verbose If true, logDebug() entries are written as well.
     * @param consoleEcho If true, entries are also printed to stdout/stderr.
     */
    ActivityLog(std::string logFile, std::string errorLogFile, bool verbose = false, bool consoleEcho = true);

    /**
     * @brief Logs an informational message.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to the activity log and the error log.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Logs a "[DEBUG]" message when verbose logging is enabled.
     *
     * @param message Message to log.
     */
    void logDebug(const std::string& message) const;

    /**
     * @brief Appends a line of external tool output verbatim, without a timestamp.
     *
     * @param line Output line from the copy or sync tool.
     */
    void appendRaw(const std::string& line) const;

    const std::string& path() const { return logFile; }

private:
    void append(const std::string& file, const std::string& entry) const;
    std::string stamp(const std::string& message) const;

    std::string logFile;        ///< Activity log path.
    std::string errorLogFile;   ///< Error log path.
    bool verbose;               ///< Whether debug entries are written.
    bool consoleEcho;           ///< Whether entries are echoed to the console.
    mutable std::mutex mutex;   ///< Serialises writers from different threads.
};

#endif // ACTIVITY_LOG_HPP
