/**
 * @file progress_store.hpp
 * @brief Published progress snapshots of the transfer and sync jobs.
 *
 * Each job owns one store and is its only writer. Records are serialised with
 * jsoncpp to a temporary file in the same directory and renamed over the
 * published file, so readers never see a partially written record. Readers still
 * treat unreadable or stale records as "no new information".
 */

#ifndef PROGRESS_STORE_HPP
#define PROGRESS_STORE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>

/// Placeholder for progress fields the tool output did not provide.
inline constexpr const char* kUnknownField = "--";

/**
 * @brief Lifecycle state of a local transfer job.
 */
enum class TransferStatus {
    Detecting,
    Mounting,
    Scanning,
    Checking,
    PendingDecision,
    Transferring,
    Complete,
    AllDuplicates,
    Failed
};

/// Status value used in the JSON record ("pending", "all_duplicates", ...).
std::string toString(TransferStatus status);

/// Upper-case word used in the plain-text status marker ("PENDING_DECISION", ...).
std::string statusMarker(TransferStatus status);

std::optional<TransferStatus> transferStatusFromString(const std::string& text);

/// Complete, AllDuplicates and Failed.
bool isTerminal(TransferStatus status);

/**
 * @brief Extension histogram ranked by count, most frequent first.
 */
using FileTypeHistogram = std::vector<std::pair<std::string, std::size_t>>;

/**
 * @brief Snapshot of a local transfer job, overwritten wholesale on each update.
 */
struct ProgressRecord {
    int percent = 0;                           ///< 0-100.
    std::size_t filesDone = 0;                 ///< Files copied so far (estimated from percent).
    std::size_t filesTotal = 0;                ///< Files in this run.
    std::string speed = kUnknownField;         ///< Throughput as printed by the copy tool.
    std::string eta = kUnknownField;           ///< Remaining time as printed by the copy tool.
    FileTypeHistogram fileTypes;               ///< Top extensions of the source.
    TransferStatus status = TransferStatus::Detecting;
    std::size_t existingFiles = 0;             ///< Duplicates found on the backup disk.
    std::string message;                       ///< Human-readable status line.
    std::string currentFile;                   ///< Item the copy tool is working on.
    std::string timestamp;                     ///< ISO-8601 time of publication.

    Json::Value toJson() const;
    static std::expected<ProgressRecord, std::string> fromJson(const Json::Value& json);
};

/**
 * @brief Outcome category of one cloud sync invocation.
 */
enum class SyncState {
    Skipped,
    Active,
    Complete,
    Failed
};

std::string toString(SyncState state);
std::optional<SyncState> syncStateFromString(const std::string& text);

/**
 * @brief Snapshot of a cloud sync job.
 */
struct SyncStatusRecord {
    bool active = false;
    SyncState status = SyncState::Skipped;
    std::string reason;                        ///< Skip or failure reason code.
    int percent = 0;
    std::uint64_t filesSynced = 0;
    std::uint64_t filesRemaining = 0;
    std::string speed = kUnknownField;
    std::string folder;                        ///< Remote folder being synced.
    std::string lastSync;                      ///< "YYYY-mm-dd HH:MM" of the attempt.
    std::string message;
    std::optional<std::uint64_t> totalFiles;   ///< Remote totals, set on completion.
    std::optional<std::string> totalSize;
    std::string timestamp;

    Json::Value toJson() const;
    static std::expected<SyncStatusRecord, std::string> fromJson(const Json::Value& json);
};

/**
 * @brief Writes a JSON document to a temporary sibling file and renames it over path.
 *
 * @param path Published file path.
 * @param value Document to write.
 * @return std::expected<void, std::string> Success or an error message.
 */
std::expected<void, std::string> writeJsonAtomically(const std::string& path, const Json::Value& value);

/**
 * @brief Writes text to a temporary sibling file and renames it over path.
 */
std::expected<void, std::string> writeTextAtomically(const std::string& path, const std::string& text);

/**
 * @brief Reads and parses a JSON document.
 *
 * @return std::expected<Json::Value, std::string> The document or an error message.
 */
std::expected<Json::Value, std::string> readJsonFile(const std::string& path);

/**
 * @brief Whether a record timestamp is missing, unparseable or older than maxAge.
 */
bool isStale(const std::string& timestamp, std::chrono::system_clock::time_point now, std::chrono::milliseconds maxAge);

/**
 * @brief Transfer progress store: the JSON record plus the plain-text status marker.
 *
 * While the job is running, published percentages never decrease; terminal
 * records are written as given.
 */
class ProgressStore {
public:
    ProgressStore(std::string progressFile, std::string statusFile);

    /**
     * @brief Stamps and publishes a record.
     *
     * @param record Record to publish; its timestamp is overwritten.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> publish(ProgressRecord record);

    /**
     * @brief Reads the currently published record.
     */
    std::expected<ProgressRecord, std::string> read() const;

private:
    std::string progressFile;
    std::string statusFile;
    std::optional<ProgressRecord> lastPublished;
};

/**
 * @brief Cloud sync status store with the same monotonic-percent rule.
 */
class SyncStatusStore {
public:
    explicit SyncStatusStore(std::string statusFile);

    std::expected<void, std::string> publish(SyncStatusRecord record);
    std::expected<SyncStatusRecord, std::string> read() const;

    const std::optional<SyncStatusRecord>& last() const { return lastPublished; }

private:
    std::string statusFile;
    std::optional<SyncStatusRecord> lastPublished;
};

#endif // PROGRESS_STORE_HPP
