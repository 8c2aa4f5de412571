#include "progress_store.hpp"
#include "text_format.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

struct StatusNames {
    TransferStatus status;
    const char* value;
    const char* marker;
};

constexpr StatusNames kStatusNames[] = {
    {TransferStatus::Detecting, "detecting", "DETECTING"},
    {TransferStatus::Mounting, "mounting", "MOUNTING"},
    {TransferStatus::Scanning, "scanning", "SCANNING"},
    {TransferStatus::Checking, "checking", "CHECKING"},
    {TransferStatus::PendingDecision, "pending", "PENDING_DECISION"},
    {TransferStatus::Transferring, "transferring", "TRANSFERRING"},
    {TransferStatus::Complete, "complete", "COMPLETE"},
    {TransferStatus::AllDuplicates, "all_duplicates", "ALL_DUPLICATES"},
    {TransferStatus::Failed, "failed", "FAILED"},
};

int clampPercent(int percent) {
    return std::clamp(percent, 0, 100);
}

std::string stringField(const Json::Value& json, const char* key, const std::string& fallback) {
    const Json::Value& value = json[key];
    return value.isString() ? value.asString() : fallback;
}

std::uint64_t countField(const Json::Value& json, const char* key) {
    const Json::Value& value = json[key];
    if (value.isUInt64()) {
        return value.asUInt64();
    }
    if (value.isNumeric() && value.asDouble() > 0) {
        return static_cast<std::uint64_t>(value.asDouble());
    }
    return 0;
}

std::string serialize(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    return Json::writeString(builder, value) + "\n";
}

} // namespace

std::string toString(TransferStatus status) {
    for (const auto& names : kStatusNames) {
        if (names.status == status) return names.value;
    }
    return "unknown";
}

std::string statusMarker(TransferStatus status) {
    for (const auto& names : kStatusNames) {
        if (names.status == status) return names.marker;
    }
    return "UNKNOWN";
}

std::optional<TransferStatus> transferStatusFromString(const std::string& text) {
    for (const auto& names : kStatusNames) {
        if (text == names.value || text == names.marker) return names.status;
    }
    return std::nullopt;
}

bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Complete || status == TransferStatus::AllDuplicates ||
           status == TransferStatus::Failed;
}

std::string toString(SyncState state) {
    switch (state) {
        case SyncState::Skipped: return "skipped";
        case SyncState::Active: return "active";
        case SyncState::Complete: return "complete";
        case SyncState::Failed: return "failed";
    }
    return "unknown";
}

std::optional<SyncState> syncStateFromString(const std::string& text) {
    for (auto state : {SyncState::Skipped, SyncState::Active, SyncState::Complete, SyncState::Failed}) {
        if (toString(state) == text) return state;
    }
    return std::nullopt;
}

Json::Value ProgressRecord::toJson() const {
    Json::Value json;
    json["percent"] = clampPercent(percent);
    json["files_done"] = static_cast<Json::UInt64>(filesDone);
    json["files_total"] = static_cast<Json::UInt64>(filesTotal);
    json["speed"] = speed;
    json["eta"] = eta;
    Json::Value types(Json::objectValue);
    for (const auto& [extension, count] : fileTypes) {
        types[extension] = static_cast<Json::UInt64>(count);
    }
    json["file_types"] = types;
    json["status"] = toString(status);
    json["existing_files"] = static_cast<Json::UInt64>(existingFiles);
    json["message"] = message;
    json["current_file"] = currentFile;
    json["timestamp"] = timestamp;
    return json;
}

std::expected<ProgressRecord, std::string> ProgressRecord::fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        return std::unexpected("Progress record is not a JSON object");
    }
    auto status = transferStatusFromString(stringField(json, "status", ""));
    if (!status) {
        return std::unexpected(fmt::format("Unknown transfer status \"{}\"", stringField(json, "status", "")));
    }
    ProgressRecord record;
    record.status = *status;
    record.percent = json["percent"].isNumeric() ? clampPercent(json["percent"].asInt()) : 0;
    record.filesDone = countField(json, "files_done");
    record.filesTotal = countField(json, "files_total");
    record.speed = stringField(json, "speed", kUnknownField);
    record.eta = stringField(json, "eta", kUnknownField);
    record.existingFiles = countField(json, "existing_files");
    record.message = stringField(json, "message", "");
    record.currentFile = stringField(json, "current_file", "");
    record.timestamp = stringField(json, "timestamp", "");

    const Json::Value& types = json["file_types"];
    if (types.isObject()) {
        for (const auto& extension : types.getMemberNames()) {
            record.fileTypes.emplace_back(extension, countField(types, extension.c_str()));
        }
        std::stable_sort(record.fileTypes.begin(), record.fileTypes.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
    }
    return record;
}

Json::Value SyncStatusRecord::toJson() const {
    Json::Value json;
    json["active"] = active;
    json["status"] = toString(status);
    json["reason"] = reason;
    json["percent"] = clampPercent(percent);
    json["files_synced"] = static_cast<Json::UInt64>(filesSynced);
    json["files_remaining"] = static_cast<Json::UInt64>(filesRemaining);
    json["speed"] = speed;
    json["folder"] = folder;
    json["last_sync"] = lastSync;
    json["message"] = message;
    if (totalFiles) {
        json["total_files"] = static_cast<Json::UInt64>(*totalFiles);
    }
    if (totalSize) {
        json["total_size"] = *totalSize;
    }
    json["timestamp"] = timestamp;
    return json;
}

std::expected<SyncStatusRecord, std::string> SyncStatusRecord::fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        return std::unexpected("Sync status record is not a JSON object");
    }
    SyncStatusRecord record;
    record.active = json["active"].isBool() && json["active"].asBool();
    auto state = syncStateFromString(stringField(json, "status", ""));
    record.status = state.value_or(record.active ? SyncState::Active : SyncState::Skipped);
    record.reason = stringField(json, "reason", "");
    record.percent = json["percent"].isNumeric() ? clampPercent(json["percent"].asInt()) : 0;
    record.filesSynced = countField(json, "files_synced");
    record.filesRemaining = countField(json, "files_remaining");
    record.speed = stringField(json, "speed", kUnknownField);
    record.folder = stringField(json, "folder", "");
    record.lastSync = stringField(json, "last_sync", "");
    record.message = stringField(json, "message", "");
    if (json.isMember("total_files")) {
        record.totalFiles = countField(json, "total_files");
    }
    if (json["total_size"].isString()) {
        record.totalSize = json["total_size"].asString();
    }
    record.timestamp = stringField(json, "timestamp", "");
    return record;
}

std::expected<void, std::string> writeTextAtomically(const std::string& path, const std::string& text) {
    fs::path target(path);
    std::error_code ec;
    if (!target.parent_path().empty()) {
        fs::create_directories(target.parent_path(), ec);
    }
    fs::path temp = target;
    temp += fmt::format(".tmp.{}", static_cast<long>(::getpid()));
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(fmt::format("Failed to open {} for writing", temp.string()));
        }
        out << text;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            return std::unexpected(fmt::format("Failed to write {}", temp.string()));
        }
    }
    fs::permissions(temp, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace, ec);
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return std::unexpected(fmt::format("Failed to publish {}: {}", path, ec.message()));
    }
    return {};
}

std::expected<void, std::string> writeJsonAtomically(const std::string& path, const Json::Value& value) {
    return writeTextAtomically(path, serialize(value));
}

std::expected<Json::Value, std::string> readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(fmt::format("Cannot open {}", path));
    }
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &json, &errors)) {
        return std::unexpected(fmt::format("Cannot parse {}: {}", path, errors));
    }
    return json;
}

bool isStale(const std::string& timestamp, std::chrono::system_clock::time_point now, std::chrono::milliseconds maxAge) {
    auto published = parseIsoTimestamp(timestamp);
    if (!published) {
        return true;
    }
    return now - *published > maxAge;
}

ProgressStore::ProgressStore(std::string progressFile, std::string statusFile)
    : progressFile(std::move(progressFile)), statusFile(std::move(statusFile)) {}

std::expected<void, std::string> ProgressStore::publish(ProgressRecord record) {
    record.percent = clampPercent(record.percent);
    if (!isTerminal(record.status) && lastPublished && !isTerminal(lastPublished->status)) {
        record.percent = std::max(record.percent, lastPublished->percent);
    }
    record.timestamp = isoTimestamp(std::chrono::system_clock::now());

    auto markerResult = writeTextAtomically(statusFile, statusMarker(record.status) + "\n");
    auto recordResult = writeJsonAtomically(progressFile, record.toJson());
    if (!recordResult) {
        return recordResult;
    }
    lastPublished = std::move(record);
    return markerResult;
}

std::expected<ProgressRecord, std::string> ProgressStore::read() const {
    auto json = readJsonFile(progressFile);
    if (!json) {
        return std::unexpected(json.error());
    }
    return ProgressRecord::fromJson(*json);
}

SyncStatusStore::SyncStatusStore(std::string statusFile) : statusFile(std::move(statusFile)) {}

std::expected<void, std::string> SyncStatusStore::publish(SyncStatusRecord record) {
    record.percent = clampPercent(record.percent);
    if (record.status == SyncState::Active && lastPublished && lastPublished->status == SyncState::Active) {
        record.percent = std::max(record.percent, lastPublished->percent);
    }
    record.timestamp = isoTimestamp(std::chrono::system_clock::now());
    auto result = writeJsonAtomically(statusFile, record.toJson());
    if (result) {
        lastPublished = std::move(record);
    }
    return result;
}

std::expected<SyncStatusRecord, std::string> SyncStatusStore::read() const {
    auto json = readJsonFile(statusFile);
    if (!json) {
        return std::unexpected(json.error());
    }
    return SyncStatusRecord::fromJson(*json);
}
