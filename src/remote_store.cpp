#include "remote_store.hpp"
#include "subprocess.hpp"
#include <filesystem>
#include <memory>
#include <json/json.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::expected<RemoteSize, std::string> parseRemoteSize(const std::string& output) {
    auto start = output.find('{');
    auto end = output.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        return std::unexpected("No JSON object in size output");
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value json;
    std::string errors;
    const char* begin = output.data() + start;
    if (!reader->parse(begin, output.data() + end + 1, &json, &errors)) {
        return std::unexpected(fmt::format("Cannot parse size output: {}", errors));
    }

    RemoteSize size;
    if (json["count"].isNumeric()) {
        size.count = json["count"].asUInt64();
    }
    if (json["bytes"].isNumeric()) {
        size.bytes = json["bytes"].asUInt64();
    }
    return size;
}

RcloneRemoteStore::RcloneRemoteStore(const VaultConfig& config)
    : executable(config.syncTool), configFile(config.rcloneConfig), remoteName(config.remoteName),
      bandwidthLimit(config.bandwidthLimit), transfers(config.syncTransfers), checkers(config.syncCheckers),
      excludes(config.syncExcludes) {}

bool RcloneRemoteStore::hasCredentials() {
    std::error_code ec;
    return fs::is_regular_file(configFile, ec);
}

std::expected<void, std::string> RcloneRemoteStore::probe() {
    auto result = runCommand({executable, "about", remoteName + ":", "--config", configFile});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        return std::unexpected(fmt::format("{} about exited with code {}", executable, result->exitCode));
    }
    return {};
}

std::expected<RemoteSize, std::string> RcloneRemoteStore::size(const std::string& remotePath) {
    auto result = runCommand({executable, "size", remotePath, "--config", configFile, "--json"});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        return std::unexpected(fmt::format("{} size exited with code {}", executable, result->exitCode));
    }
    return parseRemoteSize(result->output);
}

std::vector<std::string> RcloneRemoteStore::syncCommand(const std::string& localRoot, const std::string& remotePath) const {
    std::vector<std::string> argv = {
        executable, "sync", localRoot, remotePath,
        "--config", configFile,
        "--bwlimit", bandwidthLimit,
        "--transfers", std::to_string(transfers),
        "--checkers", std::to_string(checkers),
    };
    for (const auto& pattern : excludes) {
        argv.emplace_back("--exclude");
        argv.push_back(pattern);
    }
    argv.insert(argv.end(), {"-v", "--stats-one-line", "--stats", "5s"});
    return argv;
}

std::string RcloneRemoteStore::remotePath(const std::string& folder) const {
    return remoteName + ":" + folder;
}
