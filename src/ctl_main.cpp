#include "vault_api.hpp"
#include "vault_config.hpp"
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace {

void printUsage(const char* program) {
    fmt::print(stderr,
        "Usage: {} <command>\n"
        "  decide overwrite|skip             Answer the pending duplicate question\n"
        "  status                            Show the local transfer progress\n"
        "  sync-status                       Show the cloud sync status\n"
        "  schedule                          Show the sync schedule\n"
        "  schedule continuous               Sync around the clock\n"
        "  schedule windowed <start> <end>   Sync between two hours (0-23)\n"
        "  stop-sync                         Stop a running cloud sync\n",
        program);
}

std::optional<int> parseHour(const std::string& text) {
    try {
        std::size_t used = 0;
        int hour = std::stoi(text, &used);
        if (used == text.size() && hour >= 0 && hour <= 23) {
            return hour;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

int showTransfer(const VaultAPI& api) {
    auto record = api.transferProgress();
    if (!record) {
        fmt::print("No transfer status available ({})\n", record.error());
        return 1;
    }
    fmt::print("Status:   {}{}\n", toString(record->status), api.isStale(record->timestamp) ? " (stale)" : "");
    fmt::print("Progress: {}% ({}/{} files)\n", record->percent, record->filesDone, record->filesTotal);
    fmt::print("Speed:    {}  ETA: {}\n", record->speed, record->eta);
    if (record->existingFiles > 0) {
        fmt::print("Existing: {}\n", record->existingFiles);
    }
    for (const auto& [extension, count] : record->fileTypes) {
        fmt::print("  .{:<10} {}\n", extension, count);
    }
    fmt::print("Message:  {}\n", record->message);
    fmt::print("Updated:  {}\n", record->timestamp);
    return 0;
}

int showSync(const VaultAPI& api) {
    auto record = api.syncStatus();
    if (!record) {
        fmt::print("No sync status available ({})\n", record.error());
        return 1;
    }
    fmt::print("Status:   {}{}{}\n", toString(record->status), record->active ? " (active)" : "",
               record->reason.empty() ? "" : fmt::format(" [{}]", record->reason));
    fmt::print("Progress: {}% ({} synced, {} remaining)\n", record->percent, record->filesSynced, record->filesRemaining);
    fmt::print("Speed:    {}\n", record->speed);
    fmt::print("Folder:   {}\n", record->folder);
    if (record->totalFiles) {
        fmt::print("Total:    {} files ({})\n", *record->totalFiles, record->totalSize.value_or("--"));
    }
    fmt::print("Last run: {}\n", record->lastSync);
    fmt::print("Message:  {}\n", record->message);
    return 0;
}

int changeSchedule(const VaultAPI& api, const std::vector<std::string>& args) {
    if (args.empty()) {
        fmt::print("{}\n", api.schedule().describe());
        return 0;
    }

    SyncSchedule schedule;
    if (args[0] == "continuous" && args.size() == 1) {
        schedule.mode = SyncMode::Continuous;
    } else if (args[0] == "windowed" && args.size() == 3) {
        auto start = parseHour(args[1]);
        auto end = parseHour(args[2]);
        if (!start || !end) {
            fmt::print(stderr, "Hours must be integers between 0 and 23\n");
            return 1;
        }
        schedule.mode = SyncMode::Windowed;
        schedule.startHour = *start;
        schedule.endHour = *end;
    } else {
        fmt::print(stderr, "Usage: schedule continuous | schedule windowed <start> <end>\n");
        return 1;
    }

    auto stopped = api.updateSchedule(schedule);
    if (!stopped) {
        fmt::print(stderr, "{}\n", stopped.error());
        return 1;
    }
    fmt::print("Schedule set to {}\n", schedule.describe());
    if (*stopped) {
        fmt::print("Running sync stopped (outside the new window)\n");
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }
    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        const char* configFile = std::getenv("USBVAULT_CONFIG");
        VaultAPI api(VaultConfig(configFile ? configFile : VaultConfig::kDefaultConfigFile));

        if (command == "decide" && args.size() == 1) {
            auto decision = decisionFromString(args[0]);
            if (!decision) {
                fmt::print(stderr, "Decision must be \"overwrite\" or \"skip\"\n");
                return 1;
            }
            auto posted = api.postDecision(*decision);
            if (!posted) {
                fmt::print(stderr, "{}\n", posted.error());
                return 1;
            }
            fmt::print("Decision posted: {}\n", toString(*decision));
            return 0;
        }
        if (command == "status") {
            return showTransfer(api);
        }
        if (command == "sync-status") {
            return showSync(api);
        }
        if (command == "schedule") {
            return changeSchedule(api, args);
        }
        if (command == "stop-sync") {
            auto stopped = api.stopRunningSync();
            if (!stopped) {
                fmt::print(stderr, "{}\n", stopped.error());
                return 1;
            }
            fmt::print("{}\n", *stopped ? "Sync stop requested" : "No sync is running");
            return 0;
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "usbvault-ctl: {}\n", e.what());
        return 1;
    }

    printUsage(argv[0]);
    return 1;
}
