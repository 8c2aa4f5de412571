#include "activity_log.hpp"
#include "mount_strategy.hpp"
#include "remote_store.hpp"
#include "shutdown.hpp"
#include "sync_job.hpp"
#include "vault_config.hpp"
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fmt/format.h>

int main(int argc, char* argv[]) {
    SyncOptions options;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--force") == 0) {
            options.force = true;
        } else {
            fmt::print(stderr, "Usage: {} [--force]\n", argv[0]);
            return 1;
        }
    }
    installShutdownHandlers();

    try {
        const char* configFile = std::getenv("USBVAULT_CONFIG");
        VaultConfig config(configFile ? configFile : VaultConfig::kDefaultConfigFile);
        ActivityLog log(config.syncLogFile(), config.errorLogFile(), config.verbose);
        RcloneRemoteStore remote(config);
        SystemMountStrategy mounts(config.automountRoots, config.storageRoot);

        SyncJob job(config, remote, mounts, log, shutdownRequested);
        SyncOutcome outcome = job.run(options);
        if (outcome.status == SyncState::Skipped) {
            log.logDebug(fmt::format("Sync skipped: {}", outcome.reason));
        }
        return outcome.exitCode;
    } catch (const std::exception& e) {
        fmt::print(stderr, "usbvault-sync: {}\n", e.what());
        return 1;
    }
}
