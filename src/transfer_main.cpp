#include "activity_log.hpp"
#include "copy_tool.hpp"
#include "mount_strategy.hpp"
#include "notification.hpp"
#include "shutdown.hpp"
#include "transfer_job.hpp"
#include "vault_config.hpp"
#include <cstdlib>
#include <exception>
#include <fmt/format.h>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        fmt::print(stderr, "Usage: {} <device> [label]\n", argv[0]);
        return 1;
    }
    installShutdownHandlers();

    try {
        const char* configFile = std::getenv("USBVAULT_CONFIG");
        VaultConfig config(configFile ? configFile : VaultConfig::kDefaultConfigFile);
        ActivityLog log(config.transferLogFile(), config.errorLogFile(), config.verbose);
        NotificationDispatcher notifier = NotificationDispatcher::fromConfig(config, log);
        SystemMountStrategy mounts(config.automountRoots, config.storageRoot);
        RsyncCopyTool copyTool(config.copyTool, config.partialSuccessCodes);

        TransferJob job(config, TransferRequest{argv[1], argc > 2 ? argv[2] : ""}, mounts, copyTool, notifier, log,
                        shutdownRequested);
        TransferOutcome outcome = job.run();
        log.logMessage(fmt::format("Transfer finished: {} ({})", toString(outcome.status), outcome.message));
        return outcome.exitCode;
    } catch (const std::exception& e) {
        fmt::print(stderr, "usbvault-transfer: {}\n", e.what());
        return 1;
    }
}
