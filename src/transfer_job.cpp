#include "transfer_job.hpp"
#include "process_lock.hpp"
#include "shutdown.hpp"
#include "subprocess.hpp"
#include "text_format.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultLabel = "USB_DRIVE";

bool hasEntries(const std::string& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    return !ec && it != fs::directory_iterator();
}

} // namespace

TransferJob::TransferJob(const VaultConfig& config, TransferRequest request, MountStrategy& mounts, CopyTool& copyTool,
                         NotificationDispatcher& notifier, const ActivityLog& log,
                         std::function<bool()> interrupted)
    : config(config), mounts(mounts), copyTool(copyTool), notifier(notifier), log(log),
      interrupted(std::move(interrupted)),
      store(config.progressFile, config.statusFile),
      decisionChannel(config.decisionRequestFile, config.decisionFile, config.decisionTimeout, config.decisionPollInterval),
      devicePath(normalizeDevice(request.device)), volumeLabel(sanitizeLabel(request.label)) {}

std::string TransferJob::normalizeDevice(const std::string& device) {
    std::string value = trim(device);
    if (value.empty() || value.front() == '/') {
        return value;
    }
    return "/dev/" + value;
}

std::string TransferJob::sanitizeLabel(const std::string& label) {
    std::string value = trim(label);
    if (value.empty()) {
        return kDefaultLabel;
    }
    std::replace(value.begin(), value.end(), '/', '_');
    return value;
}

bool TransferJob::sleepFor(std::chrono::milliseconds duration) const {
    return interruptibleSleep(duration, interrupted);
}

ProgressRecord TransferJob::record(TransferStatus status, std::string message) const {
    ProgressRecord progress;
    progress.status = status;
    progress.message = std::move(message);
    progress.filesTotal = inventory.fileCount;
    progress.fileTypes = inventory.fileTypes;
    progress.existingFiles = duplicates.existingCount;
    return progress;
}

void TransferJob::publish(ProgressRecord progress) {
    if (statusHistory.empty() || statusHistory.back() != progress.status) {
        statusHistory.push_back(progress.status);
        log.logDebug(fmt::format("Status -> {}", statusMarker(progress.status)));
    }
    auto result = store.publish(std::move(progress));
    if (!result) {
        log.logError(fmt::format("Failed to publish progress: {}", result.error()));
    }
}

TransferOutcome TransferJob::fail(std::string message) {
    log.logError(message);
    ProgressRecord progress = record(TransferStatus::Failed, message);
    progress.percent = 0;
    publish(std::move(progress));
    earlyExit = TransferOutcome{TransferStatus::Failed, 1, std::move(message)};
    return *earlyExit;
}

TransferOutcome TransferJob::run() {
    log.logMessage("==========================================");
    log.logMessage(fmt::format("USB DETECTED: {} (Label: {})", devicePath, volumeLabel));

    auto lock = ProcessLock::acquire(config.transferLockFile);
    if (!lock) {
        if (lock.error().heldByOther()) {
            std::string message = fmt::format("Transfer already in progress (PID {}). Exiting.",
                                              static_cast<long>(*lock.error().owner));
            log.logMessage(message);
            return TransferOutcome{TransferStatus::Failed, kExitLockContention, message};
        }
        std::string message = fmt::format("Cannot acquire transfer lock: {}", lock.error().message);
        log.logError(message);
        return TransferOutcome{TransferStatus::Failed, 1, message};
    }

    TransferOutcome outcome = runLocked();

    decisionChannel.clear();
    std::error_code ec;
    fs::remove(config.fileListFile, ec);
    log.logMessage("==========================================");
    return outcome;
}

TransferOutcome TransferJob::runLocked() {
    publish(record(TransferStatus::Detecting, "USB drive detected, initializing..."));

    if (devicePath.empty()) {
        return fail("No device given");
    }
    if (!mountSource()) {
        return *earlyExit;
    }
    if (!scanSource()) {
        return *earlyExit;
    }

    if (inventory.fileCount > 0 && duplicates.existingCount == inventory.fileCount) {
        std::string message = fmt::format("All {} files already backed up", inventory.fileCount);
        log.logMessage(fmt::format("All {} files already exist on HDD - nothing to transfer", inventory.fileCount));
        ProgressRecord progress = record(TransferStatus::AllDuplicates, message);
        progress.percent = 100;
        progress.filesDone = inventory.fileCount;
        publish(std::move(progress));
        notifier.notify({"Already Backed Up",
                         fmt::format("All {} files from {} already exist on HDD", inventory.fileCount, volumeLabel),
                         NotificationCategory::Complete});
        return TransferOutcome{TransferStatus::AllDuplicates, 0, message};
    }

    if (!resolveDecision()) {
        return *earlyExit;
    }
    return transfer();
}

bool TransferJob::mountSource() {
    publish(record(TransferStatus::Mounting, fmt::format("USB detected: {} - Waiting for device...", volumeLabel)));
    log.logMessage(fmt::format("Device: {}, Label: {}", devicePath, volumeLabel));

    if (!mounts.isMounted(config.storageRoot)) {
        fail(fmt::format("External HDD not mounted at {}", config.storageRoot));
        notifier.notify({"HDD Not Found", "External hard drive is not connected", NotificationCategory::Failed});
        return false;
    }

    for (int check = 1; check <= config.deviceWaitAttempts; ++check) {
        if (mounts.blockDeviceExists(devicePath)) {
            log.logMessage(fmt::format("Device {} exists (check {})", devicePath, check));
            break;
        }
        publish(record(TransferStatus::Mounting,
                       fmt::format("Waiting for device... ({}/{})", check, config.deviceWaitAttempts)));
        if (!sleepFor(config.deviceWaitInterval)) {
            fail("Interrupted while waiting for device");
            return false;
        }
    }
    if (!sleepFor(config.settleDelay)) {
        fail("Interrupted while waiting for device");
        return false;
    }

    if (auto existing = mounts.findExistingMount(devicePath)) {
        log.logMessage(fmt::format("Using existing mount at: {}", *existing));
        source = *existing;
        return true;
    }

    std::string lastError = "device not ready";
    for (int attempt = 1; attempt <= config.mountAttempts; ++attempt) {
        log.logMessage(fmt::format("Mount attempt {} of {} for {} to {}", attempt, config.mountAttempts,
                                   devicePath, config.mountPoint));
        publish(record(TransferStatus::Mounting,
                       fmt::format("Mounting {} (attempt {}/{})...", volumeLabel, attempt, config.mountAttempts)));

        if (!mounts.blockDeviceExists(devicePath)) {
            log.logMessage(fmt::format("Device {} not ready yet", devicePath));
            lastError = fmt::format("device {} not found", devicePath);
        } else {
            auto mounted = mounts.mount(devicePath, config.mountPoint);
            if (mounted) {
                log.logMessage(fmt::format("Mount successful on attempt {}", attempt));
                source = config.mountPoint;
                return true;
            }
            lastError = mounted.error();
            log.logMessage(fmt::format("Mount attempt {} failed: {}", attempt, lastError));
            publish(record(TransferStatus::Mounting, fmt::format("Mount attempt {} failed, retrying...", attempt)));
        }
        if (attempt < config.mountAttempts && !sleepFor(config.mountRetryDelay)) {
            fail("Interrupted while mounting");
            return false;
        }
    }

    fail(fmt::format("Mount failed: {}", lastError));
    notifier.notify({"Mount Failed", fmt::format("Could not mount USB drive {}", volumeLabel),
                     NotificationCategory::Failed});
    return false;
}

bool TransferJob::scanSource() {
    if (!hasEntries(source)) {
        fail("USB drive is empty or not readable");
        return false;
    }
    log.logMessage(fmt::format("USB mounted successfully at {}", source));

    publish(record(TransferStatus::Scanning, "Scanning USB drive for files..."));
    auto scanned = ::scanSource(source, config.fileTypeTopN);
    if (!scanned) {
        fail(scanned.error());
        return false;
    }
    inventory = std::move(*scanned);
    std::string found = fmt::format("Found {} files ({})", inventory.fileCount, formatBytesIec(inventory.totalBytes));
    log.logMessage(found);
    publish(record(TransferStatus::Scanning, found));
    if (interrupted && interrupted()) {
        fail("Interrupted while scanning");
        return false;
    }

    publish(record(TransferStatus::Checking, "Checking for duplicate files..."));
    log.logMessage("Checking for existing files on HDD...");
    DuplicateScanner scanner(config.destDir);
    duplicates = scanner.scan(inventory);
    log.logMessage(fmt::format("Found {} files that already exist on HDD (out of {} total)",
                               duplicates.existingCount, inventory.fileCount));
    publish(record(TransferStatus::Checking, fmt::format("Found {} duplicates out of {} files",
                                                         duplicates.existingCount, inventory.fileCount)));
    return true;
}

bool TransferJob::resolveDecision() {
    if (duplicates.existingCount == 0) {
        chosen = Decision::Overwrite;
        return true;
    }

    std::size_t newFiles = inventory.fileCount - duplicates.existingCount;
    log.logMessage(fmt::format("Waiting for user decision (skip/overwrite)... {} new files, {} duplicates",
                               newFiles, duplicates.existingCount));
    publish(record(TransferStatus::PendingDecision,
                   fmt::format("{} new files, {} already exist", newFiles, duplicates.existingCount)));

    DecisionQuestion question{volumeLabel, inventory.fileCount, duplicates.existingCount, newFiles};
    auto outcome = decisionChannel.request(question, interrupted);
    if (!outcome) {
        log.logError(fmt::format("Cannot publish decision request: {}", outcome.error()));
        chosen = Decision::Skip;
        return true;
    }

    switch (outcome->source) {
        case DecisionOutcome::Source::Responded:
            break;
        case DecisionOutcome::Source::TimedOut:
            log.logMessage("Timeout waiting for user decision. Defaulting to skip.");
            break;
        case DecisionOutcome::Source::Invalid:
            log.logError(fmt::format("Invalid decision response \"{}\". Defaulting to skip.", outcome->rawResponse));
            break;
        case DecisionOutcome::Source::Interrupted:
            fail("Interrupted while waiting for user decision");
            return false;
    }
    chosen = outcome->decision;
    log.logMessage(fmt::format("User decision: {}", toString(*chosen)));
    return true;
}

std::expected<std::string, std::string> TransferJob::writeFileList() const {
    std::string content;
    for (const auto& path : duplicates.newFiles) {
        content += path;
        content.push_back('\0');
    }
    auto written = writeTextAtomically(config.fileListFile, content);
    if (!written) {
        return std::unexpected(written.error());
    }
    return config.fileListFile;
}

TransferOutcome TransferJob::transfer() {
    auto now = std::chrono::system_clock::now();
    destination = (fs::path(config.destDir) /
                   fmt::format("{}_{}", volumeLabel, formatLocalTime(now, "%Y%m%d_%H%M%S"))).string();
    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        return fail(fmt::format("Cannot create destination {}: {}", destination, ec.message()));
    }

    CopyRequest request{source, destination, chosen.value_or(Decision::Overwrite), std::nullopt};
    std::size_t runTotal = inventory.fileCount;
    if (request.mode == Decision::Skip) {
        auto list = writeFileList();
        if (!list) {
            return fail(fmt::format("Cannot write copy list: {}", list.error()));
        }
        request.fileList = *list;
        runTotal = duplicates.newFiles.size();
        log.logMessage(fmt::format("Using skip mode: copying {} new files", runTotal));
    }

    std::string totalSize = formatBytesIec(inventory.totalBytes);
    log.logMessage(fmt::format("Starting transfer: {} ({} files) to {}", totalSize, inventory.fileCount, destination));
    ProgressRecord starting = record(TransferStatus::Transferring, "Starting file transfer...");
    starting.filesTotal = runTotal;
    starting.speed = "Starting...";
    publish(std::move(starting));
    notifier.notify({"Transfer Started", fmt::format("Copying {} from {}...", totalSize, volumeLabel),
                     NotificationCategory::Started});

    auto argv = copyTool.command(request);
    log.logDebug(fmt::format("Running: {}", fmt::join(argv, " ")));
    auto process = Subprocess::start(argv);
    if (!process) {
        fail(fmt::format("Cannot start copy tool: {}", process.error()));
        notifier.notify({"Transfer Failed", fmt::format("Error copying from {}. Check logs.", volumeLabel),
                         NotificationCategory::Failed});
        return *earlyExit;
    }

    ProgressParser parser(copyTool.grammar(), runTotal, config.progressInterval);
    while (auto line = process->readLine(interrupted)) {
        log.appendRaw(*line);
        if (auto update = parser.feed(*line)) {
            ProgressRecord progress = record(TransferStatus::Transferring,
                fmt::format("Copying: {} ({}%)", truncateForDisplay(update->currentFile, config.currentFileDisplayLength),
                            update->percent));
            progress.percent = update->percent;
            progress.filesDone = update->filesDone;
            progress.filesTotal = update->filesTotal;
            progress.speed = update->speed;
            progress.eta = update->eta;
            progress.currentFile = update->currentFile;
            publish(std::move(progress));
        }
    }

    if (interrupted && interrupted()) {
        process->terminate();
        return fail("Transfer interrupted by signal");
    }

    auto exitCode = process->wait();
    if (!exitCode) {
        return fail(fmt::format("Copy tool did not finish: {}", exitCode.error()));
    }

    if (copyTool.isSuccess(*exitCode) || copyTool.isPartialSuccess(*exitCode)) {
        if (!copyTool.isSuccess(*exitCode)) {
            log.logMessage(fmt::format("Copy tool reported partial transfer (exit code {})", *exitCode));
        }
        std::size_t transferred = countFiles(destination);
        log.logMessage(fmt::format("Verified: {} files transferred", transferred));
        std::string message = fmt::format("Transfer complete! {} files copied", transferred);
        ProgressRecord done = record(TransferStatus::Complete, message);
        done.percent = 100;
        done.filesDone = transferred;
        done.speed = "Done";
        done.eta = "0:00:00";
        publish(std::move(done));
        mounts.flush();
        log.logMessage("Transfer complete. Safe to remove USB.");
        notifier.notify({"Transfer Complete",
                         fmt::format("Safe to remove USB ({}). Transferred: {} ({} files)", volumeLabel, totalSize, transferred),
                         NotificationCategory::Complete});
        return TransferOutcome{TransferStatus::Complete, 0, message};
    }

    TransferOutcome failed = fail(fmt::format("Transfer failed (error code {})", *exitCode));
    notifier.notify({"Transfer Failed", fmt::format("Error copying from {}. Check logs.", volumeLabel),
                     NotificationCategory::Failed});
    return failed;
}
