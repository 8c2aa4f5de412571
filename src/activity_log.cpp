#include "activity_log.hpp"
#include "text_format.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

ActivityLog::ActivityLog(std::string logFile, std::string errorLogFile, bool verbose, bool consoleEcho)
    : logFile(std::move(logFile)), errorLogFile(std::move(errorLogFile)), verbose(verbose), consoleEcho(consoleEcho) {
    for (const auto& file : {this->logFile, this->errorLogFile}) {
        fs::path parent = fs::path(file).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
        }
    }
}

std::string ActivityLog::stamp(const std::string& message) const {
    return fmt::format("[{}] {}", formatLocalTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S"), message);
}

void ActivityLog::append(const std::string& file, const std::string& entry) const {
    std::ofstream log(file, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else if (consoleEcho) {
        fmt::print(stderr, "Error: Cannot write to log file: {}\n", file);
    }
}

void ActivityLog::logMessage(const std::string& message) const {
    std::string entry = stamp(message);
    std::lock_guard<std::mutex> lock(mutex);
    if (consoleEcho) {
        fmt::print("{}\n", entry);
    }
    append(logFile, entry);
}

void ActivityLog::logError(const std::string& message) const {
    std::string entry = stamp(fmt::format("ERROR: {}", message));
    std::lock_guard<std::mutex> lock(mutex);
    if (consoleEcho) {
        fmt::print(stderr, "{}\n", entry);
    }
    append(logFile, entry);
    if (errorLogFile != logFile) {
        append(errorLogFile, entry);
    }
}

void ActivityLog::logDebug(const std::string& message) const {
    if (!verbose) {
        return;
    }
    logMessage(fmt::format("[DEBUG] {}", message));
}

void ActivityLog::appendRaw(const std::string& line) const {
    std::lock_guard<std::mutex> lock(mutex);
    append(logFile, line);
}
