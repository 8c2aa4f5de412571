// Test stand-in for rclone, backed by a local directory.
//
// FAKE_RCLONE_ROOT       directory holding the remote ("gdrive:a/b" is $ROOT/a/b)
// FAKE_RCLONE_OFFLINE    if set, "about" fails
// FAKE_RCLONE_SYNC_EXIT  exit code of "sync" (default 0)
// FAKE_RCLONE_DELAY_MS   pause after each synced file
// FAKE_RCLONE_LOG        file that receives one line per invocation

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

fs::path remoteDir(const std::string& root, const std::string& remotePath) {
    auto colon = remotePath.find(':');
    std::string folder = colon == std::string::npos ? remotePath : remotePath.substr(colon + 1);
    return fs::path(root) / folder;
}

bool excluded(const std::string& relative, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (pattern.size() > 1 && pattern[0] == '*') {
            std::string suffix = pattern.substr(1);
            if (relative.size() >= suffix.size() &&
                relative.compare(relative.size() - suffix.size(), suffix.size(), suffix) == 0) {
                return true;
            }
        } else if (pattern.size() > 3 && pattern.compare(pattern.size() - 3, 3, "/**") == 0) {
            std::string prefix = pattern.substr(0, pattern.size() - 3);
            if (!prefix.empty() && prefix.back() == '*') {
                prefix.pop_back();
            }
            if (relative.rfind(prefix, 0) == 0) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (const char* logFile = std::getenv("FAKE_RCLONE_LOG")) {
        std::ofstream log(logFile, std::ios::app);
        for (const auto& arg : args) {
            log << arg << ' ';
        }
        log << '\n';
    }

    const char* root = std::getenv("FAKE_RCLONE_ROOT");
    if (!root || args.empty()) {
        std::cerr << "ERROR : fake rclone needs FAKE_RCLONE_ROOT and a command" << std::endl;
        return 1;
    }
    const std::string& command = args[0];

    if (command == "about") {
        if (std::getenv("FAKE_RCLONE_OFFLINE")) {
            std::cerr << "ERROR : about: couldn't connect" << std::endl;
            return 1;
        }
        std::cout << "Total:   15 GiB\nUsed:    1 GiB\nFree:    14 GiB" << std::endl;
        return 0;
    }

    if (command == "size" && args.size() >= 2) {
        fs::path dir = remoteDir(root, args[1]);
        std::uintmax_t count = 0;
        std::uintmax_t bytes = 0;
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            for (const auto& entry : fs::recursive_directory_iterator(dir)) {
                if (entry.is_regular_file()) {
                    ++count;
                    bytes += entry.file_size();
                }
            }
        }
        std::cout << fmt::format("{{\"count\":{},\"bytes\":{},\"sizeless\":0}}", count, bytes) << std::endl;
        return 0;
    }

    if (command == "sync" && args.size() >= 3) {
        fs::path local = args[1];
        fs::path dir = remoteDir(root, args[2]);
        std::vector<std::string> excludes;
        for (std::size_t i = 3; i + 1 < args.size(); ++i) {
            if (args[i] == "--exclude") {
                excludes.push_back(args[i + 1]);
            }
        }
        int delayMs = 0;
        if (const char* delay = std::getenv("FAKE_RCLONE_DELAY_MS")) {
            delayMs = std::atoi(delay);
        }

        std::vector<fs::path> files;
        for (const auto& entry : fs::recursive_directory_iterator(local)) {
            if (entry.is_regular_file() && !excluded(entry.path().lexically_relative(local).string(), excludes)) {
                files.push_back(entry.path());
            }
        }
        std::size_t done = 0;
        for (const auto& file : files) {
            fs::path target = dir / file.lexically_relative(local);
            fs::create_directories(target.parent_path());
            fs::copy_file(file, target, fs::copy_options::overwrite_existing);
            ++done;
            std::cout << fmt::format("INFO  : {}: Copied (new)\n", file.lexically_relative(local).string());
            std::cout << fmt::format("        {} / {} files, {}%, 1.000 MiB/s, ETA 0s\n", done, files.size(),
                                     done * 100 / files.size());
            std::cout.flush();
            if (delayMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
            }
        }
        std::cout << "Transferred:   " << done << " / " << files.size() << ", 100%" << std::endl;
        const char* exitCode = std::getenv("FAKE_RCLONE_SYNC_EXIT");
        return exitCode ? std::atoi(exitCode) : 0;
    }

    std::cerr << "ERROR : unknown command " << command << std::endl;
    return 1;
}
