#include "mount_strategy.hpp"
#include "subprocess.hpp"
#include "text_format.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

std::string normalizePath(const std::string& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    return ec ? fs::path(path).lexically_normal().string() : canonical.string();
}

bool hasEntries(const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    return !ec && it != fs::directory_iterator();
}

} // namespace

std::string decodeMountPath(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 3 < text.size()) {
            const std::string digits = text.substr(i + 1, 3);
            if (std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '7'; })) {
                decoded.push_back(static_cast<char>(std::stoi(digits, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

std::vector<MountEntry> parseMountTable(std::istream& input) {
    std::vector<MountEntry> entries;
    std::string line;
    while (std::getline(input, line)) {
        std::istringstream fields(line);
        MountEntry entry;
        if (!(fields >> entry.source >> entry.target)) {
            continue;
        }
        fields >> entry.fsType;
        entry.source = decodeMountPath(entry.source);
        entry.target = decodeMountPath(entry.target);
        entries.push_back(std::move(entry));
    }
    return entries;
}

SystemMountStrategy::SystemMountStrategy(std::vector<std::string> automountRoots, std::string storageRoot,
                                         std::string mountTable)
    : automountRoots(std::move(automountRoots)), storageRoot(std::move(storageRoot)), mountTable(std::move(mountTable)) {}

std::vector<MountEntry> SystemMountStrategy::readMountTable() const {
    std::ifstream file(mountTable);
    if (!file.is_open()) {
        return {};
    }
    return parseMountTable(file);
}

bool SystemMountStrategy::blockDeviceExists(const std::string& device) {
    struct stat st {};
    return ::stat(device.c_str(), &st) == 0 && S_ISBLK(st.st_mode);
}

std::optional<std::string> SystemMountStrategy::findExistingMount(const std::string& device) {
    // 1. Block device listing
    if (auto lsblk = runCommand({"lsblk", "-no", "MOUNTPOINT", device}); lsblk && lsblk->exitCode == 0) {
        std::istringstream lines(lsblk->output);
        std::string line;
        while (std::getline(lines, line)) {
            line = trim(line);
            if (!line.empty()) {
                return line;
            }
        }
    }

    auto table = readMountTable();
    std::string storage = normalizePath(storageRoot);

    // 2. Media mounted by the desktop under the auto-mount roots
    for (const auto& root : automountRoots) {
        std::error_code ec;
        for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code typeError;
            if (!it->is_directory(typeError)) {
                continue;
            }
            std::string candidate = normalizePath(it->path().string());
            if (candidate == storage) {
                continue;
            }
            bool mounted = std::any_of(table.begin(), table.end(), [&](const MountEntry& entry) {
                return normalizePath(entry.target) == candidate;
            });
            if (mounted && hasEntries(it->path())) {
                return candidate;
            }
        }
    }

    // 3. Kernel mount table
    std::string wanted = normalizePath(device);
    for (const auto& entry : table) {
        if (entry.source == device || normalizePath(entry.source) == wanted) {
            return entry.target;
        }
    }
    return std::nullopt;
}

std::expected<void, std::string> SystemMountStrategy::mount(const std::string& device, const std::string& mountPoint) {
    std::error_code ec;
    fs::create_directories(mountPoint, ec);
    if (ec) {
        return std::unexpected(fmt::format("Cannot create mount point {}: {}", mountPoint, ec.message()));
    }
    auto result = runCommand({"mount", device, mountPoint});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        return std::unexpected(result->output.empty() ? fmt::format("mount exited with code {}", result->exitCode)
                                                      : result->output);
    }
    return {};
}

bool SystemMountStrategy::isMounted(const std::string& path) {
    std::string wanted = normalizePath(path);
    auto table = readMountTable();
    return std::any_of(table.begin(), table.end(),
                       [&](const MountEntry& entry) { return normalizePath(entry.target) == wanted; });
}

void SystemMountStrategy::flush() {
    ::sync();
}
