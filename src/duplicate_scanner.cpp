#include "duplicate_scanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxExtensionLength = 10;

std::string extensionOf(const std::string& fileName) {
    auto dot = fileName.rfind('.');
    if (dot == std::string::npos) {
        return {};
    }
    std::string extension = fileName.substr(dot + 1);
    if (extension.empty() || extension.size() > kMaxExtensionLength) {
        return {};
    }
    bool alnum = std::all_of(extension.begin(), extension.end(),
                             [](unsigned char c) { return std::isalnum(c) != 0; });
    return alnum ? extension : std::string{};
}

// Calls visit(entry) for each regular file; unreadable entries are skipped
template <typename Visitor>
bool walkFiles(const fs::path& root, Visitor visit) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return false;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            ec.clear();
            continue;
        }
        std::error_code statError;
        if (it->is_regular_file(statError)) {
            visit(*it);
        }
    }
    return true;
}

} // namespace

std::expected<SourceInventory, std::string> scanSource(const std::string& sourceRoot, std::size_t topN) {
    std::error_code ec;
    if (!fs::is_directory(sourceRoot, ec)) {
        return std::unexpected(fmt::format("Source {} is not a readable directory", sourceRoot));
    }

    SourceInventory inventory;
    std::map<std::string, std::size_t> extensionCounts;
    fs::path root(sourceRoot);
    bool readable = walkFiles(root, [&](const fs::directory_entry& entry) {
        ++inventory.fileCount;
        std::error_code sizeError;
        auto size = entry.file_size(sizeError);
        if (!sizeError) {
            inventory.totalBytes += size;
        }
        inventory.files.push_back(entry.path().lexically_relative(root).string());
        auto extension = extensionOf(entry.path().filename().string());
        if (!extension.empty()) {
            ++extensionCounts[extension];
        }
    });
    if (!readable) {
        return std::unexpected(fmt::format("Cannot read source {}", sourceRoot));
    }

    std::sort(inventory.files.begin(), inventory.files.end());
    // std::map iterates alphabetically, so the stable sort breaks count ties by name
    inventory.fileTypes.assign(extensionCounts.begin(), extensionCounts.end());
    std::stable_sort(inventory.fileTypes.begin(), inventory.fileTypes.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (inventory.fileTypes.size() > topN) {
        inventory.fileTypes.resize(topN);
    }
    return inventory;
}

std::size_t countFiles(const std::string& root) {
    std::size_t count = 0;
    walkFiles(fs::path(root), [&count](const fs::directory_entry&) { ++count; });
    return count;
}

DuplicateScanner::DuplicateScanner(std::string destRoot) : destRoot(std::move(destRoot)) {}

void DuplicateScanner::buildIndex() {
    names.clear();
    walkFiles(fs::path(destRoot), [this](const fs::directory_entry& entry) {
        names.insert(entry.path().filename().string());
    });
    indexed = true;
}

DuplicateReport DuplicateScanner::scan(const SourceInventory& inventory) {
    if (!indexed) {
        buildIndex();
    }
    DuplicateReport report;
    for (const auto& relative : inventory.files) {
        if (names.contains(fs::path(relative).filename().string())) {
            report.duplicateFiles.push_back(relative);
        } else {
            report.newFiles.push_back(relative);
        }
    }
    report.existingCount = report.duplicateFiles.size();
    return report;
}
