/**
 * @file duplicate_scanner.hpp
 * @brief Source inventory and name-based duplicate detection against the backup disk.
 *
 * A source file counts as already backed up when a regular file with the same base
 * name exists anywhere under the destination root. Contents are not compared.
 */

#ifndef DUPLICATE_SCANNER_HPP
#define DUPLICATE_SCANNER_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <unordered_set>
#include <vector>
#include "progress_store.hpp"

/**
 * @brief What was found on the source medium.
 */
struct SourceInventory {
    std::size_t fileCount = 0;          ///< Regular files under the source root.
    std::uint64_t totalBytes = 0;       ///< Sum of their sizes.
    FileTypeHistogram fileTypes;        ///< Top extensions by count.
    std::vector<std::string> files;     ///< Paths relative to the source root, sorted.
};

/**
 * @brief Walks a source tree and builds its inventory.
 *
 * Unreadable subdirectories are skipped. Extensions are the text after the last
 * '.' of the file name and only count when they are 1-10 alphanumeric characters.
 *
 * @param sourceRoot Root of the mounted source.
 * @param topN Number of extensions kept in the histogram.
 * @return std::expected<SourceInventory, std::string> The inventory, or an error if the root cannot be read.
 */
std::expected<SourceInventory, std::string> scanSource(const std::string& sourceRoot, std::size_t topN = 5);

/**
 * @brief Counts the regular files under a directory, 0 if it cannot be read.
 */
std::size_t countFiles(const std::string& root);

/**
 * @brief Partition of the source files into duplicates and new files.
 */
struct DuplicateReport {
    std::size_t existingCount = 0;
    std::vector<std::string> newFiles;        ///< Relative paths with no name match on the destination.
    std::vector<std::string> duplicateFiles;  ///< Relative paths whose name exists on the destination.
};

/**
 * @brief Indexes the base names present under the destination root.
 */
class DuplicateScanner {
public:
    explicit DuplicateScanner(std::string destRoot);

    /**
     * @brief Classifies every file of the inventory.
     *
     * A destination root that is missing or unreadable yields no duplicates.
     */
    DuplicateReport scan(const SourceInventory& inventory);

private:
    void buildIndex();

    std::string destRoot;
    std::unordered_set<std::string> names;
    bool indexed = false;
};

#endif // DUPLICATE_SCANNER_HPP
