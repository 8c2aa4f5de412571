/**
 * @file mount_strategy.hpp
 * @brief Block device and mount table access used by the transfer job.
 *
 * The transfer job only talks to the MountStrategy interface, so tests can run the
 * whole state machine against plain directories.
 */

#ifndef MOUNT_STRATEGY_HPP
#define MOUNT_STRATEGY_HPP

#include <expected>
#include <istream>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One line of the kernel mount table.
 */
struct MountEntry {
    std::string source;  ///< Mounted device, e.g. /dev/sdb1.
    std::string target;  ///< Mount point, octal escapes decoded.
    std::string fsType;
};

/**
 * @brief Parses a table in /proc/mounts format.
 *
 * @param input Stream positioned at the first line.
 * @return The entries in table order; malformed lines are skipped.
 */
std::vector<MountEntry> parseMountTable(std::istream& input);

/// Decodes the \\040-style octal escapes the kernel uses for blanks in paths.
std::string decodeMountPath(const std::string& text);

/**
 * @brief Interface for finding and mounting the source medium.
 */
class MountStrategy {
public:
    virtual ~MountStrategy() = default;

    /// Whether the device node exists and is a block device.
    virtual bool blockDeviceExists(const std::string& device) = 0;

    /**
     * @brief Looks for a mount of the device made by someone else (e.g. the desktop auto-mounter).
     *
     * @param device Device path.
     * @return The mount point, or std::nullopt if the device is not mounted.
     */
    virtual std::optional<std::string> findExistingMount(const std::string& device) = 0;

    /**
     * @brief Mounts the device at mountPoint, creating the directory if needed.
     *
     * @return std::expected<void, std::string> Success or the mount tool's output.
     */
    virtual std::expected<void, std::string> mount(const std::string& device, const std::string& mountPoint) = 0;

    /// Whether path is the target of a mount (used for the backup disk).
    virtual bool isMounted(const std::string& path) = 0;

    /// Flushes filesystem buffers to disk.
    virtual void flush() = 0;
};

/**
 * @brief Mount strategy backed by lsblk, blkid, mount and the kernel mount table.
 */
class SystemMountStrategy : public MountStrategy {
public:
    /**
     * @param automountRoots Directories the desktop auto-mounter mounts media under.
     * @param storageRoot Mount point of the backup disk, never taken for the source.
     * @param mountTable Kernel mount table to read.
     */
    SystemMountStrategy(std::vector<std::string> automountRoots, std::string storageRoot,
                        std::string mountTable = "/proc/mounts");

    bool blockDeviceExists(const std::string& device) override;
    std::optional<std::string> findExistingMount(const std::string& device) override;
    std::expected<void, std::string> mount(const std::string& device, const std::string& mountPoint) override;
    bool isMounted(const std::string& path) override;
    void flush() override;

private:
    std::vector<MountEntry> readMountTable() const;

    std::vector<std::string> automountRoots;
    std::string storageRoot;
    std::string mountTable;
};

#endif // MOUNT_STRATEGY_HPP
