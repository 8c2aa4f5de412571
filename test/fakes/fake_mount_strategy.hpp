#ifndef USBVAULT_FAKE_MOUNT_STRATEGY_HPP
#define USBVAULT_FAKE_MOUNT_STRATEGY_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "mount_strategy.hpp"

/// Mount strategy over plain directories. A "mount" copies a prepared tree into the mount point.
class FakeMountStrategy : public MountStrategy {
public:
    bool storageMounted = true;
    bool deviceExists = true;
    std::optional<std::string> existingMount;
    std::optional<std::string> mountContent;  ///< Tree copied into the mount point on success.
    int mountFailures = 0;                    ///< Attempts that fail before one succeeds.
    int mountCalls = 0;
    int flushCalls = 0;

    bool blockDeviceExists(const std::string&) override { return deviceExists; }

    std::optional<std::string> findExistingMount(const std::string&) override { return existingMount; }

    std::expected<void, std::string> mount(const std::string&, const std::string& mountPoint) override {
        ++mountCalls;
        if (mountCalls <= mountFailures || !mountContent) {
            return std::unexpected("mount: wrong fs type, bad option, bad superblock");
        }
        std::filesystem::create_directories(mountPoint);
        std::filesystem::copy(*mountContent, mountPoint, std::filesystem::copy_options::recursive);
        return {};
    }

    bool isMounted(const std::string&) override { return storageMounted; }

    void flush() override { ++flushCalls; }
};

#endif // USBVAULT_FAKE_MOUNT_STRATEGY_HPP
