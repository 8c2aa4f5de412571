/**
 * @file remote_store.hpp
 * @brief Cloud remote used by the sync job.
 *
 * Like the copy tool, the remote is driven through an external program (rclone).
 * The sync job depends on the RemoteStore interface only, which lets tests count
 * remote calls and replace the remote with a local directory.
 */

#ifndef REMOTE_STORE_HPP
#define REMOTE_STORE_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <vector>
#include "progress_parser.hpp"
#include "vault_config.hpp"

/**
 * @brief Object count and total size of a remote folder.
 */
struct RemoteSize {
    std::uint64_t count = 0;
    std::uint64_t bytes = 0;
};

/**
 * @brief Interface for cloud remotes.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    /// Whether the credentials the remote needs are present locally.
    virtual bool hasCredentials() = 0;

    /**
     * @brief Checks that the remote is reachable.
     *
     * @return std::expected<void, std::string> Success or why the remote is unreachable.
     */
    virtual std::expected<void, std::string> probe() = 0;

    /**
     * @brief Queries the size of a remote folder.
     *
     * @param remotePath Remote folder as returned by remotePath().
     * @return std::expected<RemoteSize, std::string> The totals or an error message.
     */
    virtual std::expected<RemoteSize, std::string> size(const std::string& remotePath) = 0;

    /**
     * @brief Builds the one-way sync command from a local tree to a remote folder.
     */
    virtual std::vector<std::string> syncCommand(const std::string& localRoot, const std::string& remotePath) const = 0;

    /// Qualifies a folder name with the remote ("gdrive:RaPi-PEBL-Sync/010325").
    virtual std::string remotePath(const std::string& folder) const = 0;

    /// Grammar of the sync tool's progress output.
    virtual ParserGrammar grammar() const = 0;
};

/**
 * @brief Remote accessed through rclone.
 */
class RcloneRemoteStore : public RemoteStore {
public:
    /**
     * @brief Constructs the remote from the sync settings of the configuration.
     *
     * @param config Tool path, rclone config file, remote name and sync tuning.
     */
    explicit RcloneRemoteStore(const VaultConfig& config);

    bool hasCredentials() override;
    std::expected<void, std::string> probe() override;
    std::expected<RemoteSize, std::string> size(const std::string& remotePath) override;
    std::vector<std::string> syncCommand(const std::string& localRoot, const std::string& remotePath) const override;
    std::string remotePath(const std::string& folder) const override;
    ParserGrammar grammar() const override { return ParserGrammar::rclone(); }

private:
    std::string executable;
    std::string configFile;
    std::string remoteName;
    std::string bandwidthLimit;
    int transfers;
    int checkers;
    std::vector<std::string> excludes;
};

/**
 * @brief Parses the output of "rclone size --json".
 *
 * Log lines printed before the document are ignored.
 */
std::expected<RemoteSize, std::string> parseRemoteSize(const std::string& output);

#endif // REMOTE_STORE_HPP
