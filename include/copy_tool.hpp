/**
 * @file copy_tool.hpp
 * @brief External copy tool used by the local transfer job.
 *
 * The copy algorithm itself is never implemented here: the job builds a command
 * line, reads the tool's meter through its ParserGrammar and classifies the exit
 * code.
 */

#ifndef COPY_TOOL_HPP
#define COPY_TOOL_HPP

#include <optional>
#include <string>
#include <vector>
#include "decision_channel.hpp"
#include "progress_parser.hpp"

/**
 * @brief One copy run.
 */
struct CopyRequest {
    std::string source;                   ///< Source directory; its contents are copied.
    std::string destination;              ///< Destination directory.
    Decision mode = Decision::Overwrite;  ///< Skip never replaces existing destination files.
    std::optional<std::string> fileList;  ///< NUL-separated list of relative paths to copy.
};

/**
 * @brief Interface for copy tools.
 */
class CopyTool {
public:
    virtual ~CopyTool() = default;

    /**
     * @brief Builds the command line for a copy run.
     *
     * @param request Copy parameters.
     * @return std::vector<std::string> Program and arguments.
     */
    virtual std::vector<std::string> command(const CopyRequest& request) const = 0;

    /// Whether the exit code means every file was copied.
    virtual bool isSuccess(int exitCode) const { return exitCode == 0; }

    /// Whether the exit code means some files failed but the run is accepted.
    virtual bool isPartialSuccess(int exitCode) const = 0;

    /// Grammar of the tool's progress output.
    virtual ParserGrammar grammar() const = 0;
};

/**
 * @brief rsync with the aggregate --info=progress2 meter.
 */
class RsyncCopyTool : public CopyTool {
public:
    /**
     * @param executable rsync binary (resolved through PATH).
     * @param partialSuccessCodes Exit codes accepted as partial success (23 by default).
     */
    explicit RsyncCopyTool(std::string executable = "rsync", std::vector<int> partialSuccessCodes = {23});

    std::vector<std::string> command(const CopyRequest& request) const override;
    bool isPartialSuccess(int exitCode) const override;
    ParserGrammar grammar() const override { return ParserGrammar::rsync(); }

private:
    std::string executable;
    std::vector<int> partialSuccessCodes;
};

#endif // COPY_TOOL_HPP
