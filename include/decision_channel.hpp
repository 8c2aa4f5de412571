/**
 * @file decision_channel.hpp
 * @brief File-based question/answer channel between the transfer job and the UI.
 *
 * The job writes a request record describing the duplicates it found and waits
 * for the UI (or usbvault-ctl) to write "overwrite" or "skip" to the response
 * file. A request without a response is pending. If nobody answers within the
 * timeout the job proceeds as if "skip" had been chosen.
 */

#ifndef DECISION_CHANNEL_HPP
#define DECISION_CHANNEL_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>

enum class Decision {
    Overwrite, ///< Copy everything, replacing files with the same path.
    Skip       ///< Never replace files that already exist at the destination.
};

std::string toString(Decision decision);

/**
 * @brief Parses a response; surrounding whitespace is ignored, case is not.
 */
std::optional<Decision> decisionFromString(const std::string& text);

/**
 * @brief What the user is asked to decide.
 */
struct DecisionQuestion {
    std::string label;
    std::size_t totalFiles = 0;
    std::size_t existingFiles = 0;
    std::size_t newFiles = 0;
};

/**
 * @brief Resolved decision and how it was reached.
 */
struct DecisionOutcome {
    enum class Source {
        Responded,  ///< A valid response was read.
        TimedOut,   ///< No response within the timeout.
        Invalid,    ///< The response was neither "overwrite" nor "skip".
        Interrupted ///< Shutdown was requested while waiting.
    };

    Decision decision = Decision::Skip;
    Source source = Source::TimedOut;
    std::string rawResponse;  ///< Response text as read, for logging.
};

class DecisionChannel {
public:
    /**
     * @param requestFile Path of the pending-question record.
     * @param responseFile Path the answer is written to.
     * @param timeout Maximum wait for an answer.
     * @param pollInterval Delay between checks of the response file.
     */
    DecisionChannel(std::string requestFile, std::string responseFile,
                    std::chrono::milliseconds timeout, std::chrono::milliseconds pollInterval);

    /**
     * @brief Publishes the question and blocks until it is resolved.
     *
     * A response left over from an earlier job is removed before the question is
     * published. Both files are removed again once the question is resolved.
     *
     * @param question Duplicate summary shown to the user.
     * @param interrupted Polled while waiting; returning true resolves the question as Skip.
     * @return std::expected<DecisionOutcome, std::string> The outcome, or an error if the request could not be written.
     */
    std::expected<DecisionOutcome, std::string> request(const DecisionQuestion& question,
                                                        const std::function<bool()>& interrupted = {});

    /// Removes the request and response files.
    void clear() const;

    /**
     * @brief Writes a response for a pending request.
     *
     * @param responseFile Response file path.
     * @param decision Decision to post.
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> respond(const std::string& responseFile, Decision decision);

    /// Whether a request record is present.
    static bool isPending(const std::string& requestFile);

private:
    std::optional<std::string> readResponse() const;

    std::string requestFile;
    std::string responseFile;
    std::chrono::milliseconds timeout;
    std::chrono::milliseconds pollInterval;
};

#endif // DECISION_CHANNEL_HPP
