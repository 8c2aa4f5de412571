#include "decision_channel.hpp"
#include "progress_store.hpp"
#include "shutdown.hpp"
#include "text_format.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

std::string toString(Decision decision) {
    return decision == Decision::Overwrite ? "overwrite" : "skip";
}

std::optional<Decision> decisionFromString(const std::string& text) {
    std::string value = trim(text);
    if (value == "overwrite") {
        return Decision::Overwrite;
    }
    if (value == "skip") {
        return Decision::Skip;
    }
    return std::nullopt;
}

DecisionChannel::DecisionChannel(std::string requestFile, std::string responseFile,
                                 std::chrono::milliseconds timeout, std::chrono::milliseconds pollInterval)
    : requestFile(std::move(requestFile)), responseFile(std::move(responseFile)),
      timeout(timeout), pollInterval(std::max(pollInterval, std::chrono::milliseconds(1))) {}

void DecisionChannel::clear() const {
    std::error_code ec;
    fs::remove(responseFile, ec);
    fs::remove(requestFile, ec);
}

bool DecisionChannel::isPending(const std::string& requestFile) {
    std::error_code ec;
    return fs::exists(requestFile, ec);
}

std::expected<void, std::string> DecisionChannel::respond(const std::string& responseFile, Decision decision) {
    return writeTextAtomically(responseFile, toString(decision) + "\n");
}

std::optional<std::string> DecisionChannel::readResponse() const {
    std::ifstream file(responseFile);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream content;
    content << file.rdbuf();
    std::string text = content.str();
    // An empty file is a writer that has not finished yet
    if (trim(text).empty()) {
        return std::nullopt;
    }
    return text;
}

std::expected<DecisionOutcome, std::string> DecisionChannel::request(const DecisionQuestion& question,
                                                                     const std::function<bool()>& interrupted) {
    std::error_code ec;
    fs::remove(responseFile, ec);

    Json::Value record;
    record["label"] = question.label;
    record["total_files"] = static_cast<Json::UInt64>(question.totalFiles);
    record["existing_files"] = static_cast<Json::UInt64>(question.existingFiles);
    record["new_files"] = static_cast<Json::UInt64>(question.newFiles);
    record["options"].append("overwrite");
    record["options"].append("skip");
    record["timeout_sec"] = static_cast<Json::Int64>(std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
    record["timestamp"] = isoTimestamp(std::chrono::system_clock::now());
    if (auto written = writeJsonAtomically(requestFile, record); !written) {
        return std::unexpected(written.error());
    }

    DecisionOutcome outcome;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto response = readResponse()) {
            outcome.rawResponse = trim(*response);
            if (auto decision = decisionFromString(*response)) {
                outcome.decision = *decision;
                outcome.source = DecisionOutcome::Source::Responded;
            } else {
                outcome.decision = Decision::Skip;
                outcome.source = DecisionOutcome::Source::Invalid;
            }
            break;
        }
        if (interrupted && interrupted()) {
            outcome.source = DecisionOutcome::Source::Interrupted;
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            outcome.source = DecisionOutcome::Source::TimedOut;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        interruptibleSleep(std::min(pollInterval, remaining), [&interrupted] { return interrupted && interrupted(); });
    }

    clear();
    return outcome;
}
