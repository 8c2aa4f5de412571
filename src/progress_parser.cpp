#include "progress_parser.hpp"
#include "progress_store.hpp"
#include <algorithm>
#include <cctype>

namespace {

const std::vector<std::string> kCommonBanners = {
    "sent ", "total ", "rsync", "sending incremental", "building file list", "receiving",
    "created directory", "Transferred:", "Checks:", "Elapsed time:", "Errors:", "ERROR",
};

// Last occurrence of the pattern in the line, preferring capture group 1
std::optional<std::string> lastMatch(const std::string& line, const std::regex& pattern) {
    std::optional<std::string> found;
    for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern); it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        found = (match.size() > 1 && match[1].matched) ? match[1].str() : match[0].str();
    }
    return found;
}

} // namespace

ParserGrammar ParserGrammar::rsync() {
    return ParserGrammar{
        std::regex(R"(([0-9]+)%)"),
        std::regex(R"([0-9]+(?:\.[0-9]+)?[kKMGT]?B/s)"),
        std::regex(R"([0-9]+:[0-9]+:[0-9]+)"),
        kCommonBanners,
    };
}

ParserGrammar ParserGrammar::rclone() {
    return ParserGrammar{
        std::regex(R"(([0-9]+)%)"),
        std::regex(R"([0-9.]+ ?[KMGT]?i?B/s)"),
        std::regex(R"(ETA ([0-9hms:-]+))"),
        kCommonBanners,
    };
}

ProgressParser::ProgressParser(ParserGrammar grammar, std::size_t filesTotal, std::chrono::milliseconds minInterval)
    : grammar(std::move(grammar)), filesTotal(filesTotal), minInterval(minInterval) {}

bool ProgressParser::isBanner(const std::string& line) const {
    return std::any_of(grammar.bannerPrefixes.begin(), grammar.bannerPrefixes.end(),
                       [&line](const std::string& prefix) { return line.rfind(prefix, 0) == 0; });
}

std::optional<ProgressUpdate> ProgressParser::feed(const std::string& line) {
    return feed(line, std::chrono::steady_clock::now());
}

std::optional<ProgressUpdate> ProgressParser::feed(const std::string& line, std::chrono::steady_clock::time_point now) {
    if (line.empty()) {
        return std::nullopt;
    }

    std::smatch match;
    if (!std::regex_search(line, match, grammar.percentPattern)) {
        if (!std::isspace(static_cast<unsigned char>(line.front())) && !isBanner(line)) {
            lastKnownFilename = line;
        }
        return std::nullopt;
    }

    int percent = 0;
    try {
        percent = std::stoi(match[1].str());
    } catch (const std::exception&) {
        // Malformed meter line: no new information
        return std::nullopt;
    }
    highest = std::max(highest, std::clamp(percent, 0, 100));

    if (lastEmitTime && now - *lastEmitTime < minInterval) {
        return std::nullopt;
    }
    lastEmitTime = now;

    ProgressUpdate update;
    update.percent = highest;
    update.filesTotal = filesTotal;
    update.filesDone = filesTotal * static_cast<std::size_t>(highest) / 100;
    update.speed = lastMatch(line, grammar.speedPattern).value_or(kUnknownField);
    update.eta = lastMatch(line, grammar.etaPattern).value_or(kUnknownField);
    update.currentFile = lastKnownFilename;
    return update;
}
