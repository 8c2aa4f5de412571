#include "copy_tool.hpp"
#include <algorithm>

namespace {

std::string withTrailingSlash(std::string path) {
    if (path.empty() || path.back() != '/') {
        path.push_back('/');
    }
    return path;
}

} // namespace

RsyncCopyTool::RsyncCopyTool(std::string executable, std::vector<int> partialSuccessCodes)
    : executable(std::move(executable)), partialSuccessCodes(std::move(partialSuccessCodes)) {}

std::vector<std::string> RsyncCopyTool::command(const CopyRequest& request) const {
    std::vector<std::string> argv = {executable, "-avh", "--progress", "--info=progress2"};
    if (request.mode == Decision::Skip) {
        argv.emplace_back("--ignore-existing");
    }
    if (request.fileList) {
        argv.emplace_back("--from0");
        argv.push_back("--files-from=" + *request.fileList);
    }
    // Trailing slashes copy the contents of the source, not the directory itself
    argv.push_back(withTrailingSlash(request.source));
    argv.push_back(withTrailingSlash(request.destination));
    return argv;
}

bool RsyncCopyTool::isPartialSuccess(int exitCode) const {
    return std::find(partialSuccessCodes.begin(), partialSuccessCodes.end(), exitCode) != partialSuccessCodes.end();
}
