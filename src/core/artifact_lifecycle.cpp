#include "ytmux/artifact_lifecycle.h"
#include <system_error> // For std::error_code
#include <utility>

namespace ytmux {

ArtifactLifecycle::ArtifactLifecycle(std::filesystem::path videoPath, std::filesystem::path audioPath)
    : videoPath_(std::move(videoPath)), audioPath_(std::move(audioPath)) {}

std::vector<CleanupIssue> ArtifactLifecycle::cleanup() {
    std::vector<CleanupIssue> issues;
    for (const auto& path : {videoPath_, audioPath_}) {
        std::error_code ec;
        std::filesystem::remove(path, ec); // false without error when already gone
        if (ec) {
            issues.push_back(CleanupIssue{path, ec.message()});
        }
    }
    return issues;
}

} // namespace ytmux
