#ifndef YTMUX_ARTIFACT_LIFECYCLE_H
#define YTMUX_ARTIFACT_LIFECYCLE_H

#include <filesystem>
#include <string>
#include <vector>

namespace ytmux {

// A temporary file that could not be deleted (ErrorKind::CleanupFailed).
struct CleanupIssue {
    std::filesystem::path path;
    std::string message;
};

// Owns the two temporary download paths of a run. Files are only removed by
// an explicit cleanup() after a successful mux; destruction leaves them alone.
class ArtifactLifecycle {
public:
    ArtifactLifecycle(std::filesystem::path videoPath, std::filesystem::path audioPath);

    const std::filesystem::path& videoPath() const { return videoPath_; }
    const std::filesystem::path& audioPath() const { return audioPath_; }

    // Deletes both temporaries. Paths that are already gone are not issues.
    std::vector<CleanupIssue> cleanup();

private:
    std::filesystem::path videoPath_;
    std::filesystem::path audioPath_;
};

} // namespace ytmux

#endif // YTMUX_ARTIFACT_LIFECYCLE_H
