#ifndef YTMUX_DOWNLOAD_RUN_H
#define YTMUX_DOWNLOAD_RUN_H

#include "ytmux/artifact_lifecycle.h"
#include "ytmux/config.h"
#include "ytmux/errors.h"
#include "ytmux/muxer.h"
#include "ytmux/run_events.h"
#include "ytmux/stream_catalog.h"
#include "ytmux/video_info.h"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ytmux {

// Picks one of the offered labels (highest quality first). May loop on input
// internally; throws RunCancelled to abandon the run.
using ResolutionChooser = std::function<std::string(const std::vector<std::string>&)>;

struct RunOutcome {
    RunState state = RunState::Resolving;
    RunState failedIn = RunState::Resolving;   // last active state before Failed / Cancelled
    std::optional<VideoDetails> details;
    std::optional<std::filesystem::path> outputPath;
    std::optional<PipelineError> error;        // set when state == Failed
    std::optional<std::string> cancelReason;   // set when state == Cancelled
    std::vector<CleanupIssue> cleanupIssues;   // non fatal

    bool succeeded() const { return state == RunState::Done; }
};

// Process exit status for a finished run: 0 when it is Done or Cancelled,
// 1 when it Failed.
int exitStatus(const RunOutcome& outcome);

// One asset, one pass: Resolving -> Resolved -> Selecting -> Retrieving ->
// Muxing -> Cleaning -> Done, or Failed / Cancelled from any of them.
class DownloadRun {
public:
    DownloadRun(StreamCatalog& catalog, Muxer& muxer, RunConfig config, RunObserver* observer = nullptr);

    RunOutcome execute(const std::string& locator, const ResolutionChooser& chooser);

    RunState state() const { return state_; }

private:
    void enter(RunState state);
    void checkInterrupt() const;

    StreamCatalog& catalog_;
    Muxer& muxer_;
    RunConfig config_;
    RunObserver* observer_;
    RunState state_ = RunState::Resolving;
};

} // namespace ytmux

#endif // YTMUX_DOWNLOAD_RUN_H
