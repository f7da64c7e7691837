#include "ytmux/download_run.h"
#include "ytmux/filenames.h"
#include "ytmux/interrupt.h"
#include "ytmux/resolution_selector.h"
#include "ytmux/retrieval_pipeline.h"
#include <system_error>
#include <utility>

namespace ytmux {

DownloadRun::DownloadRun(StreamCatalog& catalog, Muxer& muxer, RunConfig config, RunObserver* observer)
    : catalog_(catalog), muxer_(muxer), config_(std::move(config)), observer_(observer) {}

void DownloadRun::enter(RunState state) {
    state_ = state;
    if (observer_) observer_->stateEntered(state);
}

void DownloadRun::checkInterrupt() const {
    if (interruptRequested()) {
        throw RunCancelled();
    }
}

RunOutcome DownloadRun::execute(const std::string& locator, const ResolutionChooser& chooser) {
    RunOutcome outcome;
    enter(RunState::Resolving);

    try {
        VideoDetails details = catalog_.query(locator);
        outcome.details = details;
        enter(RunState::Resolved);
        if (observer_) observer_->assetResolved(details);
        checkInterrupt();

        enter(RunState::Selecting);
        const std::vector<std::string> available =
            availableResolutions(details.descriptors, config_.streamContainer);
        if (available.empty()) {
            throw PipelineError(ErrorKind::StreamsUnavailable,
                                "No adaptive " + config_.streamContainer + " video streams for " + details.id);
        }
        const std::string label = chooser(available);
        const Selection selection = resolveDescriptors(details.descriptors, label, config_.streamContainer);
        checkInterrupt();

        enter(RunState::Retrieving);
        // Nothing is written to disk before this point.
        std::error_code ec;
        std::filesystem::create_directories(config_.destination, ec);
        if (ec) {
            throw PipelineError(ErrorKind::RetrievalFailed,
                                "Cannot create " + config_.destination.string() + ": " + ec.message());
        }
        ArtifactLifecycle artifacts(tempVideoPath(config_.destination, details.id, selection.video.container),
                                    tempAudioPath(config_.destination, details.id, selection.audio.container));
        RetrievalPipeline(catalog_, observer_).run(selection, artifacts);

        enter(RunState::Muxing);
        const std::filesystem::path output =
            outputPath(config_.destination, details.title, label, config_.outputContainer);
        muxer_.mux(artifacts.videoPath(), artifacts.audioPath(), output);

        enter(RunState::Cleaning);
        outcome.cleanupIssues = artifacts.cleanup();
        outcome.outputPath = output;

        enter(RunState::Done);
    } catch (const PipelineError& e) {
        outcome.failedIn = state_;
        // Failures caused by Ctrl-C are reported as a cancellation.
        if (interruptRequested()) {
            outcome.cancelReason = RunCancelled().what();
            enter(RunState::Cancelled);
        } else {
            outcome.error = e;
            enter(RunState::Failed);
        }
    } catch (const RunCancelled& e) {
        outcome.cancelReason = e.what();
        outcome.failedIn = state_;
        enter(RunState::Cancelled);
    }

    outcome.state = state_;
    return outcome;
}

int exitStatus(const RunOutcome& outcome) {
    switch (outcome.state) {
        case RunState::Done:
        case RunState::Cancelled:
            return 0;
        default:
            return 1;
    }
}

} // namespace ytmux
