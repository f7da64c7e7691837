#include "ytmux/retrieval_pipeline.h"
#include "ytmux/errors.h"
#include "ytmux/interrupt.h"

namespace ytmux {

RetrievalPipeline::RetrievalPipeline(StreamCatalog& catalog, RunObserver* observer)
    : catalog_(catalog), observer_(observer) {}

void RetrievalPipeline::run(const Selection& selection, const ArtifactLifecycle& artifacts) {
    // Strictly one after the other; the audio request starts only once the
    // video file is complete.
    fetch(selection.video, artifacts.videoPath());
    if (interruptRequested()) {
        throw RunCancelled();
    }
    fetch(selection.audio, artifacts.audioPath());
}

void RetrievalPipeline::fetch(const StreamDescriptor& descriptor, const std::filesystem::path& destination) {
    const StreamKind kind = descriptor.kind;
    if (observer_) observer_->retrievalStarted(kind, destination);

    try {
        catalog_.retrieve(descriptor, destination, [this, kind](long long current, long long total) {
            if (observer_) observer_->retrievalProgress(kind, current, total);
        });
    } catch (const PipelineError&) {
        // An aborted transfer surfaces as a transport error.
        if (interruptRequested()) {
            throw RunCancelled();
        }
        throw;
    }

    if (interruptRequested()) {
        throw RunCancelled();
    }
    if (observer_) observer_->retrievalFinished(kind);
}

} // namespace ytmux
