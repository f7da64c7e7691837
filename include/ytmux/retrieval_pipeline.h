#ifndef YTMUX_RETRIEVAL_PIPELINE_H
#define YTMUX_RETRIEVAL_PIPELINE_H

#include "ytmux/artifact_lifecycle.h"
#include "ytmux/run_events.h"
#include "ytmux/stream_catalog.h"
#include "ytmux/video_info.h"

namespace ytmux {

// Downloads the selected video and then the selected audio descriptor into
// the lifecycle's temporary paths. Strictly sequential.
class RetrievalPipeline {
public:
    RetrievalPipeline(StreamCatalog& catalog, RunObserver* observer = nullptr);

    // Throws PipelineError(RetrievalFailed), or RunCancelled when the failure
    // was caused by an interrupt. Already written files stay on disk.
    void run(const Selection& selection, const ArtifactLifecycle& artifacts);

private:
    void fetch(const StreamDescriptor& descriptor, const std::filesystem::path& destination);

    StreamCatalog& catalog_;
    RunObserver* observer_;
};

} // namespace ytmux

#endif // YTMUX_RETRIEVAL_PIPELINE_H
