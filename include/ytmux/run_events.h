#ifndef YTMUX_RUN_EVENTS_H
#define YTMUX_RUN_EVENTS_H

#include "ytmux/video_info.h"
#include <filesystem>

namespace ytmux {

enum class RunState {
    Resolving,
    Resolved,
    Selecting,
    Retrieving,
    Muxing,
    Cleaning,
    Done,
    Failed,
    Cancelled
};

const char* toString(RunState state);

// Receives lifecycle events from a run. Every callback defaults to a no-op so
// presentation code only overrides what it displays.
class RunObserver {
public:
    virtual ~RunObserver() = default;

    virtual void stateEntered(RunState /*state*/) {}
    virtual void assetResolved(const VideoDetails& /*details*/) {}
    virtual void retrievalStarted(StreamKind /*kind*/, const std::filesystem::path& /*destination*/) {}
    virtual void retrievalProgress(StreamKind /*kind*/, long long /*current*/, long long /*total*/) {}
    virtual void retrievalFinished(StreamKind /*kind*/) {}
};

} // namespace ytmux

#endif // YTMUX_RUN_EVENTS_H
