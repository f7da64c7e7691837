#include "ytmux/run_events.h"

namespace ytmux {

const char* toString(RunState state) {
    switch (state) {
        case RunState::Resolving:  return "Resolving";
        case RunState::Resolved:   return "Resolved";
        case RunState::Selecting:  return "Selecting";
        case RunState::Retrieving: return "Retrieving";
        case RunState::Muxing:     return "Muxing";
        case RunState::Cleaning:   return "Cleaning";
        case RunState::Done:       return "Done";
        case RunState::Failed:     return "Failed";
        case RunState::Cancelled:  return "Cancelled";
    }
    return "Unknown";
}

} // namespace ytmux
