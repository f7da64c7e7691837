#ifndef YTMUX_RESOLUTION_SELECTOR_H
#define YTMUX_RESOLUTION_SELECTOR_H

#include "ytmux/video_info.h"
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace ytmux {

enum class ChoiceStatus {
    Accepted,
    Malformed,  // not an integer
    OutOfRange  // integer outside 1..count
};

struct ChoiceResult {
    ChoiceStatus status = ChoiceStatus::Malformed;
    std::size_t index = 0; // zero based, valid when Accepted

    bool accepted() const { return status == ChoiceStatus::Accepted; }
};

// Distinct resolution labels of the video-only descriptors in `container`,
// highest first. The first descriptor seen for a label backs it.
std::vector<std::string> availableResolutions(const std::vector<StreamDescriptor>& descriptors,
                                              const std::string& container = "mp4");

// Interprets one line of user input as a 1-based ordinal into a list of `count` entries.
ChoiceResult parseChoice(const std::string& raw, std::size_t count);

// Label at a 1-based ordinal. Throws PipelineError(InvalidChoice).
std::string selectResolution(const std::vector<std::string>& available, const std::string& choice);

// Prints the numbered list and reads ordinals from `in` until one is valid.
// Malformed lines re-prompt silently, out of range ones with a message.
// Throws RunCancelled on end of input or interrupt.
std::string promptResolution(const std::vector<std::string>& available,
                             std::istream& in,
                             std::ostream& out);

// First matching video descriptor plus the highest bitrate audio descriptor.
// Throws PipelineError(StreamsUnavailable) if either is missing.
Selection resolveDescriptors(const std::vector<StreamDescriptor>& descriptors,
                             const std::string& resolutionLabel,
                             const std::string& container = "mp4");

} // namespace ytmux

#endif // YTMUX_RESOLUTION_SELECTOR_H
