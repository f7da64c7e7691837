#ifndef YTMUX_YOUTUBE_FETCHER_H
#define YTMUX_YOUTUBE_FETCHER_H

#include "ytmux/video_info.h"
#include <string>
#include <optional>
#include <functional> // For std::function

namespace ytmux {

class YouTubeFetcher {
public:
    YouTubeFetcher() = default;

    // Progress callback: current_bytes_downloaded, total_bytes_expected (can be 0 if unknown)
    using ProgressCallback = std::function<void(long long, long long)>;
    // Polled for every received chunk and about once a second while a
    // transfer is idle; returning true aborts the transfer.
    using AbortCheck = std::function<bool()>;

    std::optional<VideoDetails> fetchVideoDetails(const std::string& videoUrl, AbortCheck abortCheck = nullptr);

    // Streams the descriptor's bytes to outputFilePath. Whatever was written
    // before a failure is left on disk.
    bool downloadStream(const StreamDescriptor& stream,
                        const std::string& outputFilePath,
                        ProgressCallback progressCallback = nullptr,
                        AbortCheck abortCheck = nullptr);

    const std::string& lastError() const { return lastError_; }

private:
    std::string lastError_;
};

// Extracts the 11 character video ID from watch, youtu.be, embed and shorts
// URLs, or accepts a bare ID. Returns an empty string if none is found.
std::string extractVideoId(const std::string& locator);

// Locates the ytInitialPlayerResponse object inside a watch page.
std::optional<std::string> extractPlayerResponse(const std::string& htmlContent);

// Parses a player response document. Only adaptive formats become descriptors.
std::optional<VideoDetails> parsePlayerResponse(const std::string& jsonText, const std::string& videoId);

// "1080p60" -> "1080p"; empty when the label has no leading height.
std::string normalizeResolutionLabel(const std::string& qualityLabel);

} // namespace ytmux

#endif // YTMUX_YOUTUBE_FETCHER_H
