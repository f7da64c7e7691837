#ifndef YTMUX_VIDEO_INFO_H
#define YTMUX_VIDEO_INFO_H

#include <string>
#include <vector>
#include <optional>

namespace ytmux {

enum class StreamKind {
    VideoOnly,
    AudioOnly
};

// One adaptive representation of an asset. Immutable once the catalog built it.
struct StreamDescriptor {
    StreamKind kind = StreamKind::VideoOnly;
    int itag = 0;
    std::string url;
    std::string mimeType;
    std::string codecs;
    std::string container; // MIME subtype, e.g. "mp4" or "webm"

    std::optional<std::string> resolution; // "720p", video only
    long bitrate = 0;                      // bits per second

    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> fps;
    std::optional<long long> contentLength;

    bool isVideo() const { return kind == StreamKind::VideoOnly; }
    bool isAudio() const { return kind == StreamKind::AudioOnly; }
};

struct VideoDetails {
    std::string id;
    std::string title;
    std::string author;
    long lengthSeconds = 0;
    long long viewCount = 0;
    std::string publishDate; // "YYYY-MM-DD" as served, may be empty

    std::vector<StreamDescriptor> descriptors; // adaptive streams only
};

// The pair handed to the retrieval pipeline.
struct Selection {
    StreamDescriptor video;
    StreamDescriptor audio;
};

} // namespace ytmux

#endif // YTMUX_VIDEO_INFO_H
