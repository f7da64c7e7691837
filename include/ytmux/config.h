#ifndef YTMUX_CONFIG_H
#define YTMUX_CONFIG_H

#include <filesystem>
#include <string>

namespace ytmux {

struct RunConfig {
    // Directory receiving both temporaries and the muxed output
    std::filesystem::path destination;
    // Muxer binary, looked up in PATH when not absolute
    std::string ffmpegBinary = "ffmpeg";
    // Codec the audio track is re-encoded to; video is always stream-copied
    std::string audioCodec = "aac";
    // Container of the muxed output
    std::string outputContainer = "mp4";
    // Only descriptors in this container are considered for selection
    std::string streamContainer = "mp4";
};

// Platform media directory: $XDG_VIDEOS_DIR, else $HOME/Videos, else ./Videos.
std::filesystem::path defaultMediaDirectory();

// Defaults overridden by environment (YTMUX_FFMPEG).
RunConfig loadRunConfig();

} // namespace ytmux

#endif // YTMUX_CONFIG_H
