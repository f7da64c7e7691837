#ifndef YTMUX_MUXER_H
#define YTMUX_MUXER_H

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace ytmux {

class Muxer {
public:
    virtual ~Muxer() = default;

    // Combines the video and audio inputs into output.
    // Throws PipelineError(MuxFailed); output does not exist afterwards.
    virtual void mux(const std::filesystem::path& video,
                     const std::filesystem::path& audio,
                     const std::filesystem::path& output) = 0;
};

// Runs the ffmpeg command line: stream copy for video, re-encode for audio.
class FfmpegMuxer : public Muxer {
public:
    // Bytes of merged stdout/stderr kept for error reports (the tail is kept).
    static constexpr std::size_t kCaptureLimit = 16 * 1024;

    explicit FfmpegMuxer(std::string binary = "ffmpeg", std::string audioCodec = "aac");

    void mux(const std::filesystem::path& video,
             const std::filesystem::path& audio,
             const std::filesystem::path& output) override;

    std::vector<std::string> buildArguments(const std::filesystem::path& video,
                                            const std::filesystem::path& audio,
                                            const std::filesystem::path& output) const;

    // True if `<binary> -version` runs and identifies itself as ffmpeg.
    bool probe() const;

private:
    std::string binary_;
    std::string audioCodec_;
};

// Single-quotes an argument for /bin/sh.
std::string shellQuote(const std::string& arg);

} // namespace ytmux

#endif // YTMUX_MUXER_H
