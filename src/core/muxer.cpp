#include "ytmux/muxer.h"
#include "ytmux/errors.h"
#include "ytmux/interrupt.h"
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdio> // For popen
#include <filesystem>
#include <system_error>
#include <utility>
#include <sys/wait.h>

namespace ytmux {

namespace {

// Keeps only the last `limit` bytes appended to it.
class TailBuffer {
public:
    explicit TailBuffer(std::size_t limit) : limit_(limit) {}

    void append(const char* data) {
        text_ += data;
        if (text_.size() > limit_) {
            text_.erase(0, text_.size() - limit_);
            truncated_ = true;
        }
    }

    std::string str() const { return truncated_ ? "[...]\n" + text_ : text_; }

private:
    std::size_t limit_;
    std::string text_;
    bool truncated_ = false;
};

// Owns a popen() stream; the child is reaped on every exit path.
class ProcessPipe {
public:
    explicit ProcessPipe(const std::string& command) : pipe_(popen(command.c_str(), "r")) {}
    ~ProcessPipe() {
        if (pipe_) pclose(pipe_);
    }
    ProcessPipe(const ProcessPipe&) = delete;
    ProcessPipe& operator=(const ProcessPipe&) = delete;

    bool isOpen() const { return pipe_ != nullptr; }

    void drainInto(TailBuffer& sink) {
        std::array<char, 512> buffer;
        while (true) {
            if (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe_) != nullptr) {
                sink.append(buffer.data());
                continue;
            }
            if (ferror(pipe_) && errno == EINTR) {
                clearerr(pipe_);
                continue;
            }
            break;
        }
    }

    // Wait status as returned by pclose(), -1 on failure.
    int close() {
        int status = pclose(pipe_);
        pipe_ = nullptr;
        return status;
    }

private:
    FILE* pipe_;
};

std::string joinCommand(const std::vector<std::string>& args) {
    std::string command;
    for (const auto& arg : args) {
        if (!command.empty()) command += ' ';
        command += shellQuote(arg);
    }
    return command + " 2>&1";
}

// What was at the output path before ffmpeg ran. A failed mux only removes
// the file when ffmpeg created or rewrote it.
class OutputSnapshot {
public:
    explicit OutputSnapshot(const std::filesystem::path& output) : output_(output) {
        std::error_code ec;
        existed_ = std::filesystem::is_regular_file(output_, ec);
        if (existed_) {
            size_ = std::filesystem::file_size(output_, ec);
            modified_ = std::filesystem::last_write_time(output_, ec);
        }
    }

    bool touched() const {
        std::error_code ec;
        if (!std::filesystem::exists(output_, ec)) return false;
        if (!existed_) return true;
        return std::filesystem::file_size(output_, ec) != size_ ||
               std::filesystem::last_write_time(output_, ec) != modified_;
    }

    void removePartialOutput() const {
        if (!touched()) return;
        std::error_code ec;
        std::filesystem::remove(output_, ec); // best effort
    }

private:
    std::filesystem::path output_;
    bool existed_ = false;
    std::uintmax_t size_ = 0;
    std::filesystem::file_time_type modified_{};
};

} // namespace

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += '\'';
    return quoted;
}

FfmpegMuxer::FfmpegMuxer(std::string binary, std::string audioCodec)
    : binary_(std::move(binary)), audioCodec_(std::move(audioCodec)) {}

std::vector<std::string> FfmpegMuxer::buildArguments(const std::filesystem::path& video,
                                                     const std::filesystem::path& audio,
                                                     const std::filesystem::path& output) const {
    return {
        binary_, "-hide_banner", "-y",
        "-i", video.string(),
        "-i", audio.string(),
        "-c:v", "copy",
        "-c:a", audioCodec_,
        "-strict", "experimental",
        output.string()
    };
}

void FfmpegMuxer::mux(const std::filesystem::path& video,
                      const std::filesystem::path& audio,
                      const std::filesystem::path& output) {
    const std::string command = joinCommand(buildArguments(video, audio, output));
    const OutputSnapshot before(output);

    TailBuffer captured(kCaptureLimit);
    int status = -1;
    {
        ProcessPipe pipe(command);
        if (!pipe.isOpen()) {
            throw PipelineError(ErrorKind::MuxFailed,
                                "Failed to launch " + binary_ + ": " +
                                std::error_code(errno, std::generic_category()).message());
        }
        pipe.drainInto(captured);
        status = pipe.close();
    }

    if (status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        // A complete file stands even if Ctrl-C arrived after ffmpeg finished.
        return;
    }

    before.removePartialOutput();
    // ffmpeg shares the terminal and dies from the same SIGINT.
    if (interruptRequested()) {
        throw RunCancelled();
    }
    if (status == -1) {
        throw PipelineError(ErrorKind::MuxFailed, "Could not collect the exit status of " + binary_);
    }
    if (WIFSIGNALED(status)) {
        throw PipelineError(ErrorKind::MuxFailed,
                            binary_ + " was terminated by signal " + std::to_string(WTERMSIG(status)) +
                            "\n" + captured.str());
    }
    int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exitCode == 127) {
        throw PipelineError(ErrorKind::MuxFailed,
                            binary_ + " could not be started (is it installed and in PATH?)\n" + captured.str());
    }
    throw PipelineError(ErrorKind::MuxFailed,
                        binary_ + " exited with code " + std::to_string(exitCode) + "\n" + captured.str());
}

bool FfmpegMuxer::probe() const {
    TailBuffer captured(kCaptureLimit);
    ProcessPipe pipe(shellQuote(binary_) + " -version 2>&1");
    if (!pipe.isOpen()) {
        return false;
    }
    pipe.drainInto(captured);
    int status = pipe.close();
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return false;
    }
    const std::string output = captured.str();
    return output.find("ffmpeg version") != std::string::npos || output.find("libavutil") != std::string::npos;
}

} // namespace ytmux
