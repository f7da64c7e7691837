#include "ytmux/config.h"
#include <cstdlib> // For std::getenv

namespace ytmux {

namespace {

const char* nonEmptyEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}

} // namespace

std::filesystem::path defaultMediaDirectory() {
    if (const char* xdg = nonEmptyEnv("XDG_VIDEOS_DIR")) {
        return std::filesystem::path(xdg);
    }
    if (const char* home = nonEmptyEnv("HOME")) {
        return std::filesystem::path(home) / "Videos";
    }
    return std::filesystem::path("Videos");
}

RunConfig loadRunConfig() {
    RunConfig cfg;
    cfg.destination = defaultMediaDirectory();
    if (const char* ffmpeg = nonEmptyEnv("YTMUX_FFMPEG")) {
        cfg.ffmpegBinary = ffmpeg;
    }
    return cfg;
}

} // namespace ytmux
