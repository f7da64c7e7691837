#include <gtest/gtest.h>
#include <cstdlib>
#include <optional>
#include <string>

#include "ytmux/config.h"

using namespace ytmux;

namespace {

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) previous_ = std::string(old);
        if (value) setenv(name, value, 1);
        else unsetenv(name);
    }
    ~EnvGuard() {
        if (previous_) setenv(name_, previous_->c_str(), 1);
        else unsetenv(name_);
    }

private:
    const char* name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST(ConfigTest, MediaDirectoryPrefersXdgThenHome)
{
    {
        EnvGuard xdg("XDG_VIDEOS_DIR", "/srv/media");
        EnvGuard home("HOME", "/home/tester");
        EXPECT_EQ(defaultMediaDirectory(), std::filesystem::path("/srv/media"));
    }
    {
        EnvGuard xdg("XDG_VIDEOS_DIR", nullptr);
        EnvGuard home("HOME", "/home/tester");
        EXPECT_EQ(defaultMediaDirectory(), std::filesystem::path("/home/tester/Videos"));
    }
}

TEST(ConfigTest, DefaultsAndFfmpegOverride)
{
    {
        EnvGuard ffmpeg("YTMUX_FFMPEG", nullptr);
        RunConfig cfg = loadRunConfig();
        EXPECT_EQ(cfg.ffmpegBinary, "ffmpeg");
        EXPECT_EQ(cfg.audioCodec, "aac");
        EXPECT_EQ(cfg.outputContainer, "mp4");
        EXPECT_FALSE(cfg.destination.empty());
    }
    {
        EnvGuard ffmpeg("YTMUX_FFMPEG", "/opt/ffmpeg/bin/ffmpeg");
        EXPECT_EQ(loadRunConfig().ffmpegBinary, "/opt/ffmpeg/bin/ffmpeg");
    }
}
