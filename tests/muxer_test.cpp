#include <gtest/gtest.h>
#include <filesystem>

#include "test_helpers.h"
#include "ytmux/errors.h"
#include "ytmux/interrupt.h"
#include "ytmux/muxer.h"

using namespace ytmux;
using namespace ytmux_test;

namespace {

// Writes an executable /bin/sh script standing in for ffmpeg.
fs::path writeScript(const fs::path& dir, const std::string& name, const std::string& body) {
    fs::path script = dir / name;
    writeFile(script, "#!/bin/sh\n" + body);
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);
    return script;
}

} // namespace

class FfmpegMuxerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        resetInterrupt();
        videoPath = dir.path() / "abc_video.mp4";
        audioPath = dir.path() / "abc_audio.mp4";
        outPath = dir.path() / "my title_720p.mp4";
        writeFile(videoPath, "v");
        writeFile(audioPath, "a");
    }

    void TearDown() override { resetInterrupt(); }

    TempDir dir;
    fs::path videoPath;
    fs::path audioPath;
    fs::path outPath;
};

TEST_F(FfmpegMuxerTest, ArgumentsCopyVideoAndReencodeAudio)
{
    FfmpegMuxer muxer("ffmpeg", "aac");
    auto args = muxer.buildArguments(videoPath, audioPath, outPath);

    std::vector<std::string> expected = {
        "ffmpeg", "-hide_banner", "-y",
        "-i", videoPath.string(),
        "-i", audioPath.string(),
        "-c:v", "copy",
        "-c:a", "aac",
        "-strict", "experimental",
        outPath.string()};
    EXPECT_EQ(args, expected);
}

TEST_F(FfmpegMuxerTest, SuccessfulRunWritesOutput)
{
    // Records its arguments and writes the last one as the output file.
    fs::path argsLog = dir.path() / "args.log";
    fs::path fake = writeScript(dir.path(), "fake-ffmpeg",
        "for a in \"$@\"; do echo \"$a\" >> '" + argsLog.string() + "'; last=\"$a\"; done\n"
        "echo 'noisy progress output'\n"
        "printf muxed > \"$last\"\n");

    FfmpegMuxer muxer(fake.string(), "aac");
    ASSERT_NO_THROW(muxer.mux(videoPath, audioPath, outPath));

    EXPECT_EQ(readFile(outPath), "muxed");
    const std::string logged = readFile(argsLog);
    EXPECT_NE(logged.find("-c:v\ncopy\n"), std::string::npos);
    EXPECT_NE(logged.find("-c:a\naac\n"), std::string::npos);
    EXPECT_NE(logged.find(outPath.string()), std::string::npos);
}

TEST_F(FfmpegMuxerTest, NonZeroExitIsMuxFailedWithDiagnostics)
{
    fs::path fake = writeScript(dir.path(), "failing-ffmpeg",
        "for a in \"$@\"; do last=\"$a\"; done\n"
        "printf partial > \"$last\"\n"
        "echo 'Invalid data found when processing input' >&2\n"
        "exit 3\n");

    FfmpegMuxer muxer(fake.string(), "aac");
    try {
        muxer.mux(videoPath, audioPath, outPath);
        FAIL() << "expected MuxFailed";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MuxFailed);
        const std::string message = e.what();
        EXPECT_NE(message.find("exited with code 3"), std::string::npos) << message;
        EXPECT_NE(message.find("Invalid data found"), std::string::npos) << message;
    }

    EXPECT_FALSE(fs::exists(outPath));
    EXPECT_TRUE(fs::exists(videoPath));
    EXPECT_TRUE(fs::exists(audioPath));
}

TEST_F(FfmpegMuxerTest, FailedMuxLeavesPreexistingOutputAlone)
{
    writeFile(outPath, "merged by an earlier run");
    fs::path fake = writeScript(dir.path(), "rejecting-ffmpeg",
        "echo 'Invalid data found when processing input' >&2\n"
        "exit 1\n");

    FfmpegMuxer muxer(fake.string(), "aac");
    try {
        muxer.mux(videoPath, audioPath, outPath);
        FAIL() << "expected MuxFailed";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MuxFailed);
    }

    ASSERT_TRUE(fs::exists(outPath));
    EXPECT_EQ(readFile(outPath), "merged by an earlier run");
}

TEST_F(FfmpegMuxerTest, FailedMuxRemovesOutputItOverwrote)
{
    writeFile(outPath, "merged by an earlier run");
    fs::path fake = writeScript(dir.path(), "truncating-ffmpeg",
        "for a in \"$@\"; do last=\"$a\"; done\n"
        "printf half > \"$last\"\n"
        "exit 1\n");

    FfmpegMuxer muxer(fake.string(), "aac");
    EXPECT_THROW(muxer.mux(videoPath, audioPath, outPath), PipelineError);
    EXPECT_FALSE(fs::exists(outPath));
}

TEST_F(FfmpegMuxerTest, InterruptAfterSuccessfulMuxKeepsOutput)
{
    fs::path fake = writeScript(dir.path(), "ok-ffmpeg",
        "for a in \"$@\"; do last=\"$a\"; done\n"
        "printf muxed > \"$last\"\n");
    requestInterrupt();

    FfmpegMuxer muxer(fake.string(), "aac");
    EXPECT_NO_THROW(muxer.mux(videoPath, audioPath, outPath));
    EXPECT_EQ(readFile(outPath), "muxed");
}

TEST_F(FfmpegMuxerTest, InterruptWithFailedMuxIsCancellation)
{
    fs::path fake = writeScript(dir.path(), "killed-ffmpeg",
        "for a in \"$@\"; do last=\"$a\"; done\n"
        "printf half > \"$last\"\n"
        "exit 255\n");
    requestInterrupt();

    FfmpegMuxer muxer(fake.string(), "aac");
    EXPECT_THROW(muxer.mux(videoPath, audioPath, outPath), RunCancelled);
    EXPECT_FALSE(fs::exists(outPath));
}

TEST_F(FfmpegMuxerTest, MissingBinaryIsMuxFailed)
{
    FfmpegMuxer muxer((dir.path() / "no-such-ffmpeg").string(), "aac");
    try {
        muxer.mux(videoPath, audioPath, outPath);
        FAIL() << "expected MuxFailed";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MuxFailed);
    }
    EXPECT_FALSE(fs::exists(outPath));
}

TEST_F(FfmpegMuxerTest, CapturedOutputIsBounded)
{
    fs::path fake = writeScript(dir.path(), "chatty-ffmpeg",
        "i=0\n"
        "while [ $i -lt 2000 ]; do echo 'frame=   42 fps=0.0 q=-1.0 size=       0kB time=00:00:00.00'; i=$((i+1)); done\n"
        "echo 'final error line'\n"
        "exit 1\n");

    FfmpegMuxer muxer(fake.string(), "aac");
    try {
        muxer.mux(videoPath, audioPath, outPath);
        FAIL() << "expected MuxFailed";
    } catch (const PipelineError& e) {
        const std::string message = e.what();
        EXPECT_LT(message.size(), FfmpegMuxer::kCaptureLimit + 256);
        EXPECT_NE(message.find("final error line"), std::string::npos);
    }
}

TEST_F(FfmpegMuxerTest, ProbeRecognizesFfmpegVersionOutput)
{
    fs::path good = writeScript(dir.path(), "ffmpeg-ok", "echo 'ffmpeg version 6.1 Copyright (c) 2000-2023'\n");
    fs::path bad = writeScript(dir.path(), "not-ffmpeg", "echo 'hello'\n");

    EXPECT_TRUE(FfmpegMuxer(good.string()).probe());
    EXPECT_FALSE(FfmpegMuxer(bad.string()).probe());
    EXPECT_FALSE(FfmpegMuxer((dir.path() / "missing").string()).probe());
}

TEST(ShellQuoteTest, EscapesSingleQuotes)
{
    EXPECT_EQ(shellQuote("plain"), "'plain'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(shellQuote("$(rm -rf /)"), "'$(rm -rf /)'");
}
