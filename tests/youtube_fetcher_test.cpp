#include <gtest/gtest.h>

#include "ytmux/resolution_selector.h"
#include "ytmux/youtube_fetcher.h"

using namespace ytmux;

namespace {

const char* kPlayerResponse = R"json({
  "videoDetails": {
    "videoId": "dQw4w9WgXcQ",
    "title": "Never Gonna Give You Up",
    "author": "Rick Astley",
    "lengthSeconds": "213",
    "viewCount": "1234567"
  },
  "microformat": {
    "playerMicroformatRenderer": { "publishDate": "2009-10-24T23:57:33-07:00" }
  },
  "streamingData": {
    "formats": [
      { "itag": 18, "url": "https://r.example/18", "mimeType": "video/mp4; codecs=\"avc1.42001E, mp4a.40.2\"",
        "qualityLabel": "360p", "bitrate": 500000 }
    ],
    "adaptiveFormats": [
      { "itag": 299, "url": "https://r.example/299", "mimeType": "video/mp4; codecs=\"avc1.64002a\"",
        "qualityLabel": "1080p60", "width": 1920, "height": 1080, "fps": 60, "bitrate": 6000000,
        "contentLength": "98765432" },
      { "itag": 248, "url": "https://r.example/248", "mimeType": "video/webm; codecs=\"vp9\"",
        "qualityLabel": "1080p", "height": 1080, "bitrate": 2600000 },
      { "itag": 136, "url": "https://r.example/136", "mimeType": "video/mp4; codecs=\"avc1.4d401f\"",
        "height": 720, "bitrate": 1500000 },
      { "itag": 137, "signatureCipher": "s=ABC&sp=sig", "mimeType": "video/mp4; codecs=\"avc1.640028\"",
        "qualityLabel": "1080p", "bitrate": 4000000 },
      { "itag": 140, "url": "https://r.example/140", "mimeType": "audio/mp4; codecs=\"mp4a.40.2\"",
        "bitrate": 130000, "averageBitrate": 129000 },
      { "itag": 139, "signatureCipher": "s=XYZ&sp=sig&url=https%3A%2F%2Fr.example%2F139",
        "mimeType": "audio/mp4; codecs=\"mp4a.40.5\"", "bitrate": 49000 }
    ]
  }
})json";

} // namespace

TEST(ExtractVideoIdTest, RecognizesCommonLocators)
{
    EXPECT_EQ(extractVideoId("https://www.youtube.com/watch?v=dQw4w9WgXcQ&t=42"), "dQw4w9WgXcQ");
    EXPECT_EQ(extractVideoId("https://youtu.be/dQw4w9WgXcQ"), "dQw4w9WgXcQ");
    EXPECT_EQ(extractVideoId("https://www.youtube.com/embed/dQw4w9WgXcQ"), "dQw4w9WgXcQ");
    EXPECT_EQ(extractVideoId("https://youtube.com/shorts/dQw4w9WgXcQ"), "dQw4w9WgXcQ");
    EXPECT_EQ(extractVideoId("dQw4w9WgXcQ"), "dQw4w9WgXcQ");
}

TEST(ExtractVideoIdTest, RejectsLocatorsWithoutId)
{
    EXPECT_EQ(extractVideoId("https://example.com/video"), "");
    EXPECT_EQ(extractVideoId(""), "");
    EXPECT_EQ(extractVideoId("short"), "");
}

TEST(NormalizeResolutionLabelTest, StripsFrameRateSuffix)
{
    EXPECT_EQ(normalizeResolutionLabel("1080p60"), "1080p");
    EXPECT_EQ(normalizeResolutionLabel("720p"), "720p");
    EXPECT_EQ(normalizeResolutionLabel("2160p60 HDR"), "2160p");
    EXPECT_EQ(normalizeResolutionLabel("tiny"), "");
}

TEST(ExtractPlayerResponseTest, FindsBalancedObjectInPage)
{
    std::string html = "<script>var ytInitialPlayerResponse = {\"a\":{\"b\":\"}{\"},\"c\":1};var other = {};</script>";
    auto json = extractPlayerResponse(html);
    ASSERT_TRUE(json.has_value());
    EXPECT_EQ(json.value(), "{\"a\":{\"b\":\"}{\"},\"c\":1}");

    EXPECT_FALSE(extractPlayerResponse("<html>nothing here</html>").has_value());
    EXPECT_FALSE(extractPlayerResponse("ytInitialPlayerResponse = {\"open\": {").has_value());
}

TEST(ParsePlayerResponseTest, ReadsDetailsAndAdaptiveDescriptors)
{
    auto details = parsePlayerResponse(kPlayerResponse, "dQw4w9WgXcQ");
    ASSERT_TRUE(details.has_value());

    EXPECT_EQ(details->id, "dQw4w9WgXcQ");
    EXPECT_EQ(details->title, "Never Gonna Give You Up");
    EXPECT_EQ(details->author, "Rick Astley");
    EXPECT_EQ(details->lengthSeconds, 213);
    EXPECT_EQ(details->viewCount, 1234567);
    EXPECT_EQ(details->publishDate, "2009-10-24");

    // Muxed format 18 and the undecipherable itag 137 are left out.
    ASSERT_EQ(details->descriptors.size(), 5u);
    const auto& hd = details->descriptors[0];
    EXPECT_EQ(hd.itag, 299);
    EXPECT_EQ(hd.kind, StreamKind::VideoOnly);
    EXPECT_EQ(hd.container, "mp4");
    EXPECT_EQ(hd.codecs, "avc1.64002a");
    EXPECT_EQ(hd.resolution.value_or(""), "1080p");
    EXPECT_EQ(hd.contentLength.value_or(0), 98765432);

    EXPECT_EQ(details->descriptors[1].container, "webm");
    EXPECT_EQ(details->descriptors[2].resolution.value_or(""), "720p");

    const auto& aac = details->descriptors[3];
    EXPECT_EQ(aac.kind, StreamKind::AudioOnly);
    EXPECT_EQ(aac.bitrate, 129000);
    EXPECT_FALSE(aac.resolution.has_value());

    EXPECT_EQ(details->descriptors[4].url, "https://r.example/139");
}

TEST(ParsePlayerResponseTest, FeedsResolutionSelection)
{
    auto details = parsePlayerResponse(kPlayerResponse, "dQw4w9WgXcQ");
    ASSERT_TRUE(details.has_value());

    EXPECT_EQ(availableResolutions(details->descriptors), (std::vector<std::string>{"1080p", "720p"}));
    Selection selection = resolveDescriptors(details->descriptors, "1080p");
    EXPECT_EQ(selection.video.itag, 299);
    EXPECT_EQ(selection.audio.itag, 140);
}

TEST(ParsePlayerResponseTest, RejectsGarbage)
{
    EXPECT_FALSE(parsePlayerResponse("not json", "id").has_value());
    EXPECT_FALSE(parsePlayerResponse("[1,2,3]", "id").has_value());
    EXPECT_FALSE(parsePlayerResponse("{}", "id").has_value());
}
