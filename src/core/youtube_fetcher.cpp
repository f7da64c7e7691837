#include "ytmux/youtube_fetcher.h"
#include <iostream>
#include <fstream>
#include <regex>
#include <cctype>
#include <nlohmann/json.hpp>
#include <cpr/cpr.h>
#include <cpr/util.h> // For cpr::util::urlDecode

namespace ytmux {

namespace {

const char* kUserAgent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36";

// Helper to safely get string from json
std::string safeGetString(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

// Helper to safely get long from json (numbers are often served as strings)
long long safeGetLong(const nlohmann::json& j, const char* key, long long default_val = 0) {
    if (j.contains(key)) {
        if (j[key].is_number()) {
            return j[key].get<long long>();
        } else if (j[key].is_string()) {
            try { return std::stoll(j[key].get<std::string>()); } catch (const std::exception&) {}
        }
    }
    return default_val;
}

int safeGetInt(const nlohmann::json& j, const char* key, int default_val = 0) {
    if (j.contains(key)) {
        if (j[key].is_number()) {
            return j[key].get<int>();
        } else if (j[key].is_string()) {
            try { return std::stoi(j[key].get<std::string>()); } catch (const std::exception&) {}
        }
    }
    return default_val;
}

// "video/mp4; codecs=\"avc1.640028\"" -> "mp4"
std::string containerFromMimeType(const std::string& mimeType) {
    size_t slash = mimeType.find('/');
    if (slash == std::string::npos) {
        return "";
    }
    size_t end = mimeType.find(';', slash);
    std::string subtype = mimeType.substr(slash + 1, end == std::string::npos ? std::string::npos : end - slash - 1);
    while (!subtype.empty() && std::isspace(static_cast<unsigned char>(subtype.back()))) {
        subtype.pop_back();
    }
    return subtype;
}

std::string codecsFromMimeType(const std::string& mimeType) {
    size_t codecs_pos = mimeType.find("codecs=\"");
    if (codecs_pos == std::string::npos) {
        return "";
    }
    size_t start = codecs_pos + 8;
    size_t end = mimeType.find('"', start);
    return end == std::string::npos ? "" : mimeType.substr(start, end - start);
}

std::optional<StreamDescriptor> parseAdaptiveFormat(const nlohmann::json& item) {
    StreamDescriptor stream;
    stream.itag = safeGetInt(item, "itag");
    stream.url = safeGetString(item, "url");

    if (stream.url.empty() && (item.contains("cipher") || item.contains("signatureCipher"))) {
        std::string cipher_val = safeGetString(item, "cipher");
        if (cipher_val.empty()) cipher_val = safeGetString(item, "signatureCipher");

        // Only ciphers that still carry a plain url= are usable; deciphering
        // the signature is not attempted.
        std::regex url_regex("url=([^&]+)");
        std::smatch url_match;
        if (std::regex_search(cipher_val, url_match, url_regex) && url_match.size() > 1) {
            stream.url = cpr::util::urlDecode(url_match[1].str());
        }
    }
    if (stream.url.empty()) {
        return std::nullopt;
    }

    stream.mimeType = safeGetString(item, "mimeType");
    stream.codecs = codecsFromMimeType(stream.mimeType);
    stream.container = containerFromMimeType(stream.mimeType);

    if (stream.mimeType.rfind("audio/", 0) == 0) {
        stream.kind = StreamKind::AudioOnly;
    } else if (stream.mimeType.rfind("video/", 0) == 0) {
        stream.kind = StreamKind::VideoOnly;
    } else {
        return std::nullopt;
    }

    stream.bitrate = static_cast<long>(safeGetLong(item, "averageBitrate", safeGetLong(item, "bitrate")));
    if (item.contains("contentLength")) {
        stream.contentLength = safeGetLong(item, "contentLength");
    }

    if (stream.isVideo()) {
        if (item.contains("width")) stream.width = safeGetInt(item, "width");
        if (item.contains("height")) stream.height = safeGetInt(item, "height");
        if (item.contains("fps")) stream.fps = safeGetInt(item, "fps");

        std::string label = normalizeResolutionLabel(safeGetString(item, "qualityLabel"));
        if (label.empty() && stream.height.has_value() && stream.height.value() > 0) {
            label = std::to_string(stream.height.value()) + "p";
        }
        if (!label.empty()) {
            stream.resolution = label;
        }
    }
    return stream;
}

// libcurl's progress function also runs while no bytes arrive, so a stalled
// server cannot keep an abort request from being seen.
cpr::ProgressCallback abortingProgress(const YouTubeFetcher::AbortCheck& abortCheck) {
    return cpr::ProgressCallback{[abortCheck](auto, auto, auto, auto, intptr_t /* userdata */) -> bool {
        return !(abortCheck && abortCheck());
    }};
}

} // namespace

std::string extractVideoId(const std::string& locator) {
    static const std::regex patterns[] = {
        std::regex(R"(v=([a-zA-Z0-9_-]{11}))"),
        std::regex(R"(youtu\.be\/([a-zA-Z0-9_-]{11}))"),
        std::regex(R"(embed\/([a-zA-Z0-9_-]{11}))"),
        std::regex(R"(shorts\/([a-zA-Z0-9_-]{11}))")
    };
    std::smatch match;
    for (const auto& pattern : patterns) {
        if (std::regex_search(locator, match, pattern) && match.size() > 1) {
            return match[1].str();
        }
    }
    static const std::regex bare_id(R"(^[a-zA-Z0-9_-]{11}$)");
    if (std::regex_match(locator, bare_id)) {
        return locator;
    }
    return "";
}

std::string normalizeResolutionLabel(const std::string& qualityLabel) {
    size_t digits = 0;
    while (digits < qualityLabel.size() && std::isdigit(static_cast<unsigned char>(qualityLabel[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return "";
    }
    return qualityLabel.substr(0, digits) + "p";
}

std::optional<std::string> extractPlayerResponse(const std::string& htmlContent) {
    size_t pos = htmlContent.find("ytInitialPlayerResponse = {");
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = htmlContent.find('{', pos);
    int brace_count = 0;
    bool in_string = false;
    bool escaped = false;

    for (size_t i = pos; i < htmlContent.length(); ++i) {
        char c = htmlContent[i];
        if (in_string) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            brace_count++;
        } else if (c == '}') {
            brace_count--;
            if (brace_count == 0) {
                return htmlContent.substr(pos, i - pos + 1);
            }
        }
    }
    return std::nullopt;
}

std::optional<VideoDetails> parsePlayerResponse(const std::string& jsonText, const std::string& videoId) {
    VideoDetails details;
    details.id = videoId;

    try {
        nlohmann::json jsonData = nlohmann::json::parse(jsonText);
        if (!jsonData.is_object()) {
            return std::nullopt;
        }

        if (jsonData.contains("videoDetails") && jsonData["videoDetails"].is_object()) {
            const auto& vd = jsonData["videoDetails"];
            details.title = safeGetString(vd, "title");
            details.author = safeGetString(vd, "author");
            details.lengthSeconds = static_cast<long>(safeGetLong(vd, "lengthSeconds"));
            details.viewCount = safeGetLong(vd, "viewCount");
        }

        if (jsonData.contains("microformat") && jsonData["microformat"].is_object()) {
            const auto& mf = jsonData["microformat"];
            if (mf.contains("playerMicroformatRenderer") && mf["playerMicroformatRenderer"].is_object()) {
                details.publishDate = safeGetString(mf["playerMicroformatRenderer"], "publishDate").substr(0, 10);
            }
        }

        if (jsonData.contains("streamingData") && jsonData["streamingData"].is_object()) {
            const auto& streamingData = jsonData["streamingData"];
            if (streamingData.contains("adaptiveFormats") && streamingData["adaptiveFormats"].is_array()) {
                for (const auto& item : streamingData["adaptiveFormats"]) {
                    if (!item.is_object()) continue;
                    if (auto stream = parseAdaptiveFormat(item)) {
                        details.descriptors.push_back(std::move(*stream));
                    }
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "JSON parsing error in player response: " << e.what() << std::endl;
        return std::nullopt;
    }

    if (details.title.empty() && details.descriptors.empty()) {
        return std::nullopt;
    }
    return details;
}

std::optional<VideoDetails> YouTubeFetcher::fetchVideoDetails(const std::string& videoUrl, AbortCheck abortCheck) {
    lastError_.clear();
    std::string videoId = extractVideoId(videoUrl);
    if (videoId.empty()) {
        lastError_ = "Could not extract video ID from URL: " + videoUrl;
        return std::nullopt;
    }

    std::string watchUrl = "https://www.youtube.com/watch?v=" + videoId;
    cpr::Response r = cpr::Get(cpr::Url{watchUrl},
                               cpr::Header{{"User-Agent", kUserAgent},
                                           {"Accept-Language", "en-US,en;q=0.9"}},
                               cpr::ConnectTimeout{10000},
                               abortingProgress(abortCheck));

    if (r.error) {
        lastError_ = "Failed to fetch " + watchUrl + ": " + r.error.message;
        return std::nullopt;
    }
    if (r.status_code != 200) {
        lastError_ = "Failed to fetch " + watchUrl + " (status code " + std::to_string(r.status_code) + ")";
        return std::nullopt;
    }

    auto json_str_opt = extractPlayerResponse(r.text);
    if (!json_str_opt) {
        lastError_ = "Could not find the player response in the watch page for " + videoId;
        return std::nullopt;
    }

    auto details = parsePlayerResponse(json_str_opt.value(), videoId);
    if (!details) {
        lastError_ = "Could not parse the player response for " + videoId;
    }
    return details;
}

bool YouTubeFetcher::downloadStream(const StreamDescriptor& stream,
                                    const std::string& outputFilePath,
                                    ProgressCallback progressCallback,
                                    AbortCheck abortCheck) {
    lastError_.clear();
    if (stream.url.empty()) {
        lastError_ = "Stream URL is empty";
        return false;
    }

    std::ofstream outputFile(outputFilePath, std::ios::binary);
    if (!outputFile.is_open()) {
        lastError_ = "Could not open file for writing: " + outputFilePath;
        return false;
    }

    long long totalBytesExpected = stream.contentLength.value_or(0);
    long long downloadedBytes = 0;
    bool writeFailed = false;

    cpr::Session session;
    session.SetUrl(cpr::Url{stream.url});
    session.SetHeader(cpr::Header{{"User-Agent", kUserAgent}});

    auto writeCallback = [&](const auto& data, intptr_t /* userdata */) -> bool {
        if (abortCheck && abortCheck()) {
            return false;
        }
        outputFile.write(data.data(), static_cast<std::streamsize>(data.length()));
        if (!outputFile) {
            writeFailed = true;
            return false;
        }
        downloadedBytes += static_cast<long long>(data.length());
        if (progressCallback) {
            progressCallback(downloadedBytes, totalBytesExpected);
        }
        return true;
    };
    session.SetWriteCallback(cpr::WriteCallback{writeCallback});
    session.SetProgressCallback(abortingProgress(abortCheck));

    session.SetTimeout(cpr::Timeout{0}); // no limit on the transfer itself
    session.SetConnectTimeout(cpr::ConnectTimeout{10000});

    cpr::Response response = session.Get();
    outputFile.close();

    if (writeFailed) {
        lastError_ = "Error writing to file: " + outputFilePath;
        return false;
    }
    if (response.error) {
        lastError_ = "Transfer error: " + response.error.message;
        return false;
    }
    if (response.status_code >= 400) {
        lastError_ = "Server responded with status code " + std::to_string(response.status_code);
        return false;
    }

    if (progressCallback) {
        progressCallback(downloadedBytes, totalBytesExpected > 0 ? totalBytesExpected : downloadedBytes);
    }
    return true;
}

} // namespace ytmux
