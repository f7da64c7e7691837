#include <iostream>
#include <string>
#include <vector>
#include <iomanip>
#include <algorithm>
#include <cstdio>
#include <filesystem>

#include <cxxopts.hpp>
#include "ytmux/config.h"
#include "ytmux/download_run.h"
#include "ytmux/errors.h"
#include "ytmux/interrupt.h"
#include "ytmux/muxer.h"
#include "ytmux/resolution_selector.h"
#include "ytmux/run_events.h"
#include "ytmux/stream_catalog.h"

namespace {

const char* kCancelledMessage = "\n\nOperation cancelled by user.";

// Helper function to format file size
std::string formatBytes(long long bytes) {
    if (bytes < 0) return "N/A";
    const char* suffixes[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    double dblBytes = static_cast<double>(bytes);
    if (bytes == 0) return "0 B";
    while (dblBytes >= 1024 && i < 4) {
        dblBytes /= 1024;
        i++;
    }
    char buffer[16];
    snprintf(buffer, sizeof(buffer), "%.2f %s", dblBytes, suffixes[i]);
    return std::string(buffer);
}

// Simple progress bar display
void displayProgressBar(long long current, long long total) {
    const int barWidth = 50;
    if (total <= 0) {
        std::cout << "\rDownloaded: " << formatBytes(current) << "     " << std::flush;
        return;
    }

    float progress = static_cast<float>(current) / static_cast<float>(total);
    int pos = static_cast<int>(barWidth * progress);
    std::cout << "\r[";
    for (int i = 0; i < barWidth; ++i) {
        if (i < pos) std::cout << "=";
        else if (i == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << (progress * 100.0) << "% "
              << "(" << formatBytes(current) << "/" << formatBytes(total) << ")" << std::flush;
}

void printBanner() {
    std::cout << "\n"
              << "    +------------------------------------------+\n"
              << "    |            YouTube Video Muxer           |\n"
              << "    |        best audio + chosen resolution    |\n"
              << "    +------------------------------------------+\n";
}

std::string formatDuration(long seconds) {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%ld:%02ld", seconds / 60, seconds % 60);
    return buffer;
}

std::string formatViews(long long views) {
    std::string digits = std::to_string(views);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) out.insert(out.begin(), ',');
        out.insert(out.begin(), *it);
        ++count;
    }
    return out;
}

// "2021-07-04" -> "04/07/2021"
std::string formatPublishDate(const std::string& isoDate) {
    if (isoDate.size() < 10) return isoDate.empty() ? "N/A" : isoDate;
    return isoDate.substr(8, 2) + "/" + isoDate.substr(5, 2) + "/" + isoDate.substr(0, 4);
}

void displayVideoInfo(const ytmux::VideoDetails& details) {
    std::string title = details.title.substr(0, 40);
    if (details.title.length() > 40) title += "...";

    std::cout << "\n+------------------ Video Info ------------------+" << std::endl;
    std::cout << "| Title: " << title << std::endl;
    std::cout << "| Channel: " << details.author << std::endl;
    std::cout << "| Duration: " << formatDuration(details.lengthSeconds) << std::endl;
    std::cout << "| Views: " << formatViews(details.viewCount) << std::endl;
    std::cout << "| Published: " << formatPublishDate(details.publishDate) << std::endl;
    std::cout << "+------------------------------------------------+" << std::endl;
}

// Prints stage transitions and download progress of a run.
class ConsoleObserver : public ytmux::RunObserver {
public:
    void stateEntered(ytmux::RunState state) override {
        switch (state) {
            case ytmux::RunState::Resolving:
                std::cout << "\nFetching video information..." << std::endl;
                break;
            case ytmux::RunState::Muxing:
                std::cout << "\nMerging files..." << std::endl;
                break;
            default:
                break;
        }
    }

    void assetResolved(const ytmux::VideoDetails& details) override {
        displayVideoInfo(details);
    }

    void retrievalStarted(ytmux::StreamKind kind, const std::filesystem::path& destination) override {
        std::cout << "\nDownloading " << (kind == ytmux::StreamKind::VideoOnly ? "video" : "audio")
                  << " to " << destination.string() << std::endl;
        displayProgressBar(0, 0);
    }

    void retrievalProgress(ytmux::StreamKind, long long current, long long total) override {
        displayProgressBar(current, total);
    }

    void retrievalFinished(ytmux::StreamKind) override {
        std::cout << std::endl;
    }
};

} // namespace

int main(int argc, char* argv[]) {
    ytmux::installInterruptHandler();

    cxxopts::Options options("ytmux", "Downloads a chosen resolution plus the best audio track of a YouTube video\n"
                                      "and merges them into one file with ffmpeg.");
    options.set_width(100);
    options.add_options()
        ("h,help", "Print usage")
        ("u,url", "YouTube video URL (prompted for when omitted)", cxxopts::value<std::string>())
        ("o,output-dir", "Destination directory. Default: $XDG_VIDEOS_DIR or ~/Videos", cxxopts::value<std::string>())
        ("r,resolution", "Resolution to download, e.g. 720p. Prompted for when omitted or unavailable",
                         cxxopts::value<std::string>())
        ("i,info", "Only display video info and available resolutions", cxxopts::value<bool>()->default_value("false"))
        ("ffmpeg", "ffmpeg binary used for merging (env YTMUX_FFMPEG)", cxxopts::value<std::string>())
        ("audio-codec", "Codec the audio track is re-encoded to", cxxopts::value<std::string>()->default_value("aac"))
    ;
    options.positional_help("<video_url>");
    options.parse_positional({"url"});

    ytmux::RunConfig config = ytmux::loadRunConfig();
    std::string videoUrl;
    std::string preferredResolution;
    bool infoOnly = false;

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        if (result.count("url")) videoUrl = result["url"].as<std::string>();
        if (result.count("output-dir")) config.destination = result["output-dir"].as<std::string>();
        if (result.count("resolution")) preferredResolution = result["resolution"].as<std::string>();
        if (result.count("ffmpeg")) config.ffmpegBinary = result["ffmpeg"].as<std::string>();
        config.audioCodec = result["audio-codec"].as<std::string>();
        infoOnly = result["info"].as<bool>();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for more information." << std::endl;
        return 1;
    }

    printBanner();

    if (videoUrl.empty()) {
        std::cout << "\nEnter the video URL: " << std::flush;
        if (!std::getline(std::cin, videoUrl) || ytmux::interruptRequested()) {
            std::cout << kCancelledMessage << std::endl;
            return 0;
        }
        videoUrl.erase(0, videoUrl.find_first_not_of(" \t\r\n"));
        videoUrl.erase(videoUrl.find_last_not_of(" \t\r\n") + 1);
    }

    ytmux::YouTubeCatalog catalog;

    if (infoOnly) {
        try {
            ytmux::VideoDetails details = catalog.query(videoUrl);
            displayVideoInfo(details);
            std::cout << "\nAvailable resolutions:";
            for (const auto& label : ytmux::availableResolutions(details.descriptors, config.streamContainer)) {
                std::cout << " " << label;
            }
            std::cout << std::endl;
            return 0;
        } catch (const ytmux::PipelineError& e) {
            std::cerr << "\nError during " << ytmux::stageName(e.kind()) << ": " << e.what() << std::endl;
            return 1;
        }
    }

    ytmux::FfmpegMuxer muxer(config.ffmpegBinary, config.audioCodec);
    if (!muxer.probe()) {
        std::cerr << "Warning: '" << config.ffmpegBinary << " -version' failed; merging will likely fail." << std::endl;
    }

    ConsoleObserver observer;
    ytmux::DownloadRun run(catalog, muxer, config, &observer);

    auto chooser = [&preferredResolution](const std::vector<std::string>& available) {
        if (!preferredResolution.empty()) {
            if (std::find(available.begin(), available.end(), preferredResolution) != available.end()) {
                return preferredResolution;
            }
            std::cout << "\nResolution " << preferredResolution << " is not available." << std::endl;
        }
        return ytmux::promptResolution(available, std::cin, std::cout);
    };

    ytmux::RunOutcome outcome = run.execute(videoUrl, chooser);

    switch (outcome.state) {
        case ytmux::RunState::Done:
            for (const auto& issue : outcome.cleanupIssues) {
                std::cerr << "Warning: failed to remove temporary file " << issue.path.string()
                          << ": " << issue.message << std::endl;
            }
            std::cout << "\nDownload completed successfully!" << std::endl;
            std::cout << "File saved to: " << outcome.outputPath->string() << std::endl;
            break;
        case ytmux::RunState::Cancelled:
            std::cout << kCancelledMessage << std::endl;
            break;
        default:
            if (outcome.error) {
                std::cerr << "\nError during " << ytmux::stageName(outcome.error->kind()) << ": "
                          << outcome.error->what() << std::endl;
            } else {
                std::cerr << "\nRun ended in state " << ytmux::toString(outcome.state) << std::endl;
            }
            break;
    }
    return ytmux::exitStatus(outcome);
}
