#include "ytmux/resolution_selector.h"
#include "ytmux/errors.h"
#include "ytmux/interrupt.h"
#include <algorithm> // For std::stable_sort, std::any_of
#include <cctype>
#include <utility>

namespace ytmux {

namespace {

// Numeric height of a "720p" style label, 0 if it has none.
long labelHeight(const std::string& label) {
    long height = 0;
    for (char c : label) {
        if (!std::isdigit(static_cast<unsigned char>(c))) break;
        height = height * 10 + (c - '0');
    }
    return height;
}

bool isSelectableVideo(const StreamDescriptor& d, const std::string& container) {
    return d.kind == StreamKind::VideoOnly && d.container == container && d.resolution.has_value();
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::vector<std::string> availableResolutions(const std::vector<StreamDescriptor>& descriptors,
                                              const std::string& container) {
    std::vector<std::pair<std::string, long>> labels;
    for (const auto& d : descriptors) {
        if (!isSelectableVideo(d, container)) continue;
        const std::string& label = d.resolution.value();
        bool seen = std::any_of(labels.begin(), labels.end(),
                                [&](const auto& entry) { return entry.first == label; });
        if (!seen) {
            labels.emplace_back(label, labelHeight(label));
        }
    }

    // Stable, so equal heights keep catalog order.
    std::stable_sort(labels.begin(), labels.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> result;
    result.reserve(labels.size());
    for (auto& entry : labels) {
        result.push_back(std::move(entry.first));
    }
    return result;
}

ChoiceResult parseChoice(const std::string& raw, std::size_t count) {
    ChoiceResult result;
    std::string text = trim(raw);
    if (text.empty()) {
        return result;
    }

    long long ordinal = 0;
    try {
        size_t consumed = 0;
        ordinal = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return result;
        }
    } catch (const std::invalid_argument&) {
        return result;
    } catch (const std::out_of_range&) {
        result.status = ChoiceStatus::OutOfRange;
        return result;
    }

    if (ordinal < 1 || static_cast<unsigned long long>(ordinal) > count) {
        result.status = ChoiceStatus::OutOfRange;
        return result;
    }
    result.status = ChoiceStatus::Accepted;
    result.index = static_cast<std::size_t>(ordinal - 1);
    return result;
}

std::string selectResolution(const std::vector<std::string>& available, const std::string& choice) {
    ChoiceResult parsed = parseChoice(choice, available.size());
    switch (parsed.status) {
        case ChoiceStatus::Accepted:
            return available[parsed.index];
        case ChoiceStatus::Malformed:
            throw PipelineError(ErrorKind::InvalidChoice, "'" + choice + "' is not a number");
        case ChoiceStatus::OutOfRange:
            break;
    }
    throw PipelineError(ErrorKind::InvalidChoice,
                        "Choose a number between 1 and " + std::to_string(available.size()));
}

std::string promptResolution(const std::vector<std::string>& available,
                             std::istream& in,
                             std::ostream& out) {
    out << "\n=========== Available Resolutions ===========\n";
    for (size_t i = 0; i < available.size(); ++i) {
        out << "  [" << (i + 1) << "] " << available[i] << "\n";
    }
    out << "=============================================" << std::endl;

    std::string line;
    while (true) {
        out << "\nSelect the desired resolution [number]: " << std::flush;
        if (!std::getline(in, line) || interruptRequested()) {
            throw RunCancelled();
        }
        try {
            return selectResolution(available, line);
        } catch (const PipelineError& e) {
            // Non numeric input just asks again.
            if (parseChoice(line, available.size()).status == ChoiceStatus::OutOfRange) {
                out << "Invalid option. " << e.what() << "." << std::endl;
            }
        }
    }
}

Selection resolveDescriptors(const std::vector<StreamDescriptor>& descriptors,
                             const std::string& resolutionLabel,
                             const std::string& container) {
    const StreamDescriptor* video = nullptr;
    const StreamDescriptor* audio = nullptr;

    for (const auto& d : descriptors) {
        if (d.container != container) continue;
        switch (d.kind) {
            case StreamKind::VideoOnly:
                if (!video && d.resolution && d.resolution.value() == resolutionLabel) {
                    video = &d;
                }
                break;
            case StreamKind::AudioOnly:
                // Strictly greater: the first of equal bitrates wins.
                if (!audio || d.bitrate > audio->bitrate) {
                    audio = &d;
                }
                break;
        }
    }

    if (!video) {
        throw PipelineError(ErrorKind::StreamsUnavailable,
                            "No " + container + " video stream with resolution " + resolutionLabel);
    }
    if (!audio) {
        throw PipelineError(ErrorKind::StreamsUnavailable, "No " + container + " audio stream available");
    }
    return Selection{*video, *audio};
}

} // namespace ytmux
