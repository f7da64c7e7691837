#include "ytmux/filenames.h"
#include <cctype>
#include <iostream>
#include <memory>
#include <unicode/translit.h> // For icu::Transliterator
#include <unicode/unistr.h>

namespace ytmux {

namespace {

// "Música Ação" -> "Musica Acao", "Привет" -> "Privet". Characters with no
// Latin form (emoji) pass through unchanged.
std::string foldToAscii(const std::string& input) {
    static const std::unique_ptr<icu::Transliterator> folder = [] {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::Transliterator> transliterator(
            icu::Transliterator::createInstance("Any-Latin; Latin-ASCII", UTRANS_FORWARD, status));
        if (U_FAILURE(status)) {
            std::cerr << "Warning: ICU transliterator unavailable (" << u_errorName(status)
                      << "); non-ASCII title characters will be dropped." << std::endl;
            transliterator.reset();
        }
        return transliterator;
    }();

    if (!folder) {
        return input;
    }
    icu::UnicodeString text = icu::UnicodeString::fromUTF8(input);
    folder->transliterate(text);
    std::string folded;
    text.toUTF8String(folded);
    return folded;
}

} // namespace

std::string slugify(const std::string& input, std::size_t maxLength) {
    const std::string folded = foldToAscii(input);
    std::string output;
    output.reserve(folded.size());
    bool pendingSeparator = false;

    for (char ch : folded) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80 && std::isalnum(c)) {
            if (pendingSeparator && !output.empty()) {
                output += '-';
            }
            pendingSeparator = false;
            output += static_cast<char>(std::tolower(c));
        } else {
            pendingSeparator = true;
        }
    }

    if (output.length() > maxLength) {
        output.resize(maxLength);
        while (!output.empty() && output.back() == '-') {
            output.pop_back();
        }
    }

    if (output.empty()) {
        return "video";
    }
    return output;
}

std::filesystem::path tempVideoPath(const std::filesystem::path& destination,
                                    const std::string& assetId,
                                    const std::string& extension) {
    return destination / (assetId + "_video." + extension);
}

std::filesystem::path tempAudioPath(const std::filesystem::path& destination,
                                    const std::string& assetId,
                                    const std::string& extension) {
    return destination / (assetId + "_audio." + extension);
}

std::filesystem::path outputPath(const std::filesystem::path& destination,
                                 const std::string& title,
                                 const std::string& resolutionLabel,
                                 const std::string& extension) {
    return destination / (slugify(title) + "_" + slugify(resolutionLabel, 16) + "." + extension);
}

} // namespace ytmux
