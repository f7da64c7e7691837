#ifndef YTMUX_FILENAMES_H
#define YTMUX_FILENAMES_H

#include <cstddef>
#include <filesystem>
#include <string>

namespace ytmux {

// Lowercase ASCII letters and digits; every other run of characters becomes
// a single '-'. Never empty: falls back to "video".
std::string slugify(const std::string& input, std::size_t maxLength = 80);

// {assetId}_video.{ext}
std::filesystem::path tempVideoPath(const std::filesystem::path& destination,
                                    const std::string& assetId,
                                    const std::string& extension);

// {assetId}_audio.{ext}
std::filesystem::path tempAudioPath(const std::filesystem::path& destination,
                                    const std::string& assetId,
                                    const std::string& extension);

// {slug(title)}_{resolution}.{ext}
std::filesystem::path outputPath(const std::filesystem::path& destination,
                                 const std::string& title,
                                 const std::string& resolutionLabel,
                                 const std::string& extension);

} // namespace ytmux

#endif // YTMUX_FILENAMES_H
