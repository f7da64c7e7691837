#ifndef YTMUX_STREAM_CATALOG_H
#define YTMUX_STREAM_CATALOG_H

#include "ytmux/video_info.h"
#include "ytmux/youtube_fetcher.h"
#include <filesystem>
#include <functional>
#include <string>

namespace ytmux {

// Boundary to the media hosting service: one query per asset and one
// retrieval per descriptor.
class StreamCatalog {
public:
    using ProgressCallback = std::function<void(long long, long long)>;

    virtual ~StreamCatalog() = default;

    // Throws PipelineError(AssetUnavailable).
    virtual VideoDetails query(const std::string& locator) = 0;

    // Writes the descriptor's bytes to destination.
    // Throws PipelineError(RetrievalFailed); partial files are left in place.
    virtual void retrieve(const StreamDescriptor& descriptor,
                          const std::filesystem::path& destination,
                          ProgressCallback progress) = 0;
};

class YouTubeCatalog : public StreamCatalog {
public:
    VideoDetails query(const std::string& locator) override;
    void retrieve(const StreamDescriptor& descriptor,
                  const std::filesystem::path& destination,
                  ProgressCallback progress) override;

private:
    YouTubeFetcher fetcher_;
};

} // namespace ytmux

#endif // YTMUX_STREAM_CATALOG_H
