#include "ytmux/stream_catalog.h"
#include "ytmux/errors.h"
#include "ytmux/interrupt.h"
#include <utility>

namespace ytmux {

VideoDetails YouTubeCatalog::query(const std::string& locator) {
    auto details = fetcher_.fetchVideoDetails(locator, [] { return interruptRequested(); });
    if (!details) {
        throw PipelineError(ErrorKind::AssetUnavailable, fetcher_.lastError());
    }
    return std::move(*details);
}

void YouTubeCatalog::retrieve(const StreamDescriptor& descriptor,
                              const std::filesystem::path& destination,
                              ProgressCallback progress) {
    bool ok = fetcher_.downloadStream(descriptor, destination.string(), progress,
                                      [] { return interruptRequested(); });
    if (!ok) {
        throw PipelineError(ErrorKind::RetrievalFailed,
                            "itag " + std::to_string(descriptor.itag) + ": " + fetcher_.lastError());
    }
}

} // namespace ytmux
