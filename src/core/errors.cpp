#include "ytmux/errors.h"

namespace ytmux {

const char* stageName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AssetUnavailable:   return "video lookup";
        case ErrorKind::InvalidChoice:      return "resolution selection";
        case ErrorKind::StreamsUnavailable: return "stream selection";
        case ErrorKind::RetrievalFailed:    return "download";
        case ErrorKind::MuxFailed:          return "merge";
        case ErrorKind::CleanupFailed:      return "cleanup";
    }
    return "unknown";
}

} // namespace ytmux
