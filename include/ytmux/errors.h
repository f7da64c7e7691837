#ifndef YTMUX_ERRORS_H
#define YTMUX_ERRORS_H

#include <stdexcept>
#include <string>

namespace ytmux {

enum class ErrorKind {
    AssetUnavailable,
    InvalidChoice,
    StreamsUnavailable,
    RetrievalFailed,
    MuxFailed,
    CleanupFailed
};

// Human readable name of the stage an error kind originates from.
const char* stageName(ErrorKind kind);

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Raised when the user interrupts the run or closes the input stream.
class RunCancelled : public std::runtime_error {
public:
    explicit RunCancelled(const std::string& message = "Operation cancelled by user.")
        : std::runtime_error(message) {}
};

} // namespace ytmux

#endif // YTMUX_ERRORS_H
