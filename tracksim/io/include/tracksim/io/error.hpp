#pragma once

/// @file error.hpp
/// @brief Exception type of the tracksim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace tracksim::io {

/// @brief Raised when a scenario or checkpoint cannot be read or written.
///
/// Covers unreadable files, malformed JSON, missing or mistyped fields and
/// values that fail validation (a zero-length track, an unknown boundary
/// mode, an unsupported checkpoint version). The context names where the
/// problem was found: a file path, `"track"`, `"particles[3].state"`, ...
///
/// what() reads `"context: message"`.
///
/// @ingroup io
/// @see load_scenario, read_checkpoint
class LoaderError : public std::runtime_error {
public:
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message)
        , message_(message)
        , context_(context) {}

    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& context() const noexcept { return context_; }

private:
    std::string message_;
    std::string context_;
};

} // namespace tracksim::io
