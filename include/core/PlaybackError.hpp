#pragma once

#include <stdexcept>
#include <string>

namespace folio::core {

class PlaybackError : public std::runtime_error {
public:
    enum class Kind {
        EngineUnavailable,    // Intent needs a loaded book
        EngineCommandFailed,  // Engine rejected play or pause
        LoadFailed,           // Engine could not load the book
    };

    PlaybackError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

}  // namespace folio::core
