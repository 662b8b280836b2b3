#pragma once

/// @file engine_error.hpp
/// @brief Error value carried by EngineResult.

#include <string>
#include <string_view>
#include <utility>

#include "sfe/foundation/error_code.hpp"

namespace sfe::foundation {

class EngineError {
public:
    EngineError() = default;

    EngineError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    /// "Subsystem: message", as printed by the forecast runner.
    [[nodiscard]] std::string describe() const {
        return std::string(subsystem()) + ": " + message_;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace sfe::foundation
