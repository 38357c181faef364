#pragma once

/// @file game_error.hpp
/// @brief Engine error type used with Result<T, GameError>.

#include <any>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include "gw/foundation/error_code.hpp"

namespace gw::foundation {

/// Error returned by every fallible engine call.
///
/// Carries the code, a message for logs, and optional typed context
/// (e.g. PlacementFailure from the map generator) so callers can react
/// without parsing the message.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// True for a rejected player command (bad parameters or wrong phase).
    /// The match carries on after such an error.
    [[nodiscard]] bool isCommandRejection() const noexcept {
        return errorSubsystem(code_) == "Command";
    }

    /// Typed context, or nullptr when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

    /// One-line form for logs: `[MapGen 0x0200] message`.
    [[nodiscard]] std::string describe() const {
        char code[8];
        std::snprintf(code, sizeof(code), "0x%04X", static_cast<uint32_t>(code_));
        std::string out;
        out.reserve(message_.size() + 24);
        out += '[';
        out += subsystem();
        out += ' ';
        out += code;
        out += "] ";
        out += message_;
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace gw::foundation
