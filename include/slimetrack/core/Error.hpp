#pragma once

#include <system_error>

namespace slimetrack {

/**
 * @brief Specific failure codes reported by the tracker.
 *
 * Each code belongs to one ErrorKind, so callers can either match the exact
 * code or test the broad class:
 *
 *     if (result.error() == slimetrack::ErrorKind::Transport) { ... }
 */
enum class Errc {
    ResolveFailed = 1,
    BindFailed,
    SocketOptionFailed,
    SendFailed,

    InvalidIdentity,
    InvalidConfig,
    NotInitialized,
    SensorLimitReached,
    CalledFromIoThread,

    EncodeFailed,

    Cancelled
};

/// Broad error classes, usable as std::error_condition.
enum class ErrorKind {
    Transport = 1,
    Precondition,
    Protocol,
    Cancelled
};

const std::error_category& trackerCategory() noexcept;
const std::error_category& errorKindCategory() noexcept;

std::error_code make_error_code(Errc code) noexcept;
std::error_condition make_error_condition(ErrorKind kind) noexcept;

/// Classify any code produced by this library.
ErrorKind kindOf(Errc code) noexcept;

} // namespace slimetrack

namespace std {
template<> struct is_error_code_enum<slimetrack::Errc> : true_type {};
template<> struct is_error_condition_enum<slimetrack::ErrorKind> : true_type {};
} // namespace std
