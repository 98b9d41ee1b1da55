// Expected.hpp
// -----------------------------------------------------------------------------
// Result type for every fallible slimetrack operation. Public operations fail
// with a std::error_code from the slimetrack category (see Error.hpp); the
// codec swaps in CodecError so it can name the field that failed.
//
//     expected<void> send() {
//         if (!link) return unexpected(Errc::NotInitialized);
//         ...
//     }

#pragma once

#include "slimetrack/core/Error.hpp"

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace slimetrack {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

/// Library error codes travel as std::error_code, never as the bare enum.
[[nodiscard]] inline unexpected_t<std::error_code> unexpected(Errc code) {
    return unexpected_t<std::error_code>(make_error_code(code));
}

} // namespace slimetrack
