#pragma once

#include <sockany/expected.hpp>

#include <system_error>
#include <variant>

namespace sockany {

/// Common result type for fallible encode/decode operations.
template <class T>
using result = expected<T, std::error_code>;

/// Result type for checks that produce no value.
/// (sockany::expected does not support T=void in the fallback implementation.)
using void_result = expected<std::monostate, std::error_code>;

[[nodiscard]] inline auto ok() noexcept -> void_result { return std::monostate{}; }
[[nodiscard]] inline auto fail(std::error_code ec) noexcept -> void_result { return unexpected(ec); }

}  // namespace sockany
