#pragma once

#include <sockany/error.hpp>
#include <sockany/result.hpp>

#include <concepts>
#include <cstddef>
#include <cstring>
#include <functional>
#include <span>
#include <type_traits>
#include <utility>

#include <sys/socket.h>

namespace sockany {

namespace detail {

struct native_view_probe {
  auto operator()(sockaddr const*, socklen_t) const noexcept -> int { return 0; }
};

}  // namespace detail

/// An endpoint that can produce its OS socket-address layout.
///
/// Semantics:
/// - `native_type` is the `sockaddr_*` struct for the family (trivially copyable).
/// - `encode()` is total: every valid endpoint has exactly one native form.
template <class E>
concept native_encodable = requires(E const& ep) {
  typename E::native_type;
  requires std::is_trivially_copyable_v<typename E::native_type>;
  requires sizeof(typename E::native_type) <= sizeof(sockaddr_storage);
  { ep.encode() } -> std::same_as<typename E::native_type>;
  { ep.family() } -> std::convertible_to<int>;
};

/// An endpoint that already holds its native layout (or dispatches to one that does)
/// and can lend it out without re-encoding.
template <class E>
concept native_viewable = requires(E const& ep, detail::native_view_probe f) {
  { ep.with_native(f) } -> std::same_as<int>;
};

/// Invoke `f(sockaddr const*, socklen_t)` with the native form of `ep`.
///
/// Lifetime:
/// - The pointer is readable for exactly the passed length and only until `f` returns.
///   It MUST NOT be retained; for most types it points at a temporary on this frame.
///
/// Strategy:
/// - Types modelling `native_viewable` hand out a pointer into themselves.
/// - Others are encoded into a stack value whose address is passed; the length is
///   `sizeof(native_type)`.
template <native_encodable E, class F>
  requires std::invocable<F, sockaddr const*, socklen_t>
auto with_native(E const& ep, F&& f) -> std::invoke_result_t<F, sockaddr const*, socklen_t> {
  if constexpr (native_viewable<E>) {
    return ep.with_native(std::forward<F>(f));
  } else {
    auto const raw = ep.encode();
    return std::invoke(std::forward<F>(f), reinterpret_cast<sockaddr const*>(&raw),
                       static_cast<socklen_t>(sizeof(raw)));
  }
}

/// Bounds-carrying flavour of `with_native()`: `f` receives `std::span<std::byte const>`.
template <native_encodable E, class F>
  requires std::invocable<F, std::span<std::byte const>>
auto with_native_bytes(E const& ep, F&& f) -> std::invoke_result_t<F, std::span<std::byte const>> {
  return with_native(ep, [&](sockaddr const* addr, socklen_t len) {
    return std::invoke(std::forward<F>(f),
                       std::span<std::byte const>{reinterpret_cast<std::byte const*>(addr),
                                                  static_cast<std::size_t>(len)});
  });
}

/// Copy the native form of `ep` into caller memory of `capacity` bytes.
///
/// Returns:
/// - the number of bytes written
/// - invalid_argument if `out` is null
/// - no_buffer_space if `capacity` is below the encoded length
template <native_encodable E>
auto copy_native(E const& ep, sockaddr* out, socklen_t capacity) noexcept -> result<socklen_t> {
  if (out == nullptr) {
    return unexpected(error::invalid_argument);
  }
  return with_native(ep, [&](sockaddr const* addr, socklen_t len) -> result<socklen_t> {
    if (capacity < len) {
      return unexpected(error::no_buffer_space);
    }
    std::memcpy(out, addr, static_cast<std::size_t>(len));
    return len;
  });
}

}  // namespace sockany
