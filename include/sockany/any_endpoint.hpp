#pragma once

#include <sockany/config.hpp>
#include <sockany/detail/hash.hpp>
#include <sockany/error.hpp>
#include <sockany/ip/endpoint.hpp>
#include <sockany/ip/endpoint_v4.hpp>
#include <sockany/ip/endpoint_v6.hpp>
#include <sockany/native_storage.hpp>
#include <sockany/native_view.hpp>
#include <sockany/result.hpp>

#if SOCKANY_HAS_LOCAL
#include <sockany/local/endpoint.hpp>
#endif
#if SOCKANY_HAS_NETLINK
#include <sockany/netlink/endpoint.hpp>
#endif
#if SOCKANY_HAS_XDP
#include <sockany/xdp/endpoint.hpp>
#endif

#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <sys/socket.h>

namespace sockany {

/// Closed set of endpoint types compiled into this build.
using endpoint_variant = std::variant<ip::endpoint_v4, ip::endpoint_v6
#if SOCKANY_HAS_LOCAL
                                      ,
                                      local::endpoint
#endif
#if SOCKANY_HAS_NETLINK
                                      ,
                                      netlink::endpoint
#endif
#if SOCKANY_HAS_XDP
                                      ,
                                      xdp::endpoint
#endif
                                      >;

namespace detail {

template <class T, class V>
struct is_alternative;

template <class T, class... Ts>
struct is_alternative<T, std::variant<Ts...>> : std::bool_constant<(std::same_as<T, Ts> || ...)> {};

}  // namespace detail

/// One of the enabled endpoint alternatives.
template <class T>
concept endpoint_alternative = detail::is_alternative<T, endpoint_variant>::value;

/// A socket address of any supported family (`sockaddr_storage` as a value type).
///
/// Semantics:
/// - Exactly one alternative is active; `family()` reports its discriminant.
/// - Equality, ordering and hashing are structural. Endpoints of different families never
///   compare equal; ordering is by alternative first.
/// - Decoding dispatches on the family discriminant over `endpoint_variant`, so adding or
///   disabling a family only changes the variant list.
class any_endpoint {
 public:
  using native_type = sockaddr_storage;

  /// 0.0.0.0:0
  constexpr any_endpoint() noexcept = default;

  template <endpoint_alternative T>
  constexpr any_endpoint(T ep) noexcept(std::is_nothrow_move_constructible_v<T>)
      : storage_(std::move(ep)) {}

  any_endpoint(ip::endpoint const& ep) noexcept;

  auto family() const noexcept -> int;

  template <endpoint_alternative T>
  auto is() const noexcept -> bool {
    return std::holds_alternative<T>(storage_);
  }

  template <endpoint_alternative T>
  auto get_if() const noexcept -> T const* {
    return std::get_if<T>(&storage_);
  }

  /// Throws std::bad_variant_access if `T` is not active.
  template <endpoint_alternative T>
  auto get() const -> T const& {
    return std::get<T>(storage_);
  }

  template <class Visitor>
  decltype(auto) visit(Visitor&& v) const {
    return std::visit(std::forward<Visitor>(v), storage_);
  }

  /// Encode into a zero-filled sockaddr_storage. The significant length is only
  /// available through `with_native()` / `write()`.
  auto encode() const noexcept -> sockaddr_storage;

  /// Lend the exact native layout of the active alternative; see `sockany::with_native`.
  template <class F>
    requires std::invocable<F, sockaddr const*, socklen_t>
  auto with_native(F&& f) const -> std::invoke_result_t<F, sockaddr const*, socklen_t> {
    return std::visit([&](auto const& ep) { return sockany::with_native(ep, std::forward<F>(f)); },
                      storage_);
  }

  /// Copy the native layout into caller memory of `capacity` bytes.
  ///
  /// Returns:
  /// - the number of bytes written
  /// - invalid_argument if `out` is null
  /// - no_buffer_space if `capacity` is below the encoded length
  auto to_native(sockaddr* out, socklen_t capacity) const noexcept -> result<socklen_t>;

  /// Decode a native socket address of `len` bytes.
  ///
  /// Returns:
  /// - invalid_argument if addr is null
  /// - too_short if len cannot hold the discriminant, or the family's minimum layout
  /// - invalid_endpoint if len exceeds sizeof(sockaddr_storage)
  /// - unsupported_address_family if no enabled alternative has that discriminant
  /// - any family-specific decode error (e.g. path_too_long)
  static auto from_native(sockaddr const* addr, socklen_t len) noexcept -> result<any_endpoint>;

  auto to_string() const -> std::string;

  friend auto operator==(any_endpoint const&, any_endpoint const&) noexcept -> bool = default;
  friend auto operator<=>(any_endpoint const&, any_endpoint const&) noexcept = default;

  friend auto operator<<(std::ostream& os, any_endpoint const& ep) -> std::ostream&;

 private:
  endpoint_variant storage_{};
};

/// Decode the first `len` bytes of `storage`, typically filled by accept/getsockname/
/// recvfrom/recvmsg which also reported `len`.
auto read(native_storage const& storage, socklen_t len) noexcept -> result<any_endpoint>;

}  // namespace sockany

template <>
struct std::hash<sockany::any_endpoint> {
  auto operator()(sockany::any_endpoint const& ep) const noexcept -> std::size_t {
    std::size_t h = 0;
    sockany::detail::hash_append(h, ep.family());
    ep.visit([&](auto const& alt) {
      sockany::detail::hash_append(h, alt);
    });
    return h;
  }
};

#include <sockany/impl/any_endpoint.ipp>
