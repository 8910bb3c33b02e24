#pragma once

#include <sockany/detail/hash.hpp>
#include <sockany/error.hpp>
#include <sockany/ip/address_v4.hpp>
#include <sockany/result.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <netinet/in.h>
#include <sys/socket.h>

namespace sockany::ip {

/// IPv4 socket address: `sockaddr_in` as a value type.
///
/// The port is held in host order; `encode()` converts it to network order.
class endpoint_v4 {
 public:
  using native_type = sockaddr_in;
  static constexpr int family_tag = AF_INET;

  /// Shortest length `from_native()` accepts.
  static constexpr std::size_t min_native_size = sizeof(sockaddr_in);

  constexpr endpoint_v4() noexcept = default;
  constexpr endpoint_v4(address_v4 addr, std::uint16_t port) noexcept : addr_(addr), port_(port) {}

  constexpr auto address() const noexcept -> address_v4 { return addr_; }
  constexpr auto port() const noexcept -> std::uint16_t { return port_; }
  constexpr auto family() const noexcept -> int { return family_tag; }

  auto encode() const noexcept -> sockaddr_in;

  /// Decode a native socket address.
  ///
  /// Returns:
  /// - invalid_argument if addr is null
  /// - too_short if len cannot hold a discriminant or a full sockaddr_in
  /// - unsupported_address_family if the discriminant is not AF_INET
  static auto from_native(sockaddr const* addr, socklen_t len) noexcept -> result<endpoint_v4>;

  /// Copy the native representation into caller memory of `capacity` bytes.
  auto to_native(sockaddr* out, socklen_t capacity) const noexcept -> result<socklen_t>;

  /// "a.b.c.d:port"
  auto to_string() const -> std::string;

  friend constexpr auto operator==(endpoint_v4 const&, endpoint_v4 const&) noexcept -> bool = default;
  friend constexpr auto operator<=>(endpoint_v4 const&, endpoint_v4 const&) noexcept = default;

 private:
  address_v4 addr_{};
  std::uint16_t port_{0};
};

}  // namespace sockany::ip

template <>
struct std::hash<sockany::ip::endpoint_v4> {
  auto operator()(sockany::ip::endpoint_v4 const& ep) const noexcept -> std::size_t {
    auto h = std::hash<sockany::ip::address_v4>{}(ep.address());
    sockany::detail::hash_append(h, ep.port());
    return h;
  }
};

#include <sockany/ip/impl/endpoint_v4.ipp>
