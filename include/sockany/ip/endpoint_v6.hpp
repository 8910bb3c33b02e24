#pragma once

#include <sockany/detail/hash.hpp>
#include <sockany/error.hpp>
#include <sockany/ip/address_v6.hpp>
#include <sockany/result.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <netinet/in.h>
#include <sys/socket.h>

namespace sockany::ip {

/// IPv6 socket address: `sockaddr_in6` as a value type.
///
/// Port and flow info are held in host order and stored in network order on the wire.
/// The scope id is carried by the address and is host order on both sides.
class endpoint_v6 {
 public:
  using native_type = sockaddr_in6;
  static constexpr int family_tag = AF_INET6;
  static constexpr std::size_t min_native_size = sizeof(sockaddr_in6);

  constexpr endpoint_v6() noexcept = default;
  constexpr endpoint_v6(address_v6 addr, std::uint16_t port, std::uint32_t flowinfo = 0) noexcept
      : addr_(addr), port_(port), flowinfo_(flowinfo) {}

  constexpr auto address() const noexcept -> address_v6 { return addr_; }
  constexpr auto port() const noexcept -> std::uint16_t { return port_; }
  constexpr auto flowinfo() const noexcept -> std::uint32_t { return flowinfo_; }
  constexpr auto scope_id() const noexcept -> std::uint32_t { return addr_.scope_id(); }
  constexpr auto family() const noexcept -> int { return family_tag; }

  auto encode() const noexcept -> sockaddr_in6;

  /// Decode a native socket address.
  ///
  /// Returns:
  /// - invalid_argument if addr is null
  /// - too_short if len cannot hold a discriminant or a full sockaddr_in6
  /// - unsupported_address_family if the discriminant is not AF_INET6
  static auto from_native(sockaddr const* addr, socklen_t len) noexcept -> result<endpoint_v6>;

  auto to_native(sockaddr* out, socklen_t capacity) const noexcept -> result<socklen_t>;

  /// "[addr%scope]:port"
  auto to_string() const -> std::string;

  friend constexpr auto operator==(endpoint_v6 const&, endpoint_v6 const&) noexcept -> bool = default;
  friend constexpr auto operator<=>(endpoint_v6 const&, endpoint_v6 const&) noexcept = default;

 private:
  address_v6 addr_{};
  std::uint16_t port_{0};
  std::uint32_t flowinfo_{0};
};

}  // namespace sockany::ip

template <>
struct std::hash<sockany::ip::endpoint_v6> {
  auto operator()(sockany::ip::endpoint_v6 const& ep) const noexcept -> std::size_t {
    auto h = std::hash<sockany::ip::address_v6>{}(ep.address());
    sockany::detail::hash_append(h, ep.port());
    sockany::detail::hash_append(h, ep.flowinfo());
    return h;
  }
};

#include <sockany/ip/impl/endpoint_v6.ipp>
