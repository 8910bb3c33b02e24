#pragma once

#include <sockany/detail/hash.hpp>
#include <sockany/error.hpp>
#include <sockany/ip/address.hpp>
#include <sockany/ip/endpoint_v4.hpp>
#include <sockany/ip/endpoint_v6.hpp>
#include <sockany/native_view.hpp>
#include <sockany/result.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <sys/socket.h>

namespace sockany::ip {

/// IP endpoint: either an IPv4 or an IPv6 socket address.
///
/// This is the IP-only subset of `sockany::any_endpoint` and converts to it losslessly.
class endpoint {
 public:
  using native_type = sockaddr_storage;
  using variant_type = std::variant<endpoint_v4, endpoint_v6>;

  constexpr endpoint() noexcept = default;
  constexpr endpoint(endpoint_v4 v4) noexcept : storage_(v4) {}
  constexpr endpoint(endpoint_v6 v6) noexcept : storage_(v6) {}

  endpoint(address_v4 addr, std::uint16_t port) noexcept : storage_(endpoint_v4{addr, port}) {}
  endpoint(address_v6 addr, std::uint16_t port) noexcept : storage_(endpoint_v6{addr, port}) {}
  endpoint(ip::address addr, std::uint16_t port) noexcept;

  auto is_v4() const noexcept -> bool { return std::holds_alternative<endpoint_v4>(storage_); }
  auto is_v6() const noexcept -> bool { return std::holds_alternative<endpoint_v6>(storage_); }

  auto as_v4() const -> endpoint_v4 const& { return std::get<endpoint_v4>(storage_); }
  auto as_v6() const -> endpoint_v6 const& { return std::get<endpoint_v6>(storage_); }

  auto address() const noexcept -> ip::address;
  auto port() const noexcept -> std::uint16_t;
  auto family() const noexcept -> int;

  /// Encode into a zero-filled sockaddr_storage.
  auto encode() const noexcept -> sockaddr_storage;

  /// Lend the exact native layout of the active alternative; see `sockany::with_native`.
  template <class F>
    requires std::invocable<F, sockaddr const*, socklen_t>
  auto with_native(F&& f) const -> std::invoke_result_t<F, sockaddr const*, socklen_t> {
    return std::visit([&](auto const& ep) { return sockany::with_native(ep, std::forward<F>(f)); },
                      storage_);
  }

  auto to_native(sockaddr* out, socklen_t capacity) const noexcept -> result<socklen_t>;

  /// Decode an AF_INET or AF_INET6 socket address.
  ///
  /// Returns unsupported_address_family for any other discriminant.
  static auto from_native(sockaddr const* addr, socklen_t len) noexcept -> result<endpoint>;

  auto to_string() const -> std::string;

  template <class Visitor>
  decltype(auto) visit(Visitor&& v) const {
    return std::visit(std::forward<Visitor>(v), storage_);
  }

  friend auto operator==(endpoint const&, endpoint const&) noexcept -> bool = default;
  friend auto operator<=>(endpoint const&, endpoint const&) noexcept = default;

 private:
  variant_type storage_;
};

}  // namespace sockany::ip

template <>
struct std::hash<sockany::ip::endpoint> {
  auto operator()(sockany::ip::endpoint const& ep) const noexcept -> std::size_t {
    return ep.visit([](auto const& alt) {
      return std::hash<std::remove_cvref_t<decltype(alt)>>{}(alt);
    });
  }
};

#include <sockany/ip/impl/endpoint.ipp>
