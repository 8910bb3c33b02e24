#include <sockany/ip/endpoint.hpp>

#include <sockany/detail/native_codec.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace sockany::ip {

inline endpoint::endpoint(ip::address addr, std::uint16_t port) noexcept {
  if (addr.is_v4()) {
    storage_ = endpoint_v4{addr.to_v4(), port};
  } else {
    storage_ = endpoint_v6{addr.to_v6(), port};
  }
}

inline auto endpoint::address() const noexcept -> ip::address {
  return visit([](auto const& ep) { return ip::address{ep.address()}; });
}

inline auto endpoint::port() const noexcept -> std::uint16_t {
  return visit([](auto const& ep) { return ep.port(); });
}

inline auto endpoint::family() const noexcept -> int {
  return visit([](auto const& ep) { return ep.family(); });
}

inline auto endpoint::encode() const noexcept -> sockaddr_storage {
  auto ss = sockaddr_storage{};
  visit([&](auto const& ep) {
    auto const raw = ep.encode();
    static_assert(sizeof(raw) <= sizeof(ss));
    std::memcpy(&ss, &raw, sizeof(raw));
  });
  return ss;
}

inline auto endpoint::to_native(sockaddr* out, socklen_t capacity) const noexcept
  -> result<socklen_t> {
  return copy_native(*this, out, capacity);
}

inline auto endpoint::from_native(sockaddr const* addr, socklen_t len) noexcept
  -> result<endpoint> {
  if (auto r = sockany::detail::check_discriminant(addr, len); !r) {
    return unexpected(r.error());
  }
  return sockany::detail::decode_alternative<endpoint, variant_type>(
    sockany::detail::read_family(addr), addr, len);
}

inline auto endpoint::to_string() const -> std::string {
  return visit([](auto const& ep) { return ep.to_string(); });
}

}  // namespace sockany::ip
