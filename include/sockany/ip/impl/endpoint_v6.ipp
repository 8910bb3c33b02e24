#include <sockany/ip/endpoint_v6.hpp>

#include <sockany/detail/native_codec.hpp>
#include <sockany/native_view.hpp>

#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace sockany::ip {

inline auto endpoint_v6::encode() const noexcept -> sockaddr_in6 {
  auto sa = sockaddr_in6{};
  sa.sin6_family = AF_INET6;
  sa.sin6_port = htons(port_);
  sa.sin6_flowinfo = htonl(flowinfo_);

  auto const b = addr_.to_bytes();
  static_assert(sizeof(sa.sin6_addr.s6_addr) == 16);
  std::memcpy(sa.sin6_addr.s6_addr, b.data(), 16);
  sa.sin6_scope_id = addr_.scope_id();
  return sa;
}

inline auto endpoint_v6::from_native(sockaddr const* addr, socklen_t len) noexcept
  -> result<endpoint_v6> {
  if (auto r = sockany::detail::check_native(addr, len, AF_INET6, min_native_size); !r) {
    return unexpected(r.error());
  }

  auto const sa = sockany::detail::load_native<sockaddr_in6>(addr);
  address_v6::bytes_type b{};
  std::memcpy(b.data(), sa.sin6_addr.s6_addr, 16);
  return endpoint_v6{address_v6{b, sa.sin6_scope_id}, ntohs(sa.sin6_port), ntohl(sa.sin6_flowinfo)};
}

inline auto endpoint_v6::to_native(sockaddr* out, socklen_t capacity) const noexcept
  -> result<socklen_t> {
  return copy_native(*this, out, capacity);
}

inline auto endpoint_v6::to_string() const -> std::string {
  return "[" + addr_.to_string() + "]:" + std::to_string(port_);
}

}  // namespace sockany::ip
