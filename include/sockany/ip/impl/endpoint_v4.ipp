#include <sockany/ip/endpoint_v4.hpp>

#include <sockany/detail/native_codec.hpp>
#include <sockany/native_view.hpp>

#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace sockany::ip {

inline auto endpoint_v4::encode() const noexcept -> sockaddr_in {
  auto sa = sockaddr_in{};
  sa.sin_family = AF_INET;
  sa.sin_port = htons(port_);

  auto const b = addr_.to_bytes();
  // b is in network byte order already; copy as-is.
  static_assert(sizeof(sa.sin_addr.s_addr) == 4);
  std::memcpy(&sa.sin_addr.s_addr, b.data(), 4);
  return sa;
}

inline auto endpoint_v4::from_native(sockaddr const* addr, socklen_t len) noexcept
  -> result<endpoint_v4> {
  if (auto r = sockany::detail::check_native(addr, len, AF_INET, min_native_size); !r) {
    return unexpected(r.error());
  }

  auto const sa = sockany::detail::load_native<sockaddr_in>(addr);
  address_v4::bytes_type b{};
  std::memcpy(b.data(), &sa.sin_addr.s_addr, 4);
  return endpoint_v4{address_v4{b}, ntohs(sa.sin_port)};
}

inline auto endpoint_v4::to_native(sockaddr* out, socklen_t capacity) const noexcept
  -> result<socklen_t> {
  return copy_native(*this, out, capacity);
}

inline auto endpoint_v4::to_string() const -> std::string {
  return addr_.to_string() + ":" + std::to_string(port_);
}

}  // namespace sockany::ip
