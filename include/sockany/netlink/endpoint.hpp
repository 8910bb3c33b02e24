#pragma once

#include <sockany/config.hpp>

#if SOCKANY_HAS_NETLINK

#include <sockany/detail/hash.hpp>
#include <sockany/detail/native_codec.hpp>
#include <sockany/error.hpp>
#include <sockany/native_view.hpp>
#include <sockany/result.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>

#include <linux/netlink.h>
#include <sys/socket.h>

namespace sockany::netlink {

/// Netlink (AF_NETLINK) endpoint: port id + multicast group mask.
///
/// Both fields are host order on the wire. pid 0 addresses the kernel.
class endpoint {
 public:
  using native_type = sockaddr_nl;
  static constexpr int family_tag = AF_NETLINK;
  static constexpr std::size_t min_native_size = sizeof(sockaddr_nl);

  constexpr endpoint() noexcept = default;
  constexpr endpoint(std::uint32_t pid, std::uint32_t groups) noexcept
      : pid_(pid), groups_(groups) {}

  constexpr auto pid() const noexcept -> std::uint32_t { return pid_; }
  constexpr auto groups() const noexcept -> std::uint32_t { return groups_; }
  constexpr auto family() const noexcept -> int { return family_tag; }

  auto encode() const noexcept -> sockaddr_nl {
    auto sa = sockaddr_nl{};
    sa.nl_family = AF_NETLINK;
    sa.nl_pid = pid_;
    sa.nl_groups = groups_;
    return sa;
  }

  static auto from_native(sockaddr const* addr, socklen_t len) noexcept -> result<endpoint> {
    if (auto r = sockany::detail::check_native(addr, len, AF_NETLINK, min_native_size); !r) {
      return unexpected(r.error());
    }
    auto const sa = sockany::detail::load_native<sockaddr_nl>(addr);
    return endpoint{sa.nl_pid, sa.nl_groups};
  }

  auto to_native(sockaddr* out, socklen_t capacity) const noexcept -> result<socklen_t> {
    return copy_native(*this, out, capacity);
  }

  auto to_string() const -> std::string {
    char buf[48]{};
    std::snprintf(buf, sizeof(buf), "netlink:pid=%u,groups=0x%x", static_cast<unsigned>(pid_),
                  static_cast<unsigned>(groups_));
    return buf;
  }

  friend constexpr auto operator==(endpoint const&, endpoint const&) noexcept -> bool = default;
  friend constexpr auto operator<=>(endpoint const&, endpoint const&) noexcept = default;

 private:
  std::uint32_t pid_{0};
  std::uint32_t groups_{0};
};

}  // namespace sockany::netlink

template <>
struct std::hash<sockany::netlink::endpoint> {
  auto operator()(sockany::netlink::endpoint const& ep) const noexcept -> std::size_t {
    std::size_t h = 0;
    sockany::detail::hash_append(h, ep.pid());
    sockany::detail::hash_append(h, ep.groups());
    return h;
  }
};

#endif  // SOCKANY_HAS_NETLINK
