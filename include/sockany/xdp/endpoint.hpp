#pragma once

#include <sockany/config.hpp>

#if SOCKANY_HAS_XDP

#include <sockany/detail/hash.hpp>
#include <sockany/detail/native_codec.hpp>
#include <sockany/error.hpp>
#include <sockany/native_view.hpp>
#include <sockany/result.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <linux/if_xdp.h>
#include <sys/socket.h>

namespace sockany::xdp {

/// AF_XDP endpoint: interface index + RX/TX queue, with bind flags and an optional
/// shared UMEM socket.
///
/// All fields are host order on the wire.
class endpoint {
 public:
  using native_type = sockaddr_xdp;
  static constexpr int family_tag = AF_XDP;
  static constexpr std::size_t min_native_size = sizeof(sockaddr_xdp);

  constexpr endpoint() noexcept = default;
  constexpr endpoint(std::uint16_t flags, std::uint32_t ifindex, std::uint32_t queue_id,
                     std::uint32_t shared_umem_fd = 0) noexcept
      : flags_(flags), ifindex_(ifindex), queue_id_(queue_id), shared_umem_fd_(shared_umem_fd) {}

  constexpr auto flags() const noexcept -> std::uint16_t { return flags_; }
  constexpr auto ifindex() const noexcept -> std::uint32_t { return ifindex_; }
  constexpr auto queue_id() const noexcept -> std::uint32_t { return queue_id_; }
  constexpr auto shared_umem_fd() const noexcept -> std::uint32_t { return shared_umem_fd_; }
  constexpr auto family() const noexcept -> int { return family_tag; }

  auto encode() const noexcept -> sockaddr_xdp {
    auto sa = sockaddr_xdp{};
    sa.sxdp_family = AF_XDP;
    sa.sxdp_flags = flags_;
    sa.sxdp_ifindex = ifindex_;
    sa.sxdp_queue_id = queue_id_;
    sa.sxdp_shared_umem_fd = shared_umem_fd_;
    return sa;
  }

  static auto from_native(sockaddr const* addr, socklen_t len) noexcept -> result<endpoint> {
    if (auto r = sockany::detail::check_native(addr, len, AF_XDP, min_native_size); !r) {
      return unexpected(r.error());
    }
    auto const sa = sockany::detail::load_native<sockaddr_xdp>(addr);
    return endpoint{sa.sxdp_flags, sa.sxdp_ifindex, sa.sxdp_queue_id, sa.sxdp_shared_umem_fd};
  }

  auto to_native(sockaddr* out, socklen_t capacity) const noexcept -> result<socklen_t> {
    return copy_native(*this, out, capacity);
  }

  auto to_string() const -> std::string {
    return "xdp:ifindex=" + std::to_string(ifindex_) + ",queue=" + std::to_string(queue_id_);
  }

  friend constexpr auto operator==(endpoint const&, endpoint const&) noexcept -> bool = default;
  friend constexpr auto operator<=>(endpoint const&, endpoint const&) noexcept = default;

 private:
  std::uint16_t flags_{0};
  std::uint32_t ifindex_{0};
  std::uint32_t queue_id_{0};
  std::uint32_t shared_umem_fd_{0};
};

}  // namespace sockany::xdp

template <>
struct std::hash<sockany::xdp::endpoint> {
  auto operator()(sockany::xdp::endpoint const& ep) const noexcept -> std::size_t {
    std::size_t h = 0;
    sockany::detail::hash_append(h, ep.flags());
    sockany::detail::hash_append(h, ep.ifindex());
    sockany::detail::hash_append(h, ep.queue_id());
    sockany::detail::hash_append(h, ep.shared_umem_fd());
    return h;
  }
};

#endif  // SOCKANY_HAS_XDP
