#pragma once

#include <sockany/detail/hash.hpp>

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace sockany::ip {

/// IPv6 address value type.
///
/// The scope id (zone index) travels with the address, as in "fe80::1%2";
/// it is part of equality and ordering.
class address_v6 {
 public:
  using bytes_type = std::array<std::uint8_t, 16>;

  constexpr address_v6() noexcept = default;
  explicit constexpr address_v6(bytes_type bytes, std::uint32_t scope_id = 0) noexcept
      : bytes_(bytes), scope_id_(scope_id) {}

  static constexpr auto any() noexcept -> address_v6 { return address_v6{}; }
  static constexpr auto loopback() noexcept -> address_v6 {
    auto b = bytes_type{};
    b[15] = 1;
    return address_v6{b};
  }

  constexpr auto to_bytes() const noexcept -> bytes_type { return bytes_; }
  constexpr auto scope_id() const noexcept -> std::uint32_t { return scope_id_; }

  constexpr auto is_unspecified() const noexcept -> bool { return bytes_ == bytes_type{}; }
  constexpr auto is_loopback() const noexcept -> bool {
    return bytes_ == loopback().bytes_ && scope_id_ == 0;
  }

  friend constexpr auto operator==(address_v6 const&, address_v6 const&) noexcept -> bool = default;
  friend constexpr auto operator<=>(address_v6 const&, address_v6 const&) noexcept = default;

  auto to_string() const -> std::string;

 private:
  bytes_type bytes_{};
  std::uint32_t scope_id_{0};
};

}  // namespace sockany::ip

template <>
struct std::hash<sockany::ip::address_v6> {
  auto operator()(sockany::ip::address_v6 const& a) const noexcept -> std::size_t {
    std::size_t h = 0;
    for (auto b : a.to_bytes()) {
      sockany::detail::hash_append(h, b);
    }
    sockany::detail::hash_append(h, a.scope_id());
    return h;
  }
};

#include <sockany/ip/impl/address_v6.ipp>
