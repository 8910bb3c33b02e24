#pragma once

#include <sockany/detail/hash.hpp>

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace sockany::ip {

/// IPv4 address value type. Bytes are kept in network order.
class address_v4 {
 public:
  using bytes_type = std::array<std::uint8_t, 4>;

  constexpr address_v4() noexcept = default;
  explicit constexpr address_v4(bytes_type bytes) noexcept : bytes_(bytes) {}

  static constexpr auto any() noexcept -> address_v4 { return address_v4{}; }
  static constexpr auto loopback() noexcept -> address_v4 { return address_v4{{127, 0, 0, 1}}; }

  constexpr auto to_bytes() const noexcept -> bytes_type { return bytes_; }

  /// Host-order integer form (127.0.0.1 -> 0x7f000001).
  constexpr auto to_uint() const noexcept -> std::uint32_t {
    return (std::uint32_t{bytes_[0]} << 24) | (std::uint32_t{bytes_[1]} << 16) |
           (std::uint32_t{bytes_[2]} << 8) | std::uint32_t{bytes_[3]};
  }

  constexpr auto is_unspecified() const noexcept -> bool { return bytes_ == bytes_type{}; }
  constexpr auto is_loopback() const noexcept -> bool { return bytes_[0] == 127; }

  friend constexpr auto operator==(address_v4 const&, address_v4 const&) noexcept -> bool = default;
  friend constexpr auto operator<=>(address_v4 const&, address_v4 const&) noexcept = default;

  /// Dotted-quad form.
  auto to_string() const -> std::string;

 private:
  bytes_type bytes_{};
};

}  // namespace sockany::ip

template <>
struct std::hash<sockany::ip::address_v4> {
  auto operator()(sockany::ip::address_v4 const& a) const noexcept -> std::size_t {
    return std::hash<std::uint32_t>{}(a.to_uint());
  }
};

#include <sockany/ip/impl/address_v4.ipp>
