#pragma once

#include <sockany/ip/address_v4.hpp>
#include <sockany/ip/address_v6.hpp>

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <variant>

namespace sockany::ip {

/// Generic IP address value type (v4 or v6).
class address {
 public:
  constexpr address() noexcept : storage_(address_v4{}) {}
  constexpr address(address_v4 v4) noexcept : storage_(v4) {}
  constexpr address(address_v6 v6) noexcept : storage_(v6) {}

  friend constexpr auto operator==(address const&, address const&) noexcept -> bool = default;
  friend constexpr auto operator<=>(address const&, address const&) noexcept = default;

  constexpr auto is_v4() const noexcept -> bool {
    return std::holds_alternative<address_v4>(storage_);
  }
  constexpr auto is_v6() const noexcept -> bool {
    return std::holds_alternative<address_v6>(storage_);
  }

  constexpr auto to_v4() const -> address_v4 { return std::get<address_v4>(storage_); }
  constexpr auto to_v6() const -> address_v6 { return std::get<address_v6>(storage_); }

  auto to_string() const -> std::string {
    if (is_v4()) {
      return std::get<address_v4>(storage_).to_string();
    }
    return std::get<address_v6>(storage_).to_string();
  }

 private:
  std::variant<address_v4, address_v6> storage_;
};

}  // namespace sockany::ip
