#pragma once

#include <sockany/error.hpp>
#include <sockany/result.hpp>

#include <cstddef>
#include <cstring>
#include <type_traits>
#include <utility>
#include <variant>

#include <sys/socket.h>

namespace sockany::detail {

/// Reads the family discriminant of a native socket address.
///
/// Preconditions: `addr` is non-null and `len >= sizeof(sa_family_t)`.
/// The field is copied out byte-wise so that `addr` may point into any byte buffer.
inline auto read_family(sockaddr const* addr) noexcept -> int {
  sa_family_t family{};
  std::memcpy(&family,
              reinterpret_cast<unsigned char const*>(addr) + offsetof(sockaddr, sa_family),
              sizeof(family));
  return static_cast<int>(family);
}

/// Checks that `addr` is non-null and `len` covers the family discriminant.
inline auto check_discriminant(sockaddr const* addr, socklen_t len) noexcept -> void_result {
  if (addr == nullptr) {
    return fail(error::invalid_argument);
  }
  if (static_cast<std::size_t>(len) < offsetof(sockaddr, sa_family) + sizeof(sa_family_t)) {
    return fail(error::too_short);
  }
  return ok();
}

/// Validation shared by every family decoder.
///
/// Order matters: the discriminant is inspected before any other field, and only after
/// `len` proves it is present.
inline auto check_native(sockaddr const* addr, socklen_t len, int family,
                         std::size_t min_len) noexcept -> void_result {
  if (auto r = check_discriminant(addr, len); !r) {
    return r;
  }
  if (read_family(addr) != family) {
    return fail(error::unsupported_address_family);
  }
  if (static_cast<std::size_t>(len) < min_len) {
    return fail(error::too_short);
  }
  return ok();
}

/// Copies a fixed-size native layout out of caller memory.
///
/// Only `sizeof(Native)` bytes are read; a longer `len` (e.g. a sockaddr_storage-sized
/// length reported by the kernel) is accepted and the excess ignored.
template <class Native>
inline auto load_native(sockaddr const* addr) noexcept -> Native {
  static_assert(std::is_trivially_copyable_v<Native>);
  Native out{};
  std::memcpy(&out, addr, sizeof(Native));
  return out;
}

/// Try each alternative of `Variant` in order; the one whose `family_tag` matches
/// decodes the buffer and the result is wrapped into `Target`.
///
/// Preconditions: `check_discriminant(addr, len)` succeeded.
template <class Target, class Variant, std::size_t I = 0>
inline auto decode_alternative(int family, sockaddr const* addr, socklen_t len) noexcept
  -> result<Target> {
  if constexpr (I == std::variant_size_v<Variant>) {
    return unexpected(error::unsupported_address_family);
  } else {
    using alternative = std::variant_alternative_t<I, Variant>;
    if (family == alternative::family_tag) {
      return alternative::from_native(addr, len).transform(
        [](alternative ep) { return Target{std::move(ep)}; });
    }
    return decode_alternative<Target, Variant, I + 1>(family, addr, len);
  }
}

}  // namespace sockany::detail
