#pragma once

#include <sockany/assert.hpp>
#include <sockany/native_view.hpp>

#include <cstddef>
#include <cstring>
#include <span>

#include <sys/socket.h>

namespace sockany {

/// Untyped socket-address buffer large enough for every supported family.
///
/// The buffer carries no length of its own: whatever filled it (a system call, `write()`)
/// reports the number of valid bytes out of band, and every read is parameterized by it.
/// Contents start zeroed so an unfilled buffer never exposes indeterminate bytes.
class native_storage {
 public:
  native_storage() noexcept = default;

  auto data() noexcept -> sockaddr* { return reinterpret_cast<sockaddr*>(&storage_); }
  auto data() const noexcept -> sockaddr const* {
    return reinterpret_cast<sockaddr const*>(&storage_);
  }

  static constexpr auto capacity() noexcept -> socklen_t {
    return static_cast<socklen_t>(sizeof(sockaddr_storage));
  }

  auto bytes() noexcept -> std::span<std::byte, sizeof(sockaddr_storage)> {
    return std::span<std::byte, sizeof(sockaddr_storage)>{
      reinterpret_cast<std::byte*>(&storage_), sizeof(sockaddr_storage)};
  }
  auto bytes() const noexcept -> std::span<std::byte const, sizeof(sockaddr_storage)> {
    return std::span<std::byte const, sizeof(sockaddr_storage)>{
      reinterpret_cast<std::byte const*>(&storage_), sizeof(sockaddr_storage)};
  }

 private:
  sockaddr_storage storage_{};
};

/// Encode `ep` into `out` and return the number of bytes written.
///
/// Cannot fail: `native_encodable` guarantees the layout fits sockaddr_storage.
template <native_encodable E>
auto write(E const& ep, native_storage& out) noexcept -> socklen_t {
  return with_native(ep, [&](sockaddr const* addr, socklen_t len) {
    SOCKANY_ASSERT(len <= native_storage::capacity(), "native layout exceeds sockaddr_storage");
    std::memcpy(out.data(), addr, static_cast<std::size_t>(len));
    return len;
  });
}

}  // namespace sockany
