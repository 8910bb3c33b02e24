#include <sockany/any_endpoint.hpp>

#include <sockany/detail/native_codec.hpp>

#include <cstddef>
#include <cstring>
#include <ostream>
#include <string>
#include <variant>

namespace sockany {

inline any_endpoint::any_endpoint(ip::endpoint const& ep) noexcept {
  ep.visit([&](auto const& alt) { storage_ = alt; });
}

inline auto any_endpoint::family() const noexcept -> int {
  return visit([](auto const& ep) { return ep.family(); });
}

inline auto any_endpoint::encode() const noexcept -> sockaddr_storage {
  auto ss = sockaddr_storage{};
  with_native([&](sockaddr const* addr, socklen_t len) {
    SOCKANY_ASSERT(static_cast<std::size_t>(len) <= sizeof(ss));
    std::memcpy(&ss, addr, static_cast<std::size_t>(len));
  });
  return ss;
}

inline auto any_endpoint::to_native(sockaddr* out, socklen_t capacity) const noexcept
  -> result<socklen_t> {
  return copy_native(*this, out, capacity);
}

inline auto any_endpoint::from_native(sockaddr const* addr, socklen_t len) noexcept
  -> result<any_endpoint> {
  if (auto r = detail::check_discriminant(addr, len); !r) {
    return unexpected(r.error());
  }
  if (static_cast<std::size_t>(len) > sizeof(sockaddr_storage)) {
    return unexpected(error::invalid_endpoint);
  }
  return detail::decode_alternative<any_endpoint, endpoint_variant>(detail::read_family(addr),
                                                                    addr, len);
}

inline auto any_endpoint::to_string() const -> std::string {
  return visit([](auto const& ep) { return ep.to_string(); });
}

inline auto operator<<(std::ostream& os, any_endpoint const& ep) -> std::ostream& {
  return os << ep.to_string();
}

inline auto read(native_storage const& storage, socklen_t len) noexcept -> result<any_endpoint> {
  return any_endpoint::from_native(storage.data(), len);
}

}  // namespace sockany
