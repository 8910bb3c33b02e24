#pragma once

#include <sockany/config.hpp>
#include <sockany/detail/hash.hpp>
#include <sockany/error.hpp>
#include <sockany/result.hpp>

#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <sys/socket.h>
#include <sys/un.h>

namespace sockany::local {

/// Local (AF_UNIX) endpoint.
///
/// Semantics:
/// - Wraps a native `sockaddr_un` + significant length, so the exact layout the kernel
///   reported (or will be given) is preserved and lent out without copying.
/// - Three shapes: unnamed (no path bytes), pathname (NUL-terminated), and on Linux the
///   abstract namespace (leading NUL, name bytes may contain NUL, no terminator).
///
/// Error handling:
/// - Construction and `from_native()` reject invalid input with an error_code;
///   no endpoint with an oversized path is ever observable.
class endpoint {
 public:
  using native_type = sockaddr_un;
  static constexpr int family_tag = AF_UNIX;

  /// Longest pathname (excluding the NUL terminator) or abstract name.
  static constexpr std::size_t max_path_length = sizeof(sockaddr_un::sun_path) - 1;

  /// Shortest length `from_native()` accepts: the family field alone (unnamed).
  static constexpr std::size_t min_native_size = offsetof(sockaddr_un, sun_path);

  /// The unnamed endpoint (e.g. an unbound socket or a socketpair peer).
  endpoint() noexcept { addr_.sun_family = AF_UNIX; }

  static auto unnamed() noexcept -> endpoint { return endpoint{}; }

  /// Create a pathname endpoint (e.g. "/tmp/app.sock").
  ///
  /// An empty path yields the unnamed endpoint.
  /// Returns:
  /// - path_too_long if the path plus NUL terminator does not fit sun_path
  /// - invalid_argument if the path contains a NUL byte
  static auto from_path(std::string_view path) noexcept -> result<endpoint>;

#if SOCKANY_HAS_ABSTRACT_LOCAL
  /// Create a Linux abstract-namespace endpoint.
  ///
  /// `name` is the bytes after the leading NUL; it may itself contain NUL bytes.
  /// Returns:
  /// - invalid_argument if name is empty
  /// - path_too_long if name is longer than max_path_length
  static auto from_abstract(std::string_view name) noexcept -> result<endpoint>;
#endif

  /// Construct from native sockaddr.
  ///
  /// Returns:
  /// - invalid_argument if addr is null
  /// - too_short if len does not cover sun_family
  /// - unsupported_address_family if family != AF_UNIX
  /// - invalid_endpoint if len exceeds sizeof(sockaddr_un), names an empty abstract name,
  ///   or names an abstract endpoint in a build without SOCKANY_HAS_ABSTRACT_LOCAL
  /// - path_too_long if the reported pathname fills sun_path with no terminator
  static auto from_native(sockaddr const* addr, socklen_t len) noexcept -> result<endpoint>;

  /// Copy the native sockaddr representation into the user-provided buffer.
  auto to_native(sockaddr* out, socklen_t capacity) const noexcept -> result<socklen_t>;

  /// Returns a copy of the held sockaddr_un; bytes past `size()` are zero.
  auto encode() const noexcept -> sockaddr_un { return addr_; }

  /// Invoke `f` with a pointer into this object and the significant length.
  template <class F>
    requires std::invocable<F, sockaddr const*, socklen_t>
  auto with_native(F&& f) const -> std::invoke_result_t<F, sockaddr const*, socklen_t> {
    return std::invoke(std::forward<F>(f), data(), size());
  }

  auto data() const noexcept -> sockaddr const* {
    return reinterpret_cast<sockaddr const*>(&addr_);
  }
  auto size() const noexcept -> socklen_t { return size_; }
  auto family() const noexcept -> int { return family_tag; }

  auto is_unnamed() const noexcept -> bool { return size_ == min_native_size; }
  auto is_abstract() const noexcept -> bool { return !is_unnamed() && addr_.sun_path[0] == '\0'; }
  auto is_pathname() const noexcept -> bool { return !is_unnamed() && !is_abstract(); }

  /// Pathname without terminator; empty unless `is_pathname()`.
  auto path() const noexcept -> std::string_view;

  /// Abstract name without the leading NUL; empty unless `is_abstract()`.
  auto abstract_name() const noexcept -> std::string_view;

  /// Significant name bytes: path length for pathnames, name length for abstract
  /// endpoints, 0 when unnamed. "/tmp/sock" -> 9.
  auto path_length() const noexcept -> std::size_t;

  /// Path as-is, "@name" with non-printable bytes as \xNN, or "(unnamed)".
  auto to_string() const -> std::string;

  friend auto operator==(endpoint const& a, endpoint const& b) noexcept -> bool {
    return a.name_bytes() == b.name_bytes();
  }

  /// Orders unnamed < abstract < pathname, then bytewise.
  friend auto operator<=>(endpoint const& a, endpoint const& b) noexcept -> std::strong_ordering {
    return a.name_bytes() <=> b.name_bytes();
  }

 private:
  // sun_path[0, size_ - offsetof(sun_path)): includes the pathname terminator and the
  // abstract leading NUL, so the three shapes never collide.
  auto name_bytes() const noexcept -> std::string_view {
    return {addr_.sun_path, static_cast<std::size_t>(size_) - min_native_size};
  }

  sockaddr_un addr_{};
  socklen_t size_{static_cast<socklen_t>(min_native_size)};
};

}  // namespace sockany::local

template <>
struct std::hash<sockany::local::endpoint> {
  auto operator()(sockany::local::endpoint const& ep) const noexcept -> std::size_t {
    // Equal endpoints share size and bytes: everything past size() is zero-filled.
    return std::hash<std::string_view>{}(
      std::string_view{reinterpret_cast<char const*>(ep.data()), static_cast<std::size_t>(ep.size())});
  }
};

#include <sockany/local/impl/endpoint.ipp>
