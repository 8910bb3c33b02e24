#include <sockany/local/endpoint.hpp>

#include <sockany/detail/native_codec.hpp>
#include <sockany/native_view.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

namespace sockany::local {

inline auto endpoint::from_path(std::string_view path) noexcept -> result<endpoint> {
  if (path.empty()) {
    return endpoint{};
  }
  if (path.size() > max_path_length) {
    return unexpected(error::path_too_long);
  }
  if (path.find('\0') != std::string_view::npos) {
    return unexpected(error::invalid_argument);
  }

  endpoint ep{};
  std::memcpy(ep.addr_.sun_path, path.data(), path.size());
  // sun_path is zero-filled, so the terminator is already in place.
  ep.size_ = static_cast<socklen_t>(min_native_size + path.size() + 1);
  return ep;
}

#if SOCKANY_HAS_ABSTRACT_LOCAL
inline auto endpoint::from_abstract(std::string_view name) noexcept -> result<endpoint> {
  if (name.empty()) {
    return unexpected(error::invalid_argument);
  }
  if (name.size() > max_path_length) {
    return unexpected(error::path_too_long);
  }

  endpoint ep{};
  // First byte is NUL, rest is name bytes without NUL terminator.
  std::memcpy(ep.addr_.sun_path + 1, name.data(), name.size());
  ep.size_ = static_cast<socklen_t>(min_native_size + 1 + name.size());
  return ep;
}
#endif

inline auto endpoint::from_native(sockaddr const* addr, socklen_t len) noexcept
  -> result<endpoint> {
  if (auto r = sockany::detail::check_native(addr, len, AF_UNIX, min_native_size); !r) {
    return unexpected(r.error());
  }
  auto const n = static_cast<std::size_t>(len);
  if (n > sizeof(sockaddr_un)) {
    return unexpected(error::invalid_endpoint);
  }

  endpoint ep{};
  auto const* src = reinterpret_cast<unsigned char const*>(addr) + min_native_size;
  auto const path_bytes = n - min_native_size;
  if (path_bytes == 0) {
    return ep;
  }

  if (src[0] == '\0') {
#if SOCKANY_HAS_ABSTRACT_LOCAL
    // Reject empty abstract name (sun_path[0] == '\0' and no further bytes).
    if (path_bytes == 1) {
      return unexpected(error::invalid_endpoint);
    }
    std::memcpy(ep.addr_.sun_path, src, path_bytes);
    ep.size_ = len;
    return ep;
#else
    // Some kernels report an unnamed socket as a zero-filled sun_path. Anything else
    // after a leading NUL is an abstract name, which this build does not model.
    if (std::find_if(src, src + path_bytes, [](unsigned char c) { return c != 0; }) !=
        src + path_bytes) {
      return unexpected(error::invalid_endpoint);
    }
    return ep;
#endif
  }

  // Pathname: the reported length may run past the terminator (or, when the path fills
  // sun_path exactly, there is none). Only bytes before the first NUL are significant.
  auto const* nul = static_cast<unsigned char const*>(std::memchr(src, '\0', path_bytes));
  auto const path_len = nul ? static_cast<std::size_t>(nul - src) : path_bytes;
  if (path_len > max_path_length) {
    return unexpected(error::path_too_long);
  }
  std::memcpy(ep.addr_.sun_path, src, path_len);
  ep.size_ = static_cast<socklen_t>(min_native_size + path_len + 1);
  return ep;
}

inline auto endpoint::to_native(sockaddr* out, socklen_t capacity) const noexcept
  -> result<socklen_t> {
  return copy_native(*this, out, capacity);
}

inline auto endpoint::path() const noexcept -> std::string_view {
  if (!is_pathname()) {
    return {};
  }
  auto const bytes = name_bytes();
  return bytes.substr(0, bytes.size() - 1);
}

inline auto endpoint::abstract_name() const noexcept -> std::string_view {
  if (!is_abstract()) {
    return {};
  }
  return name_bytes().substr(1);
}

inline auto endpoint::path_length() const noexcept -> std::size_t {
  if (is_pathname()) {
    return path().size();
  }
  if (is_abstract()) {
    return abstract_name().size();
  }
  return 0;
}

inline auto endpoint::to_string() const -> std::string {
  if (is_unnamed()) {
    return "(unnamed)";
  }
  if (is_pathname()) {
    return std::string(path());
  }

  std::string out = "@";
  for (auto c : abstract_name()) {
    auto const b = static_cast<unsigned char>(c);
    if (b >= 0x20 && b < 0x7f && b != '\\') {
      out.push_back(c);
    } else {
      char buf[5]{};
      std::snprintf(buf, sizeof(buf), "\\x%02x", b);
      out += buf;
    }
  }
  return out;
}

}  // namespace sockany::local
