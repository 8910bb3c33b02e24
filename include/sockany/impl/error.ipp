#include <sockany/error.hpp>

#include <string>

namespace sockany {

namespace detail {

class error_category_impl : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "sockany"; }

  auto message(int ev) const -> std::string override {
    switch (static_cast<error>(ev)) {
      case error::invalid_argument:
        return "invalid argument";

      // Decoding
      case error::too_short:
        return "socket address too short";
      case error::unsupported_address_family:
        return "unsupported address family";
      case error::invalid_endpoint:
        return "invalid endpoint";

      // Encoding / construction
      case error::path_too_long:
        return "path too long";
      case error::no_buffer_space:
        return "no buffer space";
      default:
        return "unknown error";
    }
  }
};

auto error_category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

auto make_error_code(error e) -> std::error_code {
  return {static_cast<int>(e), detail::error_category()};
}

}  // namespace sockany
