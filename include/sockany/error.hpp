#pragma once

#include <system_error>
#include <type_traits>

namespace sockany {

enum class error {
  /// Null pointer or malformed input (e.g. a pathname with an embedded NUL).
  invalid_argument = 1,

  /// Length is below the discriminant size or the minimum layout of its family.
  too_short,

  /// Discriminant is not one of the families compiled into this build.
  unsupported_address_family,

  /// Unix-domain path or abstract name exceeds sun_path.
  path_too_long,

  /// Declared length exceeds the layout or the storage it claims to describe.
  invalid_endpoint,

  /// Destination buffer is smaller than the encoded address.
  no_buffer_space,
};

auto make_error_code(error e) -> std::error_code;

}  // namespace sockany

namespace std {

template <>
struct is_error_code_enum<sockany::error> : std::true_type {};

}  // namespace std
