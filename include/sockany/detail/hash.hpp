#pragma once

#include <cstddef>
#include <functional>

namespace sockany::detail {

/// Mixes `v` into `seed` (golden-ratio constant, as boost::hash_combine does).
inline void hash_combine(std::size_t& seed, std::size_t v) noexcept {
  seed ^= v + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

template <class T>
inline void hash_append(std::size_t& seed, T const& v) noexcept {
  hash_combine(seed, std::hash<T>{}(v));
}

}  // namespace sockany::detail
