// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <functional>
#include <utility>

namespace spinalg::utils {

/**
 * @brief Mixes the hash of @p v into @p seed.
 *
 * Golden-ratio mixing in the style of boost::hash_combine.
 *
 * @tparam T The type of value to hash.
 * @tparam Hasher The hash function type (defaults to std::hash<T>).
 * @param seed The running hash value.
 * @param v The value to fold into the seed.
 * @return The combined hash value.
 */
template <typename T, typename Hasher = std::hash<T>>
inline std::size_t hash_combine(std::size_t seed, const T& v) {
  Hasher h;
  return seed ^ (h(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

/**
 * @brief Folds several values into @p seed, left to right.
 *
 * @code
 *   std::size_t h = hash_combine(0, site, generator, exponent);
 * @endcode
 */
template <typename T, typename... Args>
inline std::size_t hash_combine(std::size_t seed, const T& v, Args&&... args) {
  return hash_combine(hash_combine(seed, v), std::forward<Args>(args)...);
}

}  // namespace spinalg::utils
