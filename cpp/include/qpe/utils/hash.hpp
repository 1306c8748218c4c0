// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <functional>
#include <utility>

namespace qpe::utils {

/**
 * @brief Combines a hash value with the hash of another value.
 *
 * Variant of boost::hash_combine using the golden ratio constant.
 *
 * @tparam T The type of value to hash.
 * @tparam Hasher The hash function type (defaults to std::hash<T>).
 * @param seed The existing hash value to combine with.
 * @param v The value to hash and combine.
 * @return The combined hash value.
 */
template <typename T, typename Hasher = std::hash<T>>
inline std::size_t hash_combine(std::size_t seed, const T& v) {
  Hasher h;
  return seed ^ (h(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

/**
 * @brief Variadic overload combining a hash seed with multiple values,
 * left to right.
 */
template <typename T, typename... Args>
inline std::size_t hash_combine(std::size_t seed, const T& v, Args&&... args) {
  return hash_combine(hash_combine(seed, v), std::forward<Args>(args)...);
}

}  // namespace qpe::utils
