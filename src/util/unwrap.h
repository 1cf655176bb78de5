// Copyright (c) 2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef TCT_UTIL_UNWRAP_H
#define TCT_UTIL_UNWRAP_H

#include <cassert>
#include <optional>
#include <type_traits>
#include <tl/expected.hpp>

/** @file
 * `try_unwrap(x) or_return` evaluates `x` (a `tl::expected` or `std::optional`), returns its
 * error (or `std::nullopt`) from the enclosing function if it holds no value, and otherwise
 * yields the value (nothing when the value type is void).
 *
 * `try_unwrap(x) or_assert` asserts that `x` holds a value instead of returning. Use it where
 * an empty result would be a bug in the caller, such as inserting into a tier that is known
 * to be empty.
 *
 * Both rely on the GCC/clang statement expression extension.
 */

// Work around the fact that `tl::expected::value()` doesn't exist if the value type is void.
template<typename T> void
maybe_value(const T& e, typename std::enable_if<std::is_void<typename T::value_type>::value>::type* = nullptr) { }

template<typename T> typename T::value_type
maybe_value(const T& e, typename std::enable_if<!std::is_void<typename T::value_type>::value>::type* = nullptr) { return e.value(); }

template<typename V, typename E> decltype(auto)
adapt_error(const tl::expected<V, E>& m) { return tl::make_unexpected(m.error()); }

template<typename V> std::nullopt_t
adapt_error(const std::optional<V>& m) { return std::nullopt; }

#define try_unwrap(...) ({ auto m_ = (__VA_ARGS__);
#define or_return if (!m_.has_value()) { return adapt_error(m_); } maybe_value(m_); })
#define or_assert assert(m_.has_value()); maybe_value(m_); })

#endif // TCT_UTIL_UNWRAP_H
