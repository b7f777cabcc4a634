#ifndef INFALLIBLE_TRY_CONVERT_HPP
#define INFALLIBLE_TRY_CONVERT_HPP

#include "big_integer.hpp"
#include "primitive_types.hpp"

#include <optional>
#include <utility>

namespace infallible {

namespace detail {
  big_int
  make_big_int(uint128 magnitude, bool negative);

  // Empty unless value is finite and whole.
  std::optional<big_int>
  whole_to_big_int(double value);
}

// Fallible conversions. These accept a wider set of types than to_big_int and
// to_big_uint and report values that can't be represented exactly by
// returning an empty optional.

template <primitive_integer T>
std::optional<big_int>
try_to_big_int(T value) {
  if constexpr (signed_primitive<T>)
    return detail::make_big_int(magnitude(value), value < 0);
  else
    return detail::make_big_int(value, false);
}

template <convertible_floating_point T>
std::optional<big_int>
try_to_big_int(T value) {
  return detail::whole_to_big_int(static_cast<double>(value));
}

template <primitive_integer T>
std::optional<big_uint>
try_to_big_uint(T value) {
  if constexpr (signed_primitive<T>) {
    if (value < 0)
      return std::nullopt;
  }

  return big_uint{detail::make_big_int(static_cast<uint128>(value), false)};
}

template <convertible_floating_point T>
std::optional<big_uint>
try_to_big_uint(T value) {
  if (value < 0)
    return std::nullopt;

  if (auto result = detail::whole_to_big_int(static_cast<double>(value)))
    return big_uint{std::move(*result)};
  else
    return std::nullopt;
}

} // namespace infallible

#endif
