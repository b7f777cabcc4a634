#ifndef INFALLIBLE_TO_BIG_INT_HPP
#define INFALLIBLE_TO_BIG_INT_HPP

#include "big_integer.hpp"
#include "conversion_defect.hpp"
#include "primitive_types.hpp"
#include "try_convert.hpp"

#include <concepts>
#include <utility>

namespace infallible {

// Conversion to big_int that can't fail. Only the types for which the
// conversion is exact for every value have a specialization: the signed and
// unsigned primitive integers. Floating-point types are excluded because NaN,
// infinities and fractions have no big_int equivalent.
//
// Usage:
//
//   big_int b = to_big_int(153830);
//
//   void
//   do_great_things(infallible_big_int_source auto x) {
//     big_int b = to_big_int(x);
//     ...
//   }
template <typename>
struct infallible_to_big_int { };

namespace detail {
  template <typename T>
  struct unwrap_to_big_int {
    static big_int
    convert(T value) {
      if (auto result = try_to_big_int(value))
        return std::move(*result);

      report_conversion_defect("to_big_int", type_name<T>());
    }
  };
}

template <>
struct infallible_to_big_int<signed char> : detail::unwrap_to_big_int<signed char> { };

template <>
struct infallible_to_big_int<short> : detail::unwrap_to_big_int<short> { };

template <>
struct infallible_to_big_int<int> : detail::unwrap_to_big_int<int> { };

template <>
struct infallible_to_big_int<long> : detail::unwrap_to_big_int<long> { };

template <>
struct infallible_to_big_int<long long> : detail::unwrap_to_big_int<long long> { };

template <>
struct infallible_to_big_int<int128> : detail::unwrap_to_big_int<int128> { };

template <>
struct infallible_to_big_int<unsigned char>
  : detail::unwrap_to_big_int<unsigned char>
{ };

template <>
struct infallible_to_big_int<unsigned short>
  : detail::unwrap_to_big_int<unsigned short>
{ };

template <>
struct infallible_to_big_int<unsigned> : detail::unwrap_to_big_int<unsigned> { };

template <>
struct infallible_to_big_int<unsigned long>
  : detail::unwrap_to_big_int<unsigned long>
{ };

template <>
struct infallible_to_big_int<unsigned long long>
  : detail::unwrap_to_big_int<unsigned long long>
{ };

template <>
struct infallible_to_big_int<uint128> : detail::unwrap_to_big_int<uint128> { };

template <typename T>
concept infallible_big_int_source = requires (T value) {
  { infallible_to_big_int<T>::convert(value) } -> std::same_as<big_int>;
};

template <infallible_big_int_source T>
big_int
to_big_int(T value) {
  return infallible_to_big_int<T>::convert(value);
}

big_int
to_big_int(float) = delete;

big_int
to_big_int(double) = delete;

big_int
to_big_int(long double) = delete;

} // namespace infallible

#endif
