#ifndef INFALLIBLE_TO_BIG_UINT_HPP
#define INFALLIBLE_TO_BIG_UINT_HPP

#include "big_integer.hpp"
#include "conversion_defect.hpp"
#include "primitive_types.hpp"
#include "try_convert.hpp"

#include <concepts>
#include <utility>

namespace infallible {

// Conversion to big_uint that can't fail, specialized for the unsigned
// primitive integers only. Signed types are excluded since negative values
// have no big_uint equivalent; floating-point types for the same reason as in
// to_big_int.
//
// Usage:
//
//   big_uint b = to_big_uint(153830u);
//
//   void
//   do_great_things(infallible_big_uint_source auto x) {
//     big_uint b = to_big_uint(x);
//     ...
//   }
template <typename>
struct infallible_to_big_uint { };

namespace detail {
  template <typename T>
  struct unwrap_to_big_uint {
    static big_uint
    convert(T value) {
      if (auto result = try_to_big_uint(value))
        return std::move(*result);

      report_conversion_defect("to_big_uint", type_name<T>());
    }
  };
}

template <>
struct infallible_to_big_uint<unsigned char>
  : detail::unwrap_to_big_uint<unsigned char>
{ };

template <>
struct infallible_to_big_uint<unsigned short>
  : detail::unwrap_to_big_uint<unsigned short>
{ };

template <>
struct infallible_to_big_uint<unsigned>
  : detail::unwrap_to_big_uint<unsigned>
{ };

template <>
struct infallible_to_big_uint<unsigned long>
  : detail::unwrap_to_big_uint<unsigned long>
{ };

template <>
struct infallible_to_big_uint<unsigned long long>
  : detail::unwrap_to_big_uint<unsigned long long>
{ };

template <>
struct infallible_to_big_uint<uint128>
  : detail::unwrap_to_big_uint<uint128>
{ };

template <typename T>
concept infallible_big_uint_source = requires (T value) {
  { infallible_to_big_uint<T>::convert(value) } -> std::same_as<big_uint>;
};

template <infallible_big_uint_source T>
big_uint
to_big_uint(T value) {
  return infallible_to_big_uint<T>::convert(value);
}

big_uint
to_big_uint(float) = delete;

big_uint
to_big_uint(double) = delete;

big_uint
to_big_uint(long double) = delete;

} // namespace infallible

#endif
