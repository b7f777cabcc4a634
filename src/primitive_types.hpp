#ifndef INFALLIBLE_PRIMITIVE_TYPES_HPP
#define INFALLIBLE_PRIMITIVE_TYPES_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace infallible {

#if defined __GNUC__ || defined __clang__
using int128 = __int128;
using uint128 = unsigned __int128;
#else
#error "A 128-bit integer type is required"
#endif

namespace detail {
  template <typename T, typename... Ts>
  concept one_of = (std::same_as<T, Ts> || ...);
}

// The standard signed integer types plus the 128-bit extension. Every
// std::intN_t and std::ptrdiff_t is an alias of one of these. Plain char, bool
// and the character types are deliberately not members.
template <typename T>
concept signed_primitive
  = detail::one_of<T, signed char, short, int, long, long long, int128>;

template <typename T>
concept unsigned_primitive
  = detail::one_of<T,
                   unsigned char, unsigned short, unsigned, unsigned long,
                   unsigned long long, uint128>;

template <typename T>
concept primitive_integer = signed_primitive<T> || unsigned_primitive<T>;

template <typename T>
concept convertible_floating_point = detail::one_of<T, float, double>;

template <typename>
struct primitive_name;

template <>
struct primitive_name<signed char> {
  static constexpr char const* value = "signed char";
};

template <>
struct primitive_name<short> {
  static constexpr char const* value = "short";
};

template <>
struct primitive_name<int> {
  static constexpr char const* value = "int";
};

template <>
struct primitive_name<long> {
  static constexpr char const* value = "long";
};

template <>
struct primitive_name<long long> {
  static constexpr char const* value = "long long";
};

template <>
struct primitive_name<int128> {
  static constexpr char const* value = "int128";
};

template <>
struct primitive_name<unsigned char> {
  static constexpr char const* value = "unsigned char";
};

template <>
struct primitive_name<unsigned short> {
  static constexpr char const* value = "unsigned short";
};

template <>
struct primitive_name<unsigned> {
  static constexpr char const* value = "unsigned";
};

template <>
struct primitive_name<unsigned long> {
  static constexpr char const* value = "unsigned long";
};

template <>
struct primitive_name<unsigned long long> {
  static constexpr char const* value = "unsigned long long";
};

template <>
struct primitive_name<uint128> {
  static constexpr char const* value = "uint128";
};

template <>
struct primitive_name<float> {
  static constexpr char const* value = "float";
};

template <>
struct primitive_name<double> {
  static constexpr char const* value = "double";
};

template <typename T>
constexpr char const*
type_name() { return primitive_name<T>::value; }

// Magnitude of an integer as a 128-bit unsigned value. Well-defined for the
// minimum of every signed type, including int128.
template <primitive_integer T>
constexpr uint128
magnitude(T value) {
  if constexpr (signed_primitive<T>) {
    if (value < 0)
      return uint128{0} - static_cast<uint128>(value);
  }
  return static_cast<uint128>(value);
}

} // namespace infallible

#endif
