#ifndef INFALLIBLE_BIG_INTEGER_HPP
#define INFALLIBLE_BIG_INTEGER_HPP

#include <fmt/format.h>
#include <gmpxx.h>

#include <compare>
#include <iosfwd>
#include <string>
#include <string_view>

namespace infallible {

// An arbitrary-precision signed integer.
using big_int = mpz_class;

std::string
to_string(big_int const&, int base = 10);

// An arbitrary-precision integer that is never negative.
class big_uint {
public:
  big_uint() = default;

  explicit
  big_uint(big_int value);

  big_int const&
  value() const { return value_; }

  bool
  zero() const { return sgn(value_) == 0; }

  std::string
  to_string(int base = 10) const;

  big_uint&
  operator += (big_uint const& other);

  big_uint&
  operator *= (big_uint const& other);

  friend bool
  operator == (big_uint const& lhs, big_uint const& rhs) {
    return cmp(lhs.value_, rhs.value_) == 0;
  }

  friend std::strong_ordering
  operator <=> (big_uint const& lhs, big_uint const& rhs) {
    return cmp(lhs.value_, rhs.value_) <=> 0;
  }

private:
  big_int value_;
};

inline big_uint
operator + (big_uint lhs, big_uint const& rhs) { return lhs += rhs; }

inline big_uint
operator * (big_uint lhs, big_uint const& rhs) { return lhs *= rhs; }

std::ostream&
operator << (std::ostream&, big_uint const&);

} // namespace infallible

template <>
struct fmt::formatter<infallible::big_int> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto
  format(infallible::big_int const& value, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(infallible::to_string(value),
                                                    ctx);
  }
};

template <>
struct fmt::formatter<infallible::big_uint> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto
  format(infallible::big_uint const& value, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
  }
};

#endif
