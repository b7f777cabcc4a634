#include "big_integer.hpp"

#include "error.hpp"

#include <ostream>
#include <utility>

namespace infallible {

std::string
to_string(big_int const& value, int base) {
  return value.get_str(base);
}

big_uint::big_uint(big_int value)
  : value_{std::move(value)}
{
  if (sgn(value_) < 0)
    throw make_error<negative_value_error>(
      "Cannot make an unsigned big integer from negative value {}",
      value_.get_str()
    );
}

std::string
big_uint::to_string(int base) const {
  return value_.get_str(base);
}

big_uint&
big_uint::operator += (big_uint const& other) {
  value_ += other.value_;
  return *this;
}

big_uint&
big_uint::operator *= (big_uint const& other) {
  value_ *= other.value_;
  return *this;
}

std::ostream&
operator << (std::ostream& out, big_uint const& value) {
  return out << value.value();
}

} // namespace infallible
