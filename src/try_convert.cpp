#include "try_convert.hpp"

#include <gmp.h>

#include <cmath>
#include <cstdint>

namespace infallible::detail {

big_int
make_big_int(uint128 magnitude, bool negative) {
  // GMP has no 128-bit constructor. Import the magnitude as two 64-bit words,
  // least significant first, in native byte order.
  std::uint64_t const words[2]{static_cast<std::uint64_t>(magnitude),
                               static_cast<std::uint64_t>(magnitude >> 64)};

  big_int result;
  mpz_import(result.get_mpz_t(), 2, -1, sizeof(std::uint64_t), 0, 0, words);
  if (negative)
    mpz_neg(result.get_mpz_t(), result.get_mpz_t());

  return result;
}

std::optional<big_int>
whole_to_big_int(double value) {
  if (!std::isfinite(value) || std::trunc(value) != value)
    return std::nullopt;

  return big_int{value};
}

} // namespace infallible::detail
