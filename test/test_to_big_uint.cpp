#include "primitive_limits.hpp"
#include "to_big_uint.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <sstream>

using namespace infallible;

struct unsigned_conversion : testing::Test { };

TEST_F(unsigned_conversion, boundaries_match_fallible_conversion) {
#define TEST_BOUNDS(type)                                                      \
  EXPECT_EQ(to_big_uint(primitive_min<type>()),                                \
            *try_to_big_uint(primitive_min<type>()));                          \
  EXPECT_EQ(to_big_uint(primitive_max<type>()),                                \
            *try_to_big_uint(primitive_max<type>()))

  TEST_BOUNDS(std::uint8_t);
  TEST_BOUNDS(std::uint16_t);
  TEST_BOUNDS(std::uint32_t);
  TEST_BOUNDS(std::uint64_t);
  TEST_BOUNDS(uint128);
  TEST_BOUNDS(std::size_t);
  TEST_BOUNDS(unsigned long long);

#undef TEST_BOUNDS
}

TEST_F(unsigned_conversion, boundaries_keep_decimal_value) {
#define TEST_DECIMAL(type)                                                     \
  EXPECT_EQ(to_big_uint(primitive_min<type>()).to_string(), "0");              \
  EXPECT_EQ(to_big_uint(primitive_max<type>()).to_string(),                    \
            fmt::format("{}", primitive_max<type>()))

  TEST_DECIMAL(std::uint8_t);
  TEST_DECIMAL(std::uint16_t);
  TEST_DECIMAL(std::uint32_t);
  TEST_DECIMAL(std::uint64_t);
  TEST_DECIMAL(std::size_t);
  TEST_DECIMAL(unsigned long long);

#undef TEST_DECIMAL
}

TEST_F(unsigned_conversion, uint8_zero) {
  big_uint b = to_big_uint(std::uint8_t{0});
  EXPECT_TRUE(b.zero());
  EXPECT_EQ(b, big_uint{});
  EXPECT_EQ(b.to_string(), "0");
}

TEST_F(unsigned_conversion, uint8_max) {
  big_uint b = to_big_uint(std::uint8_t{255});
  EXPECT_EQ(b, big_uint{big_int{255}});
  EXPECT_EQ(b.to_string(), "255");
  EXPECT_EQ(b.to_string(16), "ff");
}

TEST_F(unsigned_conversion, size_t_max_whatever_the_width) {
  constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
  big_uint b = to_big_uint(max);

  big_uint expected{big_int{1}};
  for (int i = 0; i < std::numeric_limits<std::size_t>::digits; ++i)
    expected *= big_uint{big_int{2}};
  expected = big_uint{big_int{expected.value() - 1}};

  EXPECT_EQ(b, expected);
  EXPECT_EQ(b.to_string(), fmt::format("{}", max));
}

TEST_F(unsigned_conversion, uint128_max_is_not_truncated) {
  EXPECT_EQ(to_big_uint(primitive_max<uint128>()).to_string(),
            "340282366920938463463374607431768211455");
  EXPECT_EQ(to_big_uint(primitive_max<uint128>()).to_string(16),
            "ffffffffffffffffffffffffffffffff");
}

TEST_F(unsigned_conversion, ordering_follows_numeric_value) {
  EXPECT_LT(to_big_uint(1u), to_big_uint(2u));
  EXPECT_GT(to_big_uint(primitive_max<uint128>()),
            to_big_uint(primitive_max<std::uint64_t>()));
  EXPECT_EQ(to_big_uint(std::uint16_t{7}), to_big_uint(7ull));
}

TEST_F(unsigned_conversion, arithmetic_stays_exact) {
  big_uint sum = to_big_uint(primitive_max<std::uint64_t>()) + to_big_uint(1u);
  EXPECT_EQ(sum.to_string(), "18446744073709551616");

  big_uint product = to_big_uint(primitive_max<uint128>())
                     * to_big_uint(primitive_max<uint128>());
  EXPECT_EQ(product.to_string(),
            "115792089237316195423570985008687907852589419931798687112530834793049593217025");
}

TEST_F(unsigned_conversion, accepts_any_closed_set_member_generically) {
  auto bits = [] (infallible_big_uint_source auto x) {
    return to_big_uint(x).to_string(2).size();
  };

  EXPECT_EQ(bits(std::uint8_t{255}), 8u);
  EXPECT_EQ(bits(std::uint32_t{1} << 31), 32u);
  EXPECT_EQ(bits(primitive_max<uint128>()), 128u);
}

TEST_F(unsigned_conversion, formats_with_fmt_and_streams) {
  EXPECT_EQ(fmt::format("{}", to_big_uint(1000u)), "1000");

  std::ostringstream out;
  out << to_big_uint(std::uint64_t{12345});
  EXPECT_EQ(out.str(), "12345");
}
