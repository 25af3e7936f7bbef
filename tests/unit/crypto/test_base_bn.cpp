#include <gtest/gtest.h>
#include <type_traits>

#include <e521/core/log.h>
#include <e521/crypto/base.h>

#include "utils/test_macros.h"

using namespace e521;
using namespace e521::crypto;

namespace {

template <typename T, typename = void>
struct can_open_modulo : std::false_type {};
template <typename T>
struct can_open_modulo<T, std::void_t<decltype(bn_t::set_modulo(std::declval<const T&>())),
                                      decltype(bn_t::check_modulo(std::declval<const T&>())),
                                      decltype(bn_t::reset_modulo(std::declval<const T&>()))>> : std::true_type {};

TEST(BigNumber, Addition) {
  EXPECT_EQ(bn_t(123) + bn_t(456), 579);
  EXPECT_EQ(bn_t(-123) + bn_t(456), 333);
  EXPECT_EQ(bn_t(123) + bn_t(-456), -333);
  EXPECT_EQ(bn_t(-123) + bn_t(-456), -579);
  EXPECT_EQ(bn_t(999) + 1, 1000);
  EXPECT_EQ(bn_t(999) + (-1000), -1);
}

TEST(BigNumber, Subtraction) {
  EXPECT_EQ(bn_t(123) - bn_t(456), -333);
  EXPECT_EQ(bn_t(-123) - bn_t(-456), 333);
  EXPECT_EQ(bn_t(1) - 1000, -999);
  EXPECT_EQ(bn_t(999) - bn_t(0), 999);
}

TEST(BigNumber, Multiplication) {
  EXPECT_EQ(bn_t(123) * bn_t(456), 56088);
  EXPECT_EQ(bn_t(-123) * bn_t(456), -56088);
  EXPECT_EQ(bn_t(-123) * bn_t(-456), 56088);
  EXPECT_EQ(bn_t(123) * -456, -56088);
  EXPECT_EQ(bn_t(999) * 0, 0);
}

TEST(BigNumber, Neg) {
  EXPECT_EQ(bn_t(-123).neg(), 123);
  EXPECT_EQ(bn_t(456).neg(), -456);
  EXPECT_EQ(-bn_t(456), -456);
  EXPECT_EQ(bn_t(0).neg(), 0);
}

TEST(BigNumber, ShiftOperators) {
  EXPECT_EQ(bn_t(1) << 10, 1024);
  EXPECT_EQ(bn_t(1024) >> 5, 32);

  bn_t val2 = bn_t(5) << 3;
  EXPECT_EQ(val2, 40);
  EXPECT_EQ(val2 >> 2, 10);
}

TEST(BigNumber, BitCheck) {
  bn_t val(8);
  EXPECT_TRUE(val.is_bit_set(3));
  EXPECT_FALSE(val.is_bit_set(2));
  EXPECT_FALSE(val.is_bit_set(600));
  EXPECT_TRUE((bn_t(1) << 520).is_bit_set(520));
}

TEST(BigNumber, BitsCount) {
  EXPECT_EQ(bn_t(0).get_bits_count(), 0);
  EXPECT_EQ(bn_t(1).get_bits_count(), 1);
  EXPECT_EQ(bn_t(255).get_bits_count(), 8);
  EXPECT_EQ(bn_t(256).get_bits_count(), 9);
  EXPECT_EQ((bn_t(1) << 521).get_bits_count(), 522);
}

TEST(BigNumber, StringConversion) {
  bn_t a = bn_t::from_string("123456789012345678901234567890");
  EXPECT_EQ(a.to_string(), "123456789012345678901234567890");
  EXPECT_EQ(bn_t::from_hex("FF"), 255);
  EXPECT_EQ(bn_t(-42).to_string(), "-42");

  std::stringstream ss;
  ss << bn_t(77);
  EXPECT_EQ(ss.str(), "77");
}

TEST(BigNumber, Sign) {
  EXPECT_EQ(bn_t(-1234567).sign(), -1);
  EXPECT_EQ(bn_t(0).sign(), 0);
  EXPECT_EQ(bn_t(5).sign(), 1);
  EXPECT_EQ(bn_t(-5) * -5, 25);
}

TEST(BigNumber, CopyAndMove) {
  bn_t a = bn_t::from_string("98765432109876543210");
  bn_t b = a;
  EXPECT_EQ(a, b);

  bn_t c = std::move(b);
  EXPECT_EQ(c, a);

  bn_t d(7);
  d = std::move(c);
  EXPECT_EQ(d, a);

  b = 11;
  EXPECT_EQ(b, 11);
}

TEST(BigNumber, MovedFromIsZero) {
  bn_t a(5);
  bn_t b = std::move(a);
  EXPECT_EQ(b, 5);
  EXPECT_TRUE(a.is_zero());
  EXPECT_EQ(a.sign(), 0);
  EXPECT_EQ(a.get_bits_count(), 0);
  EXPECT_EQ(a.to_string(), "0");
  EXPECT_EQ(a + 3, 3);
}

TEST(BigNumber, Increment) {
  bn_t i = 41;
  EXPECT_EQ(i++, 41);
  EXPECT_EQ(i, 42);
  EXPECT_EQ(++i, 43);
}

TEST(BigNumber, ModuloScope) {
  mod_t q(97);
  bn_t a(90), b(20), r;
  MODULO(q) { r = a + b; }
  EXPECT_EQ(r, 13);

  MODULO(q) { r = b - a; }
  EXPECT_EQ(r, 27);

  MODULO(q) { r = a * b; }
  EXPECT_EQ(r, 1800 % 97);

  MODULO(q) { r = q.inv(b) * b; }
  EXPECT_EQ(r, 1);

  MODULO(q) { r = a.neg(); }
  EXPECT_EQ(r, 7);

  // outside the scope the operators are plain again
  EXPECT_EQ(a + b, 110);
  EXPECT_EQ(q.mod(200), 6);
}

TEST(BigNumber, ModuloScopeNeedsNamedModulus) {
  // a bn_t would convert to a temporary mod_t that dies before the scope ends
  static_assert(can_open_modulo<mod_t>::value, "MODULO accepts a mod_t");
  static_assert(!can_open_modulo<bn_t>::value, "MODULO rejects a bn_t");

  bn_t m(101);
  mod_t q(m);
  bn_t r;
  MODULO(q) { r = bn_t(50) * 3; }
  EXPECT_EQ(r, 49);
}

TEST(BigNumber, Rand) {
  bn_t range = bn_t::from_string("1000000000000000000000");
  for (int i = 0; i < 20; i++) {
    bn_t r = bn_t::rand(range);
    EXPECT_GE(r, 0);
    EXPECT_LT(r, range);
  }
  EXPECT_LE(bn_t::rand_bitlen(100).get_bits_count(), 100);
  EXPECT_EQ(bn_t::rand_bitlen(100, true).get_bits_count(), 100);
}

}  // namespace
