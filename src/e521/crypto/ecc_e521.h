#pragma once

namespace e521::crypto {

class e521_point_t;

/**
 * Parameters of the Edwards curve E521: x^2 + y^2 = 1 + d*x^2*y^2 over F(p),
 * with p = 2^521 - 1 and d = -376014.
 *
 * @notes:
 * - The curve has 4*R points, R being the order of the prime subgroup generated by `generator()`.
 * - Constants are created on first use.
 */
class e521_curve_t {
 public:
  static const mod_t& p();
  static const bn_t& d();  // reduced into [0, p)
  static const mod_t& order();
  static const e521_point_t& generator();
  static e521_point_t neutral();

  static int cofactor() { return 4; }
  static int bits() { return 521; }
  static int ladder_bits() { return bits(); }

  /**
   * @notes:
   * - E_ECC_INVALID_POINT if `P` has a coordinate outside [0, p) or does not satisfy the curve equation.
   */
  static error_t check(const e521_point_t& P);

  static e521_point_t mul_generator(const bn_t& s);
};

/**
 * Affine point on E521.
 *
 * Points are immutable values. The fallible operations are static, return an
 * error code and write their result only on success.
 */
class e521_point_t {
 public:
  e521_point_t();  // neutral element (0, 1)

  /**
   * @notes:
   * - Takes the coordinates as they are, with no reduction and no curve check.
   *   Use `is_on_curve` or `e521_curve_t::check` on untrusted input.
   */
  e521_point_t(const bn_t& x, const bn_t& y);

  /**
   * @notes:
   * - Solves y^2 = (1 - x^2) / (1 + 376014*x^2) (mod p) for the root whose least significant bit is `lsb`.
   * - E_ECC_NO_SQRT if there is no such root; `P` is not modified.
   */
  static error_t from_x(const bn_t& x, bool lsb, e521_point_t& P);

  const bn_t& get_x() const { return x; }
  const bn_t& get_y() const { return y; }

  bool is_on_curve() const;
  bool is_in_subgroup() const;
  bool is_neutral() const;

  e521_point_t neg() const;
  e521_point_t operator-() const { return neg(); }

  bool operator==(const e521_point_t& val) const;
  bool operator!=(const e521_point_t& val) const;

  /**
   * @notes:
   * - Complete Edwards addition:
   *   x3 = (x1*y2 + y1*x2) / (1 + d*x1*x2*y1*y2)
   *   y3 = (y1*y2 - x1*x2) / (1 - d*x1*x2*y1*y2)
   * - Both denominators are invertible for points on the curve. A zero denominator
   *   means an off-curve input and is reported as E_ECC_INVALID_POINT.
   * - `R` may alias either input.
   */
  static error_t add(const e521_point_t& P1, const e521_point_t& P2, e521_point_t& R);
  static error_t sub(const e521_point_t& P1, const e521_point_t& P2, e521_point_t& R);

  // Reference implementation: adds `P` to the neutral element `s` times.
  static error_t mul_naive(const bn_t& s, const e521_point_t& P, e521_point_t& R);

  // Variable time: the sequence of additions follows the bits of `s`.
  static error_t mul_double_and_add(const bn_t& s, const e521_point_t& P, e521_point_t& R);

  /**
   * @notes:
   * - Montgomery ladder over a fixed window of `e521_curve_t::ladder_bits()` bit positions.
   *   Every position costs one addition and one doubling whatever the bit value is.
   * - A scalar longer than the window widens it to the scalar's bit length.
   */
  static error_t mul_ladder(const bn_t& s, const e521_point_t& P, e521_point_t& R);

  std::string to_string() const;

 private:
  bn_t x, y;
};

// The operators assert on failure; they are meant for points known to be valid.
e521_point_t operator+(const e521_point_t& val1, const e521_point_t& val2);
e521_point_t operator-(const e521_point_t& val1, const e521_point_t& val2);
e521_point_t operator*(const bn_t& s, const e521_point_t& P);

std::ostream& operator<<(std::ostream& os, const e521_point_t& P);

}  // namespace e521::crypto
