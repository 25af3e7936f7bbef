#include <e521/crypto/base.h>

namespace e521::crypto {

// clang-format off
const mod_t& e521_curve_t::p() {  // static
  static const mod_t p = bn_t::from_hex("1FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF");
  return p;
}

// R = 2^519 - 337554763258501705789107630418782636071904961214051226618635150085779108655765
const mod_t& e521_curve_t::order() {  // static
  static const mod_t q = bn_t::from_hex("7FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFD15B6C64746FC85F736B8AF5E7EC53F04FBD8C4569A8F1F4540EA2435F5180D6B");
  return q;
}

// G = (4, y0) with y0 the even root
const e521_point_t& e521_curve_t::generator() {  // static
  static const e521_point_t G(bn_t(4), bn_t::from_hex("11DD4B4952F9B741BDB15C806D24013B3EBF3BE43295904D1E4050B3C80F5920A145616EBB481557D7BFA955CBFB1CFD4E064B0DE40F93E22F8BCDFB41D0093B10C"));
  return G;
}
// clang-format on

const bn_t& e521_curve_t::d() {  // static
  static const bn_t d = p().mod(-376014);
  return d;
}

e521_point_t e521_curve_t::neutral() { return e521_point_t(); }  // static

error_t e521_curve_t::check(const e521_point_t& P) {  // static
  if (!P.is_on_curve()) return e521::error(E_ECC_INVALID_POINT, "EC-point is not on E521", false);
  return SUCCESS;
}

e521_point_t e521_curve_t::mul_generator(const bn_t& s) { return s * generator(); }  // static

// ------------------------------ e521_point_t ------------------------------

e521_point_t::e521_point_t() : x(0), y(1) {}

e521_point_t::e521_point_t(const bn_t& _x, const bn_t& _y) : x(_x), y(_y) {}

error_t e521_point_t::from_x(const bn_t& x, bool lsb, e521_point_t& P) {  // static
  error_t rv = UNINITIALIZED_ERROR;
  const mod_t& p = e521_curve_t::p();

  bn_t xr = p.mod(x);
  bn_t num, den;
  MODULO(p) {
    bn_t xx = xr * xr;
    num = bn_t(1) - xx;
    den = xx * 376014 + 1;
  }

  bn_t den_inv;
  if (rv = p.checked_inv(den, den_inv)) return rv;

  bn_t y;
  if (rv = p.sqrt(p.mul(num, den_inv), lsb, y)) return rv;

  P = e521_point_t(xr, y);
  return SUCCESS;
}

bool e521_point_t::is_on_curve() const {
  const mod_t& p = e521_curve_t::p();
  if (x.sign() < 0 || x >= p.value() || y.sign() < 0 || y >= p.value()) return false;

  const bn_t& d = e521_curve_t::d();
  bn_t lhs, rhs;
  MODULO(p) {
    bn_t xx = x * x;
    bn_t yy = y * y;
    lhs = xx + yy;
    rhs = d * xx * yy + 1;
  }
  return lhs == rhs;
}

bool e521_point_t::is_in_subgroup() const {
  if (!is_on_curve()) return false;

  e521_point_t Q;
  if (mul_ladder(e521_curve_t::order(), *this, Q)) return false;
  return Q.is_neutral();
}

bool e521_point_t::is_neutral() const { return x.is_zero() && y == 1; }

e521_point_t e521_point_t::neg() const { return e521_point_t(e521_curve_t::p().neg(x), y); }

bool e521_point_t::operator==(const e521_point_t& val) const { return x == val.x && y == val.y; }
bool e521_point_t::operator!=(const e521_point_t& val) const { return !(*this == val); }

error_t e521_point_t::add(const e521_point_t& P1, const e521_point_t& P2, e521_point_t& R) {  // static
  const mod_t& p = e521_curve_t::p();
  const bn_t& d = e521_curve_t::d();

  bn_t x_num, y_num, x_den, y_den, den;
  MODULO(p) {
    bn_t t = d * P1.x * P2.x * P1.y * P2.y;
    x_num = P1.x * P2.y + P1.y * P2.x;
    y_num = P1.y * P2.y - P1.x * P2.x;
    x_den = t + 1;
    y_den = bn_t(1) - t;
    den = x_den * y_den;
  }

  // one inversion serves both denominators
  bn_t den_inv;
  if (p.checked_inv(den, den_inv))
    return e521::error(E_ECC_INVALID_POINT, "E521 addition denominator is not invertible", false);

  MODULO(p) {
    bn_t x3 = x_num * y_den * den_inv;
    bn_t y3 = y_num * x_den * den_inv;
    R = e521_point_t(x3, y3);
  }
  return SUCCESS;
}

error_t e521_point_t::sub(const e521_point_t& P1, const e521_point_t& P2, e521_point_t& R) {  // static
  return add(P1, P2.neg(), R);
}

error_t e521_point_t::mul_naive(const bn_t& s, const e521_point_t& P, e521_point_t& R) {  // static
  error_t rv = UNINITIALIZED_ERROR;
  if (s.sign() < 0) return e521::error(E_BADARG, "negative scalar", false);

  e521_point_t acc;
  for (bn_t i = 0; i < s; ++i) {
    if (rv = add(acc, P, acc)) return rv;
  }

  R = acc;
  return SUCCESS;
}

error_t e521_point_t::mul_double_and_add(const bn_t& s, const e521_point_t& P, e521_point_t& R) {  // static
  error_t rv = UNINITIALIZED_ERROR;
  if (s.sign() < 0) return e521::error(E_BADARG, "negative scalar", false);

  e521_point_t acc;
  for (int i = s.get_bits_count() - 1; i >= 0; i--) {
    if (rv = add(acc, acc, acc)) return rv;
    if (s.is_bit_set(i)) {
      if (rv = add(acc, P, acc)) return rv;
    }
  }

  R = acc;
  return SUCCESS;
}

error_t e521_point_t::mul_ladder(const bn_t& s, const e521_point_t& P, e521_point_t& R) {  // static
  error_t rv = UNINITIALIZED_ERROR;
  if (s.sign() < 0) return e521::error(E_BADARG, "negative scalar", false);

  int n = std::max(e521_curve_t::ladder_bits(), s.get_bits_count());

  e521_point_t r0;
  e521_point_t r1 = P;
  for (int i = n - 1; i >= 0; i--) {
    if (s.is_bit_set(i)) {
      if (rv = add(r0, r1, r0)) return rv;
      if (rv = add(r1, r1, r1)) return rv;
    } else {
      if (rv = add(r0, r1, r1)) return rv;
      if (rv = add(r0, r0, r0)) return rv;
    }
  }

  R = r0;
  return SUCCESS;
}

std::string e521_point_t::to_string() const {
  std::stringstream ss;
  ss << *this;
  return ss.str();
}

e521_point_t operator+(const e521_point_t& val1, const e521_point_t& val2) {
  e521_point_t R;
  error_t rv = e521_point_t::add(val1, val2, R);
  e521_assert(rv == SUCCESS && "E521 addition of an invalid point");
  return R;
}

e521_point_t operator-(const e521_point_t& val1, const e521_point_t& val2) {
  e521_point_t R;
  error_t rv = e521_point_t::sub(val1, val2, R);
  e521_assert(rv == SUCCESS && "E521 subtraction of an invalid point");
  return R;
}

e521_point_t operator*(const bn_t& s, const e521_point_t& P) {
  e521_point_t R;
  error_t rv = e521_point_t::mul_ladder(s, P, R);
  e521_assert(rv == SUCCESS && "E521 multiplication failed");
  return R;
}

std::ostream& operator<<(std::ostream& os, const e521_point_t& P) {
  if (P.is_neutral())
    os << "neutral";
  else
    os << "(" << P.get_x() << ", " << P.get_y() << ")";
  return os;
}

}  // namespace e521::crypto
