#pragma once

namespace e521::crypto {

/**
 * Modulus with its arithmetic. Results are always reduced into [0, m).
 *
 * @notes:
 * - An odd modulus carries a Montgomery context, used by `pow`.
 */
class mod_t {
 public:
  mod_t(const bn_t& m);
  mod_t(const mod_t& src);
  mod_t(mod_t&& src);
  ~mod_t();

  mod_t& operator=(const mod_t& src);
  mod_t& operator=(mod_t&& src) noexcept;

  bn_t add(const bn_t& a, const bn_t& b) const;
  bn_t sub(const bn_t& a, const bn_t& b) const;
  bn_t neg(const bn_t& a) const;
  bn_t mul(const bn_t& a, const bn_t& b) const;
  bn_t div(const bn_t& a, const bn_t& b) const { return mul(a, inv(b)); }
  bn_t pow(const bn_t& x, const bn_t& e) const;
  bn_t mod(const bn_t& a) const;
  bn_t mod(int a) const { return mod(bn_t(a)); }

  // Asserts when `a` has no inverse.
  bn_t inv(const bn_t& a) const;

  /**
   * @notes:
   * - Error-returning counterpart of `inv`: fails with E_CRYPTO when `a` shares a factor with the modulus.
   * - `r` is not modified on failure.
   */
  error_t checked_inv(const bn_t& a, bn_t& r) const;

  /**
   * @notes:
   * - Square root of `v` whose least significant bit equals `lsb`.
   * - The modulus must be a prime with m = 3 (mod 4); anything else is a programming error.
   * - Returns E_ECC_NO_SQRT when no root with the requested parity exists, in which case `r` is not modified.
   * - For v = 0 the root is 0 regardless of `lsb`.
   */
  error_t sqrt(const bn_t& v, bool lsb, bn_t& r) const;

  bn_t rand() const { return bn_t::rand(m); }

  operator const bn_t&() const { return m; }
  const bn_t& value() const { return m; }
  int get_bits_count() const { return m.get_bits_count(); }

 private:
  bn_t m;
  BN_MONT_CTX* mont = nullptr;

  void set_mont(const BN_MONT_CTX* src);
  bool inverse(const bn_t& a, bn_t& r) const;
};

}  // namespace e521::crypto
