#pragma once

namespace e521::crypto {

class mod_t;

/**
 * Arbitrary-precision signed integer over an owned OpenSSL BIGNUM.
 *
 * @notes:
 * - Inside a `MODULO(m) { ... }` scope the arithmetic operators and `neg` reduce modulo `m`;
 *   outside of it they are plain integer operations.
 * - A moved-from value is zero.
 */
class bn_t {
 public:
  bn_t();
  bn_t(int src);
  bn_t(const BIGNUM* src);
  bn_t(const bn_t& src);
  bn_t(bn_t&& src);
  ~bn_t();

  bn_t& operator=(int src);
  bn_t& operator=(const bn_t& src);
  bn_t& operator=(bn_t&& src) noexcept;

  operator const BIGNUM*() const { return val; }
  operator BIGNUM*() { return val; }

  bool operator==(const bn_t& other) const { return compare(*this, other) == 0; }
  bool operator!=(const bn_t& other) const { return compare(*this, other) != 0; }
  bool operator<(const bn_t& other) const { return compare(*this, other) < 0; }
  bool operator<=(const bn_t& other) const { return compare(*this, other) <= 0; }
  bool operator>(const bn_t& other) const { return compare(*this, other) > 0; }
  bool operator>=(const bn_t& other) const { return compare(*this, other) >= 0; }
  bool operator==(int other) const { return *this == bn_t(other); }
  bool operator!=(int other) const { return *this != bn_t(other); }
  bool operator<(int other) const { return *this < bn_t(other); }
  bool operator<=(int other) const { return *this <= bn_t(other); }
  bool operator>(int other) const { return *this > bn_t(other); }
  bool operator>=(int other) const { return *this >= bn_t(other); }

  bn_t& operator++();
  bn_t operator++(int);

  static bn_t rand(const bn_t& range);  // uniform in [0, range)
  static bn_t rand_bitlen(int bits, bool top_bit_set = false);
  static bn_t from_string(const_char_ptr str);
  static bn_t from_hex(const_char_ptr str);

  bn_t neg() const;

  bool is_odd() const { return BN_is_odd(val) != 0; }
  bool is_zero() const { return BN_is_zero(val) != 0; }
  int sign() const;
  int get_bits_count() const { return BN_num_bits(val); }
  bool is_bit_set(int n) const { return BN_is_bit_set(val, n) != 0; }

  std::string to_string() const;

  static int compare(const bn_t& a, const bn_t& b) { return BN_cmp(a.val, b.val); }

  // MODULO keeps a pointer to its modulus, which must outlive the scope: no temporary mod_t from a bn_t
  static void set_modulo(const bn_t& n) = delete;
  static bool check_modulo(const bn_t& n) = delete;
  static void reset_modulo(const bn_t& n) = delete;

  static void set_modulo(const mod_t& n);
  static bool check_modulo(const mod_t& n);
  static void reset_modulo(const mod_t& n);

  static BN_CTX* thread_local_storage_bn_ctx();

 private:
  BIGNUM* val = nullptr;
  BIGNUM* ensure();
};

#define MODULO(n)                                                               \
  for (e521::crypto::bn_t::set_modulo(n); e521::crypto::bn_t::check_modulo(n); \
       e521::crypto::bn_t::reset_modulo(n))

bn_t operator+(const bn_t& a, const bn_t& b);
bn_t operator-(const bn_t& a, const bn_t& b);
bn_t operator*(const bn_t& a, const bn_t& b);
bn_t operator+(const bn_t& a, int b);
bn_t operator-(const bn_t& a, int b);
bn_t operator*(const bn_t& a, int b);
bn_t operator-(const bn_t& a);
bn_t operator<<(const bn_t& a, int n);
bn_t operator>>(const bn_t& a, int n);

std::ostream& operator<<(std::ostream& os, const bn_t& v);

}  // namespace e521::crypto
