#include <e521/crypto/base.h>

namespace e521::crypto {

static thread_local BN_CTX* g_tls_bn_ctx = nullptr;

// Modulus of the innermost MODULO scope on this thread, null outside of one.
static thread_local const mod_t* g_tls_mod = nullptr;

BN_CTX* bn_t::thread_local_storage_bn_ctx() {  // static
  if (!g_tls_bn_ctx) {
    g_tls_bn_ctx = BN_CTX_new();
    e521_assert(g_tls_bn_ctx);
  }
  return g_tls_bn_ctx;
}

void bn_t::set_modulo(const mod_t& mod) { g_tls_mod = &mod; }              // static
bool bn_t::check_modulo(const mod_t& mod) { return g_tls_mod != nullptr; }  // static
void bn_t::reset_modulo(const mod_t& mod) { g_tls_mod = nullptr; }         // static

BIGNUM* bn_t::ensure() {
  if (!val) {
    val = BN_new();
    if (!val) throw std::bad_alloc();
  }
  return val;
}

bn_t::bn_t() { ensure(); }

bn_t::bn_t(int src) { *this = src; }

bn_t::bn_t(const BIGNUM* src) {
  ensure();
  if (src) e521_assert(BN_copy(val, src));
}

bn_t::bn_t(const bn_t& src) { e521_assert(BN_copy(ensure(), src.val)); }

bn_t::bn_t(bn_t&& src) : val(src.val) {
  src.val = nullptr;
  src.ensure();
}

bn_t::~bn_t() {
  if (val) BN_clear_free(val);
}

bn_t& bn_t::operator=(int src) {
  unsigned long abs = src < 0 ? 0ul - (unsigned long)src : (unsigned long)src;
  e521_assert(BN_set_word(ensure(), abs));
  BN_set_negative(val, src < 0);
  return *this;
}

bn_t& bn_t::operator=(const bn_t& src) {
  if (this != &src) e521_assert(BN_copy(ensure(), src.val));
  return *this;
}

bn_t& bn_t::operator=(bn_t&& src) noexcept {
  std::swap(val, src.val);
  return *this;
}

bn_t& bn_t::operator++() { return *this = *this + 1; }

bn_t bn_t::operator++(int) {
  bn_t old = *this;
  ++*this;
  return old;
}

bn_t operator+(const bn_t& a, const bn_t& b) {
  if (g_tls_mod) return g_tls_mod->add(a, b);

  bn_t r;
  e521_assert(BN_add(r, a, b));
  return r;
}

bn_t operator-(const bn_t& a, const bn_t& b) {
  if (g_tls_mod) return g_tls_mod->sub(a, b);

  bn_t r;
  e521_assert(BN_sub(r, a, b));
  return r;
}

bn_t operator*(const bn_t& a, const bn_t& b) {
  if (g_tls_mod) return g_tls_mod->mul(a, b);

  bn_t r;
  e521_assert(BN_mul(r, a, b, bn_t::thread_local_storage_bn_ctx()));
  return r;
}

// Inside MODULO the bn_t overloads reduce a negative int through mod_t.
bn_t operator+(const bn_t& a, int b) { return a + bn_t(b); }
bn_t operator-(const bn_t& a, int b) { return a - bn_t(b); }
bn_t operator*(const bn_t& a, int b) { return a * bn_t(b); }

bn_t operator-(const bn_t& a) { return a.neg(); }

bn_t operator<<(const bn_t& a, int n) {
  bn_t r;
  e521_assert(BN_lshift(r, a, n));
  return r;
}

bn_t operator>>(const bn_t& a, int n) {
  bn_t r;
  e521_assert(BN_rshift(r, a, n));
  return r;
}

bn_t bn_t::neg() const {
  if (g_tls_mod) return g_tls_mod->neg(*this);

  bn_t r = *this;
  if (!r.is_zero()) BN_set_negative(r, !BN_is_negative(val));
  return r;
}

int bn_t::sign() const {
  if (BN_is_zero(val)) return 0;
  return BN_is_negative(val) ? -1 : 1;
}

bn_t bn_t::rand(const bn_t& range) {  // static
  bn_t r;
  e521_assert(BN_rand_range(r, range) > 0);
  return r;
}

bn_t bn_t::rand_bitlen(int bits, bool top_bit_set) {  // static
  bn_t r;
  e521_assert(BN_rand(r, bits, top_bit_set ? BN_RAND_TOP_ONE : BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) > 0);
  return r;
}

static std::string take_openssl_string(char* s) {
  if (!s) throw std::bad_alloc();
  std::string result = s;
  OPENSSL_free(s);
  return result;
}

std::string bn_t::to_string() const { return take_openssl_string(BN_bn2dec(val)); }

bn_t bn_t::from_string(const_char_ptr str) {  // static
  bn_t r;
  BIGNUM* ptr = r;
  e521_assert(BN_dec2bn(&ptr, str) != 0);
  return r;
}

bn_t bn_t::from_hex(const_char_ptr str) {  // static
  bn_t r;
  BIGNUM* ptr = r;
  e521_assert(BN_hex2bn(&ptr, str) != 0);
  return r;
}

std::ostream& operator<<(std::ostream& os, const bn_t& v) { return os << v.to_string(); }

}  // namespace e521::crypto
