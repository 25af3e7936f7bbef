#include <e521/crypto/base.h>

namespace e521::crypto {

mod_t::mod_t(const bn_t& _m) : m(_m) {
  e521_assert(m > 0);
  if (!m.is_odd()) return;  // Montgomery form needs an odd modulus

  mont = BN_MONT_CTX_new();
  if (!mont) throw std::bad_alloc();
  e521_assert(BN_MONT_CTX_set(mont, m, bn_t::thread_local_storage_bn_ctx()));
}

mod_t::mod_t(const mod_t& src) : m(src.m) { set_mont(src.mont); }

mod_t::mod_t(mod_t&& src) : m(std::move(src.m)), mont(src.mont) { src.mont = nullptr; }

mod_t::~mod_t() { BN_MONT_CTX_free(mont); }

mod_t& mod_t::operator=(const mod_t& src) {
  if (this != &src) {
    m = src.m;
    set_mont(src.mont);
  }
  return *this;
}

mod_t& mod_t::operator=(mod_t&& src) noexcept {
  std::swap(m, src.m);
  std::swap(mont, src.mont);
  return *this;
}

void mod_t::set_mont(const BN_MONT_CTX* src) {
  BN_MONT_CTX_free(mont);
  mont = nullptr;
  if (!src) return;

  mont = BN_MONT_CTX_new();
  if (!mont) throw std::bad_alloc();
  e521_assert(BN_MONT_CTX_copy(mont, const_cast<BN_MONT_CTX*>(src)));
}

bn_t mod_t::add(const bn_t& a, const bn_t& b) const {
  bn_t r;
  e521_assert(BN_mod_add(r, a, b, m, bn_t::thread_local_storage_bn_ctx()));
  return r;
}

bn_t mod_t::sub(const bn_t& a, const bn_t& b) const {
  bn_t r;
  e521_assert(BN_mod_sub(r, a, b, m, bn_t::thread_local_storage_bn_ctx()));
  return r;
}

bn_t mod_t::neg(const bn_t& a) const { return sub(bn_t(0), a); }

bn_t mod_t::mul(const bn_t& a, const bn_t& b) const {
  bn_t r;
  e521_assert(BN_mod_mul(r, a, b, m, bn_t::thread_local_storage_bn_ctx()));
  return r;
}

bn_t mod_t::mod(const bn_t& a) const {
  bn_t r;
  e521_assert(BN_nnmod(r, a, m, bn_t::thread_local_storage_bn_ctx()));
  return r;
}

bn_t mod_t::pow(const bn_t& x, const bn_t& e) const {
  e521_assert(e.sign() >= 0 && "only support non-negative exponent");
  bn_t r;
  BN_CTX* ctx = bn_t::thread_local_storage_bn_ctx();
  if (mont)
    e521_assert(BN_mod_exp_mont_consttime(r, mod(x), e, m, ctx, mont));
  else
    e521_assert(BN_mod_exp(r, x, e, m, ctx));
  return r;
}

bool mod_t::inverse(const bn_t& a, bn_t& r) const {
  bn_t x = mod(a);
  BN_set_flags(x, BN_FLG_CONSTTIME);
  return BN_mod_inverse(r, x, m, bn_t::thread_local_storage_bn_ctx()) != nullptr;
}

bn_t mod_t::inv(const bn_t& a) const {
  bn_t r;
  bool ok = inverse(a, r);
  e521_assert(ok && "mod_t::inv failed");
  return r;
}

error_t mod_t::checked_inv(const bn_t& a, bn_t& r) const {
  bn_t result;
  if (!inverse(a, result)) return openssl_error("mod_t::checked_inv failed: ");
  r = std::move(result);
  return SUCCESS;
}

// p = 3 (mod 4): a root of a is a^((p+1)/4), when a is a residue
error_t mod_t::sqrt(const bn_t& v, bool lsb, bn_t& r) const {
  e521_assert(m.is_bit_set(0) && m.is_bit_set(1));

  bn_t a = mod(v);
  if (a.is_zero()) {
    r = 0;
    return SUCCESS;
  }

  bn_t root = pow(a, (m >> 2) + 1);
  if (root.is_odd() != lsb) root = neg(root);

  if (mul(root, root) != a) return e521::error(E_ECC_NO_SQRT, "no square root with the requested parity", false);

  r = std::move(root);
  return SUCCESS;
}

}  // namespace e521::crypto
