#pragma once

#include <e521/core/error.h>
#include <e521/core/macros.h>

// clang-format off
enum {
  E_CRYPTO            = ERRCODE(ECATEGORY_CRYPTO, 1),
  E_ECC_NO_SQRT       = ERRCODE(ECATEGORY_CRYPTO, 2),
  E_ECC_INVALID_POINT = ERRCODE(ECATEGORY_CRYPTO, 3),
};
// clang-format on

namespace e521::crypto {

// Logs `text` followed by the oldest entry of the OpenSSL error queue, which is consumed, and returns E_CRYPTO.
error_t openssl_error(const std::string& text);

}  // namespace e521::crypto

// Order matters here
#include "base_bn.h"
#include "base_mod.h"
#include "ecc_e521.h"

using e521::crypto::bn_t;
using e521::crypto::e521_point_t;
using e521::crypto::mod_t;
