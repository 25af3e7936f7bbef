#include "base.h"

namespace e521::crypto {

error_t openssl_error(const std::string& text) {
  unsigned long err = ERR_get_error();
  char ssl_message[256] = "";
  ERR_error_string_n(err, ssl_message, sizeof(ssl_message));

  std::string message = text.empty() ? "OPENSSL error: " : text;
  return e521::error(E_CRYPTO, ECATEGORY_OPENSSL, message + "(" + std::to_string(err) + ") " + ssl_message, false);
}

}  // namespace e521::crypto
