#include "log.h"

#include <chrono>

#include "error.h"

static thread_local int g_tls_log_disabled = 0;

namespace e521 {

out_log_str_f out_log_fun = nullptr;

bool is_log_disabled() { return g_tls_log_disabled != 0; }

void out_error(const std::string& s) {
  if (out_log_fun)
    out_log_fun(LogItemError, s.c_str());
  else
    std::cerr << s;
}

}  // namespace e521

dylog_disable_scope_t::dylog_disable_scope_t(bool enabled) : saved(g_tls_log_disabled) {
  if (!enabled) g_tls_log_disabled++;
}

dylog_disable_scope_t::~dylog_disable_scope_t() { g_tls_log_disabled = saved; }

log_string_buf_t& log_string_buf_t::operator<<(const_char_ptr s) {
#if defined(E521_JSON_LOG)
  for (; *s; s++) {
    unsigned char c = (unsigned char)*s;
    switch (c) {
      case '"':
        str += "\\\"";
        break;
      case '\\':
        str += "\\\\";
        break;
      case '\n':
        str += "\\n";
        break;
      case '\r':
        str += "\\r";
        break;
      case '\t':
        str += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\u%04x", c);
          str += buf;
        } else {
          str += *s;
        }
    }
  }
#else
  str += s;
#endif
  return *this;
}

log_string_buf_t& log_string_buf_t::put_hex(uint64_t value) {
  char buf[24];
  snprintf(buf, sizeof(buf), "0x%" PRIx64, value);
  str += buf;
  return *this;
}

void log_string_buf_t::begin_line() {
  str.clear();
#if defined(E521_JSON_LOG)
  double t = std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
  char buf[64];
  snprintf(buf, sizeof(buf), "{\"level\":\"error\",\"ts\":%.6f,\"msg\":\"", t);
  str += buf;
#endif
}

void log_string_buf_t::end_line() {
#if defined(E521_JSON_LOG)
  str += "\"}";
#endif
  str += "\n";
}
