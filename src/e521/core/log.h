#pragma once

#include <e521/core/macros.h>

#define LogItemError 6

/**
 * One line of log output. Under E521_JSON_LOG the line is a JSON object
 * {"level":"error","ts":...,"msg":"..."} and the message text is escaped.
 */
class log_string_buf_t {
 public:
  void begin_line();
  void end_line();
  const_char_ptr get() const { return str.c_str(); }

  log_string_buf_t& operator<<(const_char_ptr s);
  log_string_buf_t& operator<<(const std::string& s) { return *this << s.c_str(); }
  log_string_buf_t& operator<<(int value) { return *this << std::to_string(value); }
  log_string_buf_t& operator<<(const void* ptr) { return put_hex(uint64_t(uintptr_t(ptr))); }
  log_string_buf_t& put_hex(uint64_t value);

 private:
  std::string str;
};

// Suppresses error logging on the current thread while in scope.
struct dylog_disable_scope_t {
  dylog_disable_scope_t(bool enabled = false);
  ~dylog_disable_scope_t();

 private:
  int saved;
};

namespace e521 {

bool is_log_disabled();
void out_error(const std::string& s);

}  // namespace e521
