#pragma once
#include <e521/core/precompiled.h>

typedef int error_t;

#define ERRCODE(category, code) (0xff000000 | (uint32_t(category) << 16) | uint32_t(code))
#define ECATEGORY(code) (((code) >> 16) & 0x00ff)

// clang-format off
enum {
  ECATEGORY_GENERIC = 0x01,
  ECATEGORY_CRYPTO  = 0x04,
  ECATEGORY_OPENSSL = 0x06,
};

enum {
  SUCCESS             = 0,
  UNINITIALIZED_ERROR = ERRCODE(ECATEGORY_GENERIC, 0x0000),  // never returned; initial value of `rv`
  E_GENERAL           = ERRCODE(ECATEGORY_GENERIC, 0x0001),
  E_BADARG            = ERRCODE(ECATEGORY_GENERIC, 0x0002),
  E_RANGE             = ERRCODE(ECATEGORY_GENERIC, 0x0012),
};
// clang-format on

namespace e521 {

/**
 * Reports an error and returns `rv`, so that call sites read `return e521::error(E_BADARG, "...");`.
 *
 * @notes:
 * - The line "Error 0x<rv>: <text>" goes to `out_log_fun`, or to stderr when no sink is set.
 * - Nothing is logged on a thread inside a `dylog_disable_scope_t`, or when built with E521_NO_LOG.
 * - In test storing mode the text is also appended to `g_test_log_str`.
 */
error_t error(error_t rv, int category, const std::string& text, bool to_print_stack_trace);
error_t error(error_t rv, const std::string& text, bool to_print_stack_trace = true);
inline error_t error(error_t rv) { return error(rv, ""); }

typedef void (*out_log_str_f)(int mode, const char* str);
extern out_log_str_f out_log_fun;

extern bool test_error_storing_mode;
extern std::string g_test_log_str;

inline void set_test_error_storing_mode(bool enabled) {
  test_error_storing_mode = enabled;
  g_test_log_str = "test error log";
}

void print_stack_trace();

class assertion_failed_t : public std::logic_error {
 public:
  explicit assertion_failed_t(const std::string& msg) : std::logic_error(msg) {}
};

[[noreturn]] void assert_failed(const char* msg, const char* file, int line);

}  // namespace e521

// Logs the failed expression with its location and a stack trace, then throws e521::assertion_failed_t.
#define e521_assert(expr)                                                             \
  do {                                                                                \
    if (__builtin_expect(!(expr), 0)) e521::assert_failed(#expr, __FILE__, __LINE__); \
  } while (0)
