#include "error.h"

#include <e521/core/log.h>

namespace e521 {

bool test_error_storing_mode = false;
std::string g_test_log_str = "";

error_t error(error_t rv, int category, const std::string& text, bool to_print_stack_trace) {
  if (is_log_disabled()) return rv;
  if (test_error_storing_mode) g_test_log_str += "; " + text;

#if !defined(E521_NO_LOG)
  if (to_print_stack_trace) print_stack_trace();

  log_string_buf_t line;
  line.begin_line();
  line << "Error ";
  line.put_hex(uint32_t(rv));
  if (!text.empty()) line << ": " << text;
  line.end_line();
  out_error(line.get());
#endif

  return rv;
}

error_t error(error_t rv, const std::string& text, bool to_print_stack_trace) {
  return error(rv, ECATEGORY(rv), text, to_print_stack_trace);
}

namespace {

struct frames_t {
  enum { max_frames = 64 };
  void* pc[max_frames];
  int count = 0;
};

_Unwind_Reason_Code collect_frame(struct _Unwind_Context* context, void* arg) {
  frames_t* frames = static_cast<frames_t*>(arg);
  uintptr_t pc = _Unwind_GetIP(context);
  if (!pc) return _URC_NO_REASON;
  if (frames->count == frames_t::max_frames) return _URC_END_OF_STACK;
  frames->pc[frames->count++] = void_ptr(pc);
  return _URC_NO_REASON;
}

std::string demangle(const char* symbol) {
  if (!symbol || !symbol[0]) return "";

  int status = 0;
  std::unique_ptr<char, decltype(&free)> cpp_symbol(abi::__cxa_demangle(symbol, nullptr, nullptr, &status), &free);
  if (status != 0 || !cpp_symbol) return symbol;

  std::string name = cpp_symbol.get();
  for (const char* prefix : {"e521::crypto::", "std::__cxx11::"}) {
    std::string::size_type pos;
    while ((pos = name.find(prefix)) != std::string::npos) name.erase(pos, strlen(prefix));
  }
  return name;
}

std::string module_name(const char* path) {
  if (!path) return "";
  const char* slash = strrchr(path, '/');
  return slash ? slash + 1 : path;
}

}  // namespace

void print_stack_trace() {
  frames_t frames;
  _Unwind_Backtrace(collect_frame, &frames);

  for (int i = 0; i < frames.count; i++) {
    Dl_info info = {};
    dladdr(frames.pc[i], &info);

    log_string_buf_t line;
    line.begin_line();
    line << "##" << i << " " << module_name(info.dli_fname) << " " << frames.pc[i] << " " << demangle(info.dli_sname);
    line.end_line();
    out_error(line.get());
  }
}

void assert_failed(const char* msg, const char* file, int line) {
  if (!is_log_disabled()) {
    // report the path relative to the source root
    std::string path(file);
    auto pos = path.find("src/");
    if (pos != std::string::npos) path.erase(0, pos);

    log_string_buf_t ss;
    ss.begin_line();
    ss << "[ASSERTION FAILED] " << msg << " (File: " << path << "#L" << line << ")";
    ss.end_line();
    out_error(ss.get());
    print_stack_trace();
  }

  throw assertion_failed_t(msg);
}

}  // namespace e521
