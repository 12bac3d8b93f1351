#pragma once

#include <backtrace.h>
#include <cstdlib>
#include <cxxabi.h>
#include <dlfcn.h>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace libcadence
{

class StackTrace
{
public:
  explicit StackTrace(size_t skip = 0)
  {
    ensure_state();
    if (state_)
      backtrace_full(state_, static_cast<int>(skip + 1), &StackTrace::full_callback,
                     &StackTrace::error_callback, this);
  }

  [[nodiscard]] auto to_string() const -> std::string
  {
    std::ostringstream out;
    for (const auto& frame : frames_)
    {
      out << "  at " << frame << "\n";
    }
    return out.str();
  }

private:
  std::vector<std::string>       frames_;
  static inline backtrace_state* state_ = nullptr;
  static inline std::mutex       state_mutex_;

  static void ensure_state()
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_)
    {
      state_ = backtrace_create_state(nullptr, /* threaded = */ 1, nullptr, nullptr);
    }
  }

  static auto full_callback(void* data, uintptr_t pc, const char* filename, int lineno,
                            const char* function) -> int
  {
    auto* self = static_cast<StackTrace*>(data);

    std::ostringstream frame;

    if (function)
      frame << demangle(function);
    else
      frame << "<unknown>";

    if (filename)
      frame << " (" << filename << ":" << lineno << ")";
    else
      frame << " (no source info)";

    Dl_info info;
    if (dladdr(reinterpret_cast<void*>(pc), &info) && info.dli_fname)
      frame << " [" << info.dli_fname << "]";

    self->frames_.push_back(frame.str());
    return 0;
  }

  static void error_callback(void* data, const char* msg, int errnum)
  {
    auto*              self = static_cast<StackTrace*>(data);
    std::ostringstream out;
    out << "<error: " << msg;
    if (errnum > 0)
      out << " (errno=" << errnum << ")";
    out << ">";
    self->frames_.push_back(out.str());
  }

  static auto demangle(const char* name) -> std::string
  {
    int         status    = 0;
    size_t      len       = 0;
    char*       demangled = abi::__cxa_demangle(name, nullptr, &len, &status);
    std::string result    = (status == 0 && demangled) ? demangled : name;
    free(demangled);
    return result;
  }
};

// Infrastructure failures that end a verification run without a verdict.
enum class ErrorKind
{
  Io,      // directory or file could not be read
  Decode,  // audio container could not be opened / probed
  Network, // tracker unreachable, TLS or HTTP failure
  Api,     // tracker answered with an error envelope
  Torrent, // malformed torrent descriptor
  Config   // invalid configuration or source manifest
};

inline auto to_string(ErrorKind kind) -> std::string_view
{
  switch (kind)
  {
    case ErrorKind::Io:
      return "I/O error";
    case ErrorKind::Decode:
      return "Decode error";
    case ErrorKind::Network:
      return "Network error";
    case ErrorKind::Api:
      return "Tracker API error";
    case ErrorKind::Torrent:
      return "Torrent error";
    case ErrorKind::Config:
      return "Configuration error";
  }
  return "Error";
}

class Error : public std::runtime_error
{
public:
  Error(ErrorKind kind, const std::string& msg)
      : std::runtime_error(build_msg(kind, msg)), kind_(kind), trace_(StackTrace(1).to_string())
  {
  }

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }
  [[nodiscard]] auto trace() const noexcept -> const std::string& { return trace_; }

private:
  ErrorKind   kind_;
  std::string trace_;

  static auto build_msg(ErrorKind kind, const std::string& m) -> std::string
  {
    std::ostringstream oss;
    oss << to_string(kind) << ": " << m;
    return oss.str();
  }
};

} // namespace libcadence
