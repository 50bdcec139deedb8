#include "log.h"

#include <iostream>
#include <mutex>

namespace taskpool {
namespace detail {
namespace {

// Never destroyed: static pools may still log from their destructors at
// exit.
std::mutex& log_mutex() {
  static std::mutex* mu = new std::mutex;
  return *mu;
}

void write_line(const char* level, const std::string& message) {
  std::lock_guard<std::mutex> lk(log_mutex());
  std::cerr << "[taskpool] " << level << ": " << message << "\n";
}

}  // namespace

void log_warning(const std::string& message) {
  write_line("warning", message);
}

void log_error(const std::string& message) {
  write_line("error", message);
}

}  // namespace detail
}  // namespace taskpool
