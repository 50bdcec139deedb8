#include "thread_name.h"

#include <pthread.h>

#include <cstring>

#include "log.h"

namespace taskpool {
namespace detail {

void set_current_thread_name(const std::string& name) {
  const std::string truncated = name.substr(0, kMaxThreadNameLength);
  const int rc = pthread_setname_np(pthread_self(), truncated.c_str());
  if (rc != 0) {
    log_warning("cannot name thread '" + truncated + "': " + std::strerror(rc));
  }
}

}  // namespace detail
}  // namespace taskpool
