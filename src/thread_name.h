#pragma once

#include <cstddef>
#include <string>

namespace taskpool {
namespace detail {

// Linux limits thread names to 15 characters; longer names are truncated.
constexpr std::size_t kMaxThreadNameLength = 15;

// Names the calling thread. Failures are logged, not thrown.
void set_current_thread_name(const std::string& name);

}  // namespace detail
}  // namespace taskpool
