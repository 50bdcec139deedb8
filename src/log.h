#pragma once

#include <string>

namespace taskpool {
namespace detail {

// Writes one "[taskpool] <level>: <message>" line to std::cerr. Lines from
// different threads never interleave.
void log_warning(const std::string& message);
void log_error(const std::string& message);

}  // namespace detail
}  // namespace taskpool
