#include "taskpool/job.h"

#include <stdexcept>
#include <utility>

namespace taskpool {

Job::Job(std::function<void()> block) : block_(std::move(block)) {
  if (!block_) {
    throw std::invalid_argument("Job: empty callable");
  }
}

Job::Job(Function function, void* argument) {
  if (function == nullptr) {
    throw std::invalid_argument("Job: null function");
  }
  block_ = [function, argument]() { function(argument); };
}

void Job::execute() {
  if (!block_) {
    throw std::logic_error("Job: already executed");
  }
  // Take the callable out first so a second execute() is rejected even if
  // this one throws.
  std::function<void()> block = std::move(block_);
  block_ = nullptr;
  block();
}

}  // namespace taskpool
