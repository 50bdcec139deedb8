#pragma once

#include <functional>

namespace taskpool {

// Job: one unit of work. Both submission forms are normalized to a single
// nullary callable at construction.
class Job {
 public:
  using Function = void (*)(void*);

  explicit Job(std::function<void()> block);
  Job(Function function, void* argument);

  Job(Job&&) = default;
  Job& operator=(Job&&) = default;
  Job(const Job&) = delete;
  Job& operator=(const Job&) = delete;

  // Runs the callable on the calling thread. Exceptions thrown by the
  // callable propagate to the caller. A job runs at most once.
  void execute();

  bool executed() const noexcept { return !block_; }

 private:
  std::function<void()> block_;
};

}  // namespace taskpool
