#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace orchestrator {

enum class ContextErr {
  kNone,
  kCanceled,
  kDeadlineExceeded,
};

// Cancellation and deadline carried through every manager, runner and executor call.
// Copies share state: cancelling any copy cancels all of them and every context derived from them.
class CallContext {
 public:
  using Clock = std::chrono::steady_clock;

  CallContext();

  static CallContext Background();

  CallContext WithTimeout(std::chrono::milliseconds timeout) const;
  CallContext WithDeadline(Clock::time_point deadline) const;

  void Cancel() const;

  bool Done() const;
  ContextErr Err() const;

  // Earliest deadline along the parent chain.
  std::optional<Clock::time_point> Deadline() const;
  bool HasDeadline() const;

  // Time left before the deadline, clamped at zero. nullopt when there is no deadline.
  std::optional<std::chrono::milliseconds> Remaining() const;

 private:
  struct State {
    std::atomic<bool> canceled{false};
    std::optional<Clock::time_point> deadline;
    std::shared_ptr<State> parent;
  };

  explicit CallContext(std::shared_ptr<State> state);

  std::shared_ptr<State> state_;
};

}  // namespace orchestrator
