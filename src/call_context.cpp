#include "call_context.hpp"

#include <algorithm>
#include <utility>

namespace orchestrator {

CallContext::CallContext() : state_(std::make_shared<State>()) {}

CallContext::CallContext(std::shared_ptr<State> state) : state_(std::move(state)) {}

CallContext CallContext::Background() {
  return CallContext();
}

CallContext CallContext::WithTimeout(std::chrono::milliseconds timeout) const {
  return WithDeadline(Clock::now() + timeout);
}

CallContext CallContext::WithDeadline(Clock::time_point deadline) const {
  auto child = std::make_shared<State>();
  child->deadline = deadline;
  child->parent = state_;
  return CallContext(std::move(child));
}

void CallContext::Cancel() const {
  state_->canceled.store(true);
}

bool CallContext::Done() const {
  return Err() != ContextErr::kNone;
}

ContextErr CallContext::Err() const {
  const auto now = Clock::now();
  for (auto s = state_.get(); s; s = s->parent.get()) {
    if (s->canceled.load()) return ContextErr::kCanceled;
    if (s->deadline && now >= *s->deadline) return ContextErr::kDeadlineExceeded;
  }
  return ContextErr::kNone;
}

std::optional<CallContext::Clock::time_point> CallContext::Deadline() const {
  std::optional<Clock::time_point> out;
  for (auto s = state_.get(); s; s = s->parent.get()) {
    if (!s->deadline) continue;
    if (!out || *s->deadline < *out) out = s->deadline;
  }
  return out;
}

bool CallContext::HasDeadline() const {
  return Deadline().has_value();
}

std::optional<std::chrono::milliseconds> CallContext::Remaining() const {
  auto deadline = Deadline();
  if (!deadline) return std::nullopt;
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

}  // namespace orchestrator
