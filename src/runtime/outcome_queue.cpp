#include "runtime/outcome_queue.hpp"

#include <utility>

namespace linkwatch::runtime {

OutcomeQueue::OutcomeQueue(const std::uint64_t first_sequence) : next_sequence_(first_sequence) {}

bool OutcomeQueue::Push(const std::uint64_t sequence, health::ProbeOutcome outcome) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_ || sequence < next_sequence_) {
      return false;
    }
    if (!pending_.emplace(sequence, std::move(outcome)).second) {
      return false;
    }
  }
  cv_.notify_one();
  return true;
}

std::optional<SequencedOutcome> OutcomeQueue::PopNext() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this]() {
    return closed_ || (!pending_.empty() && pending_.begin()->first == next_sequence_);
  });

  if (pending_.empty()) {
    return std::nullopt;
  }
  // When closed, begin() may be past a gap; nothing more can arrive for the
  // missing ticks, so release it anyway.
  auto it = pending_.begin();
  SequencedOutcome next{.sequence = it->first, .outcome = std::move(it->second)};
  pending_.erase(it);
  next_sequence_ = next.sequence + 1;
  return next;
}

void OutcomeQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::size_t OutcomeQueue::buffered() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.size();
}

std::uint64_t OutcomeQueue::next_sequence() const {
  std::lock_guard<std::mutex> lock(mu_);
  return next_sequence_;
}

} // namespace linkwatch::runtime
