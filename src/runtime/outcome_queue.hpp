#pragma once

#include "health/probe_outcome.hpp"

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

namespace linkwatch::runtime {

struct SequencedOutcome {
  std::uint64_t sequence = 0;
  health::ProbeOutcome outcome;
};

// Reorders probe outcomes by scheduler tick for the single consumer.
//
// Probe tasks finish in any order (a timed-out probe completes long after a
// fast one fired later), but the health core must see outcomes in firing
// order. Push() may be called from any thread; PopNext() from one consumer.
//
// - PopNext() blocks until the outcome for the next expected sequence has
//   arrived and returns it.
// - after Close(), the remaining buffered outcomes are released in ascending
//   order (gaps skipped), then PopNext() returns empty.
// - a sequence older than the next expected one is dropped on Push().
class OutcomeQueue {
public:
  explicit OutcomeQueue(std::uint64_t first_sequence = 0);

  OutcomeQueue(const OutcomeQueue&) = delete;
  OutcomeQueue& operator=(const OutcomeQueue&) = delete;

  // Returns false when the outcome was dropped (stale or duplicate sequence,
  // or the queue is closed).
  bool Push(std::uint64_t sequence, health::ProbeOutcome outcome);

  std::optional<SequencedOutcome> PopNext();

  void Close();

  std::size_t buffered() const;
  std::uint64_t next_sequence() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::map<std::uint64_t, health::ProbeOutcome> pending_;
  std::uint64_t next_sequence_ = 0;
  bool closed_ = false;
};

} // namespace linkwatch::runtime
