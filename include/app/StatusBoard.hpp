#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include "model/Status.hpp"

namespace mapwatch::app {

// Latest monitor state for readers on other threads (metrics server, console).
// The monitor worker is the only writer.
class StatusBoard {
public:
  StatusBoard() = default;
  // Non-copyable
  StatusBoard(const StatusBoard&) = delete;
  StatusBoard& operator=(const StatusBoard&) = delete;

  void publish(model::StatusSnapshot snap); // stamps seq

  [[nodiscard]] model::StatusSnapshot read() const;
  [[nodiscard]] uint64_t seq() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex mu_;
  model::StatusSnapshot front_{};
  std::atomic<uint64_t> seq_{0};
};

} // namespace mapwatch::app
