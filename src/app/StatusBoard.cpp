#include "app/StatusBoard.hpp"

namespace mapwatch::app {

void StatusBoard::publish(model::StatusSnapshot snap) {
  std::lock_guard<std::mutex> lk(mu_);
  snap.seq = front_.seq + 1;
  front_ = std::move(snap);
  seq_.store(front_.seq, std::memory_order_release);
}

model::StatusSnapshot StatusBoard::read() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_;
}

} // namespace mapwatch::app
