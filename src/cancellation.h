// cancellation.h
#pragma once
#include <atomic>

namespace fsched {

// Cooperative cancellation flag, polled between local-search iterations.
class CancellationToken {
 public:
  void cancel() { flag_.store(true, std::memory_order_release); }
  bool cancelled() const { return flag_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> flag_{false};
};

}  // namespace fsched
