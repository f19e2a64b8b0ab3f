// core/cancel.hpp - Cooperative cancellation
#pragma once

#include <atomic>

namespace offload {

// Set from a signal handler or another thread; polled by the pipeline at
// stage boundaries and between files.
class CancellationToken {
public:
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace offload
