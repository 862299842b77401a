#pragma once

#include <atomic>

namespace canary::util {

/*
  Cooperative cancellation flag.

  Checked only between independent units of work (one backup file, one
  table); each unit is all-or-nothing on its own.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_relaxed);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace canary::util
