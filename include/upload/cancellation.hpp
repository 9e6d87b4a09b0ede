#ifndef CHUNKSEAL_CANCELLATION_HPP
#define CHUNKSEAL_CANCELLATION_HPP

#include <atomic>

namespace chunkseal {

/**
 * @brief Cooperative cancellation flag shared between a caller and a
 * long-running operation.
 */
class CancellationToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool isCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }
  void reset() { cancelled_.store(false, std::memory_order_release); }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace chunkseal

#endif // CHUNKSEAL_CANCELLATION_HPP
