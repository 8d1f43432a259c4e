#include "BlockScheduler.h"

#include <chrono>
#include <thread>

namespace hl {

BlockScheduler::BlockScheduler(const Config &config, BlockProducer &producer)
    : Service("hl.scheduler"), config_(config), producer_(producer) {}

BlockScheduler::~BlockScheduler() { stop(); }

BlockScheduler::Roe<void> BlockScheduler::onStart() {
  if (config_.intervalMillis <= 0) {
    return Error(1, "interval must be positive");
  }
  if (config_.minerAddress.empty()) {
    return Error(2, "miner address is required");
  }
  log().info << "Producing blocks for " << config_.minerAddress << " every "
             << config_.intervalMillis << " ms";
  return {};
}

void BlockScheduler::runLoop() {
  auto next = std::chrono::steady_clock::now() +
              std::chrono::milliseconds(config_.intervalMillis);

  while (isRunning()) {
    // Short ticks keep stop() responsive for long intervals
    std::this_thread::sleep_for(std::chrono::milliseconds(TICK_MILLIS));
    auto now = std::chrono::steady_clock::now();
    if (now < next) {
      continue;
    }
    next = now + std::chrono::milliseconds(config_.intervalMillis);

    if (producer_.getQueueSize() == 0) {
      producer_.requestBlock(config_.minerAddress);
      ++emitted_;
    } else {
      log().debug << "Producer busy, skipping tick";
    }
  }
}

} // namespace hl
