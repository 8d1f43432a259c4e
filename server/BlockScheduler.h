#pragma once

#include "BlockProducer.h"
#include "Service.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace hl {

/**
 * Emits a production event every interval for a fixed miner address.
 * An event is skipped while the producer still has one queued, so a slow
 * nonce search never builds a backlog.
 */
class BlockScheduler : public Service {
public:
  struct Config {
    int64_t intervalMillis{ 0 };
    std::string minerAddress;
  };

  BlockScheduler(const Config &config, BlockProducer &producer);
  ~BlockScheduler() override;

  uint64_t getEmittedCount() const { return emitted_; }

protected:
  Roe<void> onStart() override;
  void runLoop() override;

private:
  constexpr static int64_t TICK_MILLIS = 20;

  Config config_;
  BlockProducer &producer_;
  std::atomic<uint64_t> emitted_{ 0 };
};

} // namespace hl
