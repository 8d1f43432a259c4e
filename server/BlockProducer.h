#ifndef HL_LEDGER_BLOCK_PRODUCER_H
#define HL_LEDGER_BLOCK_PRODUCER_H

#include "Ledger.h"
#include "Service.h"
#include "ThreadSafeQueue.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace hl {

/**
 * BlockProducer - single worker that turns "produce block" events into
 * Ledger::mineBlock() calls.
 *
 * Events arrive through requestBlock() (from the scheduler or any other
 * thread) and are handled one at a time in the service thread.
 * produceNow() mines synchronously in the caller's thread; the ledger's
 * writer lock keeps it serialized with the worker.
 *
 * Attempts that find an empty pending pool are idle ticks and are not
 * counted in the miner statistics.
 */
class BlockProducer : public Service {
public:
  struct MinerStats {
    uint64_t attempts{ 0 };
    uint64_t blocksProduced{ 0 };
    uint64_t failedAttempts{ 0 };
    double rewardsEarned{ 0 };

    nlohmann::json toJson() const;
  };

  explicit BlockProducer(Ledger &ledger);
  ~BlockProducer() override;

  /** Queues a production event for the worker thread. */
  void requestBlock(const std::string &minerAddress);

  Ledger::Roe<Block> produceNow(const std::string &minerAddress);

  size_t getQueueSize() const { return events_.size(); }
  std::map<std::string, MinerStats> getMinerStats() const;

protected:
  void runLoop() override;

private:
  struct ProduceEvent {
    std::string minerAddress;
  };

  constexpr static int64_t POLL_TIMEOUT_MILLIS = 100;

  void recordResult(const std::string &minerAddress,
                    const Ledger::Roe<Block> &result);

  Ledger &ledger_;
  ThreadSafeQueue<ProduceEvent> events_;
  std::map<std::string, MinerStats> mMinerStats_;
  mutable std::mutex statsMutex_;
};

} // namespace hl

#endif // HL_LEDGER_BLOCK_PRODUCER_H
