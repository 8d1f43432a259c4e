#include "BlockProducer.h"

#include <chrono>

namespace hl {

nlohmann::json BlockProducer::MinerStats::toJson() const {
  nlohmann::json j;
  j["attempts"] = attempts;
  j["blocksProduced"] = blocksProduced;
  j["failedAttempts"] = failedAttempts;
  j["rewardsEarned"] = rewardsEarned;
  return j;
}

BlockProducer::BlockProducer(Ledger &ledger)
    : Service("hl.producer"), ledger_(ledger) {}

BlockProducer::~BlockProducer() { stop(); }

void BlockProducer::requestBlock(const std::string &minerAddress) {
  events_.push(ProduceEvent{ minerAddress });
  log().debug << "Block requested for " << minerAddress << " (queue size: "
              << events_.size() << ")";
}

Ledger::Roe<Block> BlockProducer::produceNow(const std::string &minerAddress) {
  auto result = ledger_.mineBlock(minerAddress);
  recordResult(minerAddress, result);
  return result;
}

std::map<std::string, BlockProducer::MinerStats>
BlockProducer::getMinerStats() const {
  std::lock_guard<std::mutex> lock(statsMutex_);
  return mMinerStats_;
}

void BlockProducer::recordResult(const std::string &minerAddress,
                                 const Ledger::Roe<Block> &result) {
  if (!result && result.error().code == Ledger::E_NO_PENDING) {
    return;
  }

  std::lock_guard<std::mutex> lock(statsMutex_);
  MinerStats &stats = mMinerStats_[minerAddress];
  ++stats.attempts;
  if (result) {
    ++stats.blocksProduced;
    stats.rewardsEarned += result->reward;
  } else {
    ++stats.failedAttempts;
  }
}

void BlockProducer::runLoop() {
  log().info << "Block production worker started";

  while (isRunning()) {
    ProduceEvent event;
    if (!events_.pollFor(event,
                         std::chrono::milliseconds(POLL_TIMEOUT_MILLIS))) {
      continue;
    }

    auto result = produceNow(event.minerAddress);
    if (!result) {
      if (result.error().code == Ledger::E_NO_PENDING) {
        log().debug << "Nothing to produce for " << event.minerAddress;
      } else {
        log().warning << "Block production for " << event.minerAddress
                      << " failed: " << result.error().message;
      }
    }
  }

  log().info << "Block production worker stopped";
}

} // namespace hl
