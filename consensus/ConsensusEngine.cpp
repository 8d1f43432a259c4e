#include "ConsensusEngine.h"
#include "Ledger.h"
#include "Utilities.h"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace hl {
namespace consensus {

nlohmann::json ConsensusEngine::Stats::toJson() const {
  nlohmann::json j;
  j["consensusType"] = consensusType;
  j["totalValidators"] = totalValidators;
  j["activeValidators"] = activeValidators;
  j["totalStake"] = totalStake;
  j["minimumStake"] = minimumStake;
  j["averageReputation"] = averageReputation;
  j["lastBlockTime"] = lastBlockTime;
  return j;
}

ConsensusEngine::ConsensusEngine(const Config &config)
    : Module("hl.consensus"), config_(config) {
  if (config_.seed != 0) {
    rng_.seed(config_.seed);
  } else {
    std::random_device rd;
    rng_.seed((static_cast<uint64_t>(rd()) << 32) | rd());
  }
  log().info << "Consensus engine initialized: " << toString(config_.type)
             << ", minimum stake " << config_.minimumStake;
}

std::string ConsensusEngine::toString(ConsensusType type) {
  switch (type) {
  case ConsensusType::POW:
    return "pow";
  case ConsensusType::POS:
    return "pos";
  case ConsensusType::HYBRID:
    return "hybrid";
  default:
    return "unknown";
  }
}

ConsensusEngine::Roe<ConsensusType>
ConsensusEngine::parseConsensusType(const std::string &name) {
  if (name == "pow") {
    return ConsensusType::POW;
  }
  if (name == "pos") {
    return ConsensusType::POS;
  }
  if (name == "hybrid") {
    return ConsensusType::HYBRID;
  }
  return Error(E_UNKNOWN_TYPE, "unknown consensus type: " + name);
}

// ----------------- accessors -------------------------------------

std::vector<Validator> ConsensusEngine::getValidators() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Validator> validators;
  validators.reserve(mValidators_.size());
  for (const auto &entry : mValidators_) {
    validators.push_back(entry.second);
  }
  return validators;
}

ConsensusEngine::Roe<Validator>
ConsensusEngine::getValidator(const std::string &address) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = mValidators_.find(address);
  if (it == mValidators_.end()) {
    return Error(E_NO_VALIDATOR, "validator not found: " + address);
  }
  return it->second;
}

double ConsensusEngine::getTotalActiveStake() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return totalActiveStakeUnlocked();
}

double ConsensusEngine::totalActiveStakeUnlocked() const {
  double total = 0;
  for (const auto &entry : mValidators_) {
    if (entry.second.isActive) {
      total += entry.second.stake;
    }
  }
  return total;
}

bool ConsensusEngine::isEligible(const Validator &validator) const {
  return validator.isActive && validator.stake >= config_.minimumStake;
}

ConsensusEngine::Stats ConsensusEngine::getConsensusStats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  Stats stats;
  stats.consensusType = toString(config_.type);
  stats.totalValidators = mValidators_.size();
  stats.minimumStake = config_.minimumStake;

  double reputationSum = 0;
  for (const auto &entry : mValidators_) {
    if (entry.second.isActive) {
      ++stats.activeValidators;
      stats.totalStake += entry.second.stake;
      reputationSum += entry.second.reputation;
    }
  }
  if (stats.activeValidators > 0) {
    stats.averageReputation = reputationSum / stats.activeValidators;
  }
  return stats;
}

// ----------------- BlockValidator --------------------------------

bool ConsensusEngine::isProofOfWorkRequired() const {
  return config_.type != ConsensusType::POS;
}

bool ConsensusEngine::canProduceBlock(const std::string &minerAddress) const {
  if (config_.type == ConsensusType::POW) {
    return true;
  }
  return hasSufficientStake(minerAddress);
}

bool ConsensusEngine::validateBlock(const Block &block) {
  auto structure = checkBlockStructure(block);
  if (!structure) {
    log().warning << "Block " << block.index
                  << " failed structural check: " << structure.error().message;
    return false;
  }

  switch (config_.type) {
  case ConsensusType::POW:
    return validateProofOfWork(block);
  case ConsensusType::POS:
    return validateProofOfStake(block);
  case ConsensusType::HYBRID:
    return validateProofOfWork(block) && validateProofOfStake(block);
  default:
    return false;
  }
}

void ConsensusEngine::onBlockCommitted(const Block &block) {
  if (config_.type == ConsensusType::POW) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = mValidators_.find(block.miner);
  if (it != mValidators_.end()) {
    it->second.lastValidation = block.timestamp;
  }
}

// ----------------- methods -------------------------------------

ConsensusEngine::Roe<void>
ConsensusEngine::checkBlockStructure(const Block &block) const {
  if (block.hash.empty() || block.previousHash.empty()) {
    return Error(E_BLOCK_FIELD, "missing hash or previous hash");
  }

  int64_t now = utl::getCurrentTimeMillis();
  if (block.timestamp > now + config_.maxFutureDriftMillis) {
    return Error(E_BLOCK_TIME, "timestamp too far in the future");
  }
  if (block.timestamp < now - config_.maxPastDriftMillis) {
    return Error(E_BLOCK_TIME, "timestamp too far in the past");
  }

  for (const auto &tx : block.transactions) {
    auto result = tx.validate();
    if (!result) {
      return Error(E_BLOCK_TX,
                   "transaction " + tx.id + ": " + result.error().message);
    }
  }
  return {};
}

bool ConsensusEngine::validateProofOfWork(const Block &block) const {
  if (Ledger::calculateHash(block) != block.hash) {
    log().warning << "Block " << block.index << " hash does not recompute";
    return false;
  }
  if (block.difficulty == 0 ||
      !Block::meetsDifficulty(block.hash, block.difficulty)) {
    log().warning << "Block " << block.index
                  << " does not satisfy proof of work at difficulty "
                  << block.difficulty;
    return false;
  }
  return true;
}

bool ConsensusEngine::validateProofOfStake(const Block &block) const {
  if (!hasSufficientStake(block.miner)) {
    log().warning << "Block " << block.index << " failed proof of stake";
    return false;
  }
  return true;
}

bool ConsensusEngine::hasSufficientStake(const std::string &address) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto it = mValidators_.find(address);
  if (it == mValidators_.end()) {
    log().warning << "Miner " << address << " is not a registered validator";
    return false;
  }

  const Validator &validator = it->second;
  if (!isEligible(validator)) {
    log().warning << "Validator " << validator.address
                  << " is inactive or below minimum stake";
    return false;
  }

  double totalStake = totalActiveStakeUnlocked();
  double probability = totalStake > 0 ? validator.stake / totalStake : 0;
  if (probability <= config_.selectionThreshold) {
    log().warning << "Validator " << validator.address << " stake share "
                  << probability << " not above threshold "
                  << config_.selectionThreshold;
    return false;
  }
  return true;
}

ConsensusEngine::Roe<std::string> ConsensusEngine::selectValidator() {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  double totalStake = 0;
  for (const auto &entry : mValidators_) {
    if (isEligible(entry.second)) {
      totalStake += entry.second.stake;
    }
  }
  if (totalStake <= 0) {
    return Error(E_NO_VALIDATOR, "no eligible validators");
  }

  std::uniform_real_distribution<double> dist(0.0, totalStake);
  double remaining = dist(rng_);

  const Validator *selected = nullptr;
  for (const auto &entry : mValidators_) {
    if (!isEligible(entry.second)) {
      continue;
    }
    selected = &entry.second;
    remaining -= entry.second.stake;
    if (remaining <= 0) {
      break;
    }
  }
  // Rounding can leave a tiny positive remainder; the last eligible wins
  return selected->address;
}

bool ConsensusEngine::addValidator(const std::string &address, double stake) {
  if (address.empty() || !std::isfinite(stake) ||
      stake < config_.minimumStake) {
    log().warning << "Rejected validator '" << address << "' with stake "
                  << stake << " (minimum " << config_.minimumStake << ")";
    return false;
  }

  Validator validator;
  validator.address = address;
  validator.stake = stake;

  std::unique_lock<std::shared_mutex> lock(mutex_);
  mValidators_[address] = validator;
  log().info << "Validator " << address << " registered with stake " << stake;
  return true;
}

bool ConsensusEngine::addStake(const std::string &address, double amount) {
  if (!std::isfinite(amount) || amount <= 0) {
    return false;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = mValidators_.find(address);
  if (it == mValidators_.end()) {
    return false;
  }

  Validator &validator = it->second;
  validator.stake += amount;
  if (!validator.isActive && validator.stake >= config_.minimumStake) {
    validator.isActive = true;
    log().info << "Validator " << address << " reactivated with stake "
               << validator.stake;
  }
  return true;
}

bool ConsensusEngine::slashValidator(const std::string &address,
                                     const std::string &reason) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = mValidators_.find(address);
  if (it == mValidators_.end()) {
    return false;
  }

  Validator &validator = it->second;
  double penalty = validator.stake * config_.slashingPenalty;
  validator.stake = std::max(0.0, validator.stake - penalty);
  validator.reputation =
      std::max(0.0, validator.reputation - config_.reputationPenalty);
  if (validator.stake < config_.minimumStake) {
    validator.isActive = false;
  }

  log().warning << "Validator " << address << " slashed for '" << reason
                << "': penalty " << penalty << ", stake " << validator.stake
                << (validator.isActive ? "" : " (deactivated)");
  return true;
}

} // namespace consensus
} // namespace hl
