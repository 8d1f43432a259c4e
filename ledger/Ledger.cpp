#include "Ledger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace hl {

nlohmann::json Ledger::NetworkStats::toJson() const {
  nlohmann::json j;
  j["blockHeight"] = blockHeight;
  j["totalTransactions"] = totalTransactions;
  j["pendingTransactions"] = pendingTransactions;
  j["difficulty"] = difficulty;
  j["averageBlockTime"] = averageBlockTime;
  j["networkHashRate"] = networkHashRate;
  return j;
}

Ledger::Ledger(const Config &config, iii::BlockValidator &validator)
    : Module("hl.ledger"), config_(config), validator_(validator),
      difficulty_(config.difficulty) {
  createGenesisBlock();
}

void Ledger::createGenesisBlock() {
  Block genesis;
  genesis.index = 0;
  genesis.timestamp = utl::getCurrentTimeMillis();
  genesis.previousHash = GENESIS_PREVIOUS_HASH;
  genesis.miner = GENESIS_MINER;
  genesis.reward = 0;
  genesis.difficulty = 0;
  genesis.merkleRoot = Block::calculateMerkleRoot(genesis.transactions);
  genesis.hash = genesis.calculateHash();
  chain_.push_back(genesis);

  log().info << "Genesis block created: " << genesis.hash;
}

// ----------------- accessors -------------------------------------

std::vector<Block> Ledger::getChain() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_;
}

std::vector<Block> Ledger::getRecentBlocks(size_t limit) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  size_t count = std::min(limit, chain_.size());
  return std::vector<Block>(chain_.end() - static_cast<std::ptrdiff_t>(count),
                            chain_.end());
}

std::vector<Transaction> Ledger::getPendingTransactions() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return pending_;
}

Block Ledger::getLatestBlock() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_.back();
}

size_t Ledger::getChainLength() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_.size();
}

uint32_t Ledger::getDifficulty() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return difficulty_;
}

double Ledger::getAccountBalance(const std::string &address) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  double balance = 0;
  for (const auto &block : chain_) {
    for (const auto &tx : block.transactions) {
      if (tx.to == address) {
        balance += tx.amount;
      }
      if (tx.from == address) {
        balance -= tx.amount + tx.fee;
      }
    }
    if (block.miner == address) {
      balance += block.reward;
    }
  }
  return balance;
}

Ledger::NetworkStats Ledger::getNetworkStats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  NetworkStats stats;
  stats.blockHeight = chain_.size() - 1;
  for (const auto &block : chain_) {
    stats.totalTransactions += block.transactions.size();
  }
  stats.pendingTransactions = pending_.size();
  stats.difficulty = difficulty_;

  if (chain_.size() > 1) {
    int64_t span = chain_.back().timestamp - chain_.front().timestamp;
    stats.averageBlockTime =
        static_cast<double>(span) / static_cast<double>(chain_.size() - 1) / 1000.0;
  }

  double targetSeconds =
      std::max<int64_t>(config_.targetBlockTimeMillis, 1) / 1000.0;
  stats.networkHashRate =
      formatHashRate(std::pow(2.0, difficulty_) / targetSeconds);
  return stats;
}

// ----------------- methods -------------------------------------

std::string Ledger::calculateHash(const Block &block) {
  return block.calculateHash();
}

double Ledger::calculateFee(double amount) {
  // Base fee or 0.1% of the amount, whichever is larger
  return std::max(0.001, amount * 0.001);
}

Transaction Ledger::createTransaction(const std::string &from,
                                      const std::string &to, double amount,
                                      const std::string &key) const {
  Transaction tx;
  tx.timestamp = utl::getCurrentTimeMillis();
  tx.id = "tx_" + std::to_string(tx.timestamp) + "_" + utl::randomBase36(9);
  tx.from = from;
  tx.to = to;
  tx.amount = amount;
  tx.fee = calculateFee(amount);
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    tx.nonce = countSentTransactions(from);
  }
  tx.signature = utl::hmacSha256(key, tx.signingPayload());
  return tx;
}

Ledger::Roe<void> Ledger::addTransaction(const Transaction &tx) {
  auto validation = tx.validate();
  if (!validation) {
    log().warning << "Rejected transaction '" << tx.id
                  << "': " << validation.error().message;
    return Error(E_TX_INVALID, validation.error().message);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (knownTxIds_.count(tx.id) > 0) {
    log().warning << "Rejected duplicate transaction '" << tx.id << "'";
    return Error(E_TX_DUPLICATE, "duplicate transaction id: " + tx.id);
  }

  pending_.push_back(tx);
  knownTxIds_.insert(tx.id);
  log().debug << "Transaction " << tx.id << " queued (" << pending_.size()
              << " pending)";
  return {};
}

Ledger::Roe<Block> Ledger::mineBlock(const std::string &minerAddress) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (pending_.empty()) {
    return Error(E_NO_PENDING, "no pending transactions");
  }

  if (!validator_.canProduceBlock(minerAddress)) {
    log().warning << "Miner " << minerAddress
                  << " is not eligible to produce blocks";
    return Error(E_CONSENSUS_REJECT, "miner is not eligible to produce blocks");
  }

  auto started = std::chrono::steady_clock::now();
  const Block &previous = chain_.back();

  Block candidate;
  candidate.index = chain_.size();
  candidate.timestamp = utl::getCurrentTimeMillis();
  candidate.transactions.swap(pending_);
  candidate.previousHash = previous.hash;
  candidate.miner = minerAddress;
  candidate.reward = config_.miningReward;
  candidate.merkleRoot = Block::calculateMerkleRoot(candidate.transactions);

  bool isPowRequired = validator_.isProofOfWorkRequired();
  candidate.difficulty = isPowRequired ? difficulty_ : 0;

  if (isPowRequired) {
    if (!searchNonce(candidate)) {
      pending_.swap(candidate.transactions);
      log().warning << "Mining block " << candidate.index << " timed out after "
                    << config_.maxMiningMillis << " ms at difficulty "
                    << candidate.difficulty;
      relaxDifficulty();
      return Error(E_MINING_TIMEOUT, "mining timed out");
    }
  } else {
    candidate.hash = candidate.calculateHash();
  }

  if (!validator_.validateBlock(candidate)) {
    // Drained transactions stay available for the next attempt
    pending_.swap(candidate.transactions);
    log().warning << "Block " << candidate.index << " by " << minerAddress
                  << " rejected by consensus";
    return Error(E_CONSENSUS_REJECT, "block rejected by consensus");
  }

  int64_t productionMillis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count();
  chain_.push_back(candidate);
  adjustDifficulty(productionMillis);
  validator_.onBlockCommitted(candidate);

  log().info << "Block " << candidate.index << " mined by " << minerAddress
             << " with " << candidate.transactions.size()
             << " transactions, nonce " << candidate.nonce << ", hash "
             << candidate.hash;
  return candidate;
}

bool Ledger::searchNonce(Block &candidate) const {
  auto input = candidate.getHashInput();
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config_.maxMiningMillis);

  for (uint64_t nonce = 0;; ++nonce) {
    std::string hash = input.hashWithNonce(nonce);
    if (Block::meetsDifficulty(hash, candidate.difficulty)) {
      candidate.nonce = nonce;
      candidate.hash = hash;
      return true;
    }
    if ((nonce & 0x3FF) == 0 && std::chrono::steady_clock::now() > deadline) {
      return false;
    }
  }
}

void Ledger::adjustDifficulty(int64_t productionMillis) {
  if (!config_.adjustDifficulty || !validator_.isProofOfWorkRequired() ||
      chain_.size() < 2) {
    return;
  }

  const Block &latest = chain_[chain_.size() - 1];
  const Block &previous = chain_[chain_.size() - 2];
  int64_t elapsed = latest.timestamp - previous.timestamp;

  uint32_t before = difficulty_;
  bool nextLevelFits =
      productionMillis * WORK_FACTOR_PER_DIGIT < config_.maxMiningMillis;
  if (elapsed < config_.targetBlockTimeMillis / 2 && nextLevelFits) {
    ++difficulty_;
  } else if (elapsed > config_.targetBlockTimeMillis * 2) {
    difficulty_ = difficulty_ > 1 ? difficulty_ - 1 : 1;
  }

  if (difficulty_ != before) {
    log().info << "Difficulty adjusted from " << before << " to "
               << difficulty_ << " (block interval " << elapsed << " ms)";
  }
}

void Ledger::relaxDifficulty() {
  if (!config_.adjustDifficulty || difficulty_ <= 1) {
    return;
  }
  --difficulty_;
  log().info << "Difficulty lowered to " << difficulty_
             << " after nonce search timeout";
}

bool Ledger::validateChain() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  for (size_t i = 0; i < chain_.size(); ++i) {
    const Block &block = chain_[i];

    if (block.hash != block.calculateHash()) {
      log().critical << "Chain integrity violation: block " << i
                     << " hash does not match its contents";
      return false;
    }
    if (block.merkleRoot != Block::calculateMerkleRoot(block.transactions)) {
      log().critical << "Chain integrity violation: block " << i
                     << " merkle root mismatch";
      return false;
    }
    if (block.index != i) {
      log().critical << "Chain integrity violation: block at position " << i
                     << " has index " << block.index;
      return false;
    }
    if (!Block::meetsDifficulty(block.hash, block.difficulty)) {
      log().critical << "Chain integrity violation: block " << i
                     << " does not meet difficulty " << block.difficulty;
      return false;
    }

    if (i == 0) {
      if (block.previousHash != GENESIS_PREVIOUS_HASH) {
        log().critical << "Chain integrity violation: bad genesis link";
        return false;
      }
    } else if (block.previousHash != chain_[i - 1].hash) {
      log().critical << "Chain integrity violation: block " << i
                     << " is not linked to block " << i - 1;
      return false;
    }
  }
  return true;
}

uint64_t Ledger::countSentTransactions(const std::string &address) const {
  uint64_t count = 0;
  for (const auto &block : chain_) {
    for (const auto &tx : block.transactions) {
      if (tx.from == address) {
        ++count;
      }
    }
  }
  return count;
}

std::string Ledger::formatHashRate(double hashesPerSecond) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2);
  if (hashesPerSecond > 1e12) {
    ss << hashesPerSecond / 1e12 << " TH/s";
  } else if (hashesPerSecond > 1e9) {
    ss << hashesPerSecond / 1e9 << " GH/s";
  } else if (hashesPerSecond > 1e6) {
    ss << hashesPerSecond / 1e6 << " MH/s";
  } else {
    ss << hashesPerSecond / 1e3 << " KH/s";
  }
  return ss.str();
}

} // namespace hl
