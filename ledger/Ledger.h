#pragma once

#include "Block.h"
#include "BlockValidator.hpp"
#include "Module.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace hl {

/**
 * Ledger - append-only chain of blocks plus the pending-transaction pool.
 *
 * All mutations run under one writer lock; mineBlock() holds it across
 * drain, nonce search, validation and append so two producers can never
 * spend the same pending transaction. Readers share the lock.
 *
 * Difficulty only rises while the next level is expected to fit in
 * maxMiningMillis, and drops by one after a nonce search times out.
 */
class Ledger : public Module {
public:
  struct Config {
    uint32_t difficulty{ 4 };
    double miningReward{ 10 };
    int64_t maxMiningMillis{ 5000 };
    int64_t targetBlockTimeMillis{ 10000 };
    bool adjustDifficulty{ true };
  };

  struct NetworkStats {
    uint64_t blockHeight{ 0 };
    uint64_t totalTransactions{ 0 };
    uint64_t pendingTransactions{ 0 };
    uint32_t difficulty{ 0 };
    double averageBlockTime{ 0 }; // seconds
    std::string networkHashRate;

    nlohmann::json toJson() const;
  };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Transaction admission errors
  constexpr static int32_t E_TX_INVALID = 1;   // Structural validation failed
  constexpr static int32_t E_TX_DUPLICATE = 2; // Id already pending or committed

  // Block production errors
  constexpr static int32_t E_NO_PENDING = 10;       // Nothing to mine
  constexpr static int32_t E_MINING_TIMEOUT = 11;   // Nonce search exhausted
  constexpr static int32_t E_CONSENSUS_REJECT = 12; // Validator refused block

  constexpr static const char *GENESIS_PREVIOUS_HASH = "0";
  constexpr static const char *GENESIS_MINER = "genesis";

  // Expected nonce-search work grows by this factor per leading '0'
  constexpr static int64_t WORK_FACTOR_PER_DIGIT = 16;

  Ledger(const Config &config, iii::BlockValidator &validator);
  ~Ledger() override = default;

  // ----------------- accessors -------------------------------------
  std::vector<Block> getChain() const;
  /** Most recent blocks in chain order, at most limit of them. */
  std::vector<Block> getRecentBlocks(size_t limit) const;
  std::vector<Transaction> getPendingTransactions() const;
  Block getLatestBlock() const;
  size_t getChainLength() const;
  uint32_t getDifficulty() const;
  double getAccountBalance(const std::string &address) const;
  NetworkStats getNetworkStats() const;

  // ----------------- methods -------------------------------------
  static std::string calculateHash(const Block &block);

  /** Builds and signs a transaction; does not enqueue it. */
  Transaction createTransaction(const std::string &from, const std::string &to,
                                double amount, const std::string &key) const;
  Roe<void> addTransaction(const Transaction &tx);
  Roe<Block> mineBlock(const std::string &minerAddress);
  bool validateChain() const;

  static double calculateFee(double amount);

protected:
  std::vector<Block> chain_;

private:
  void createGenesisBlock();
  bool searchNonce(Block &candidate) const;
  void adjustDifficulty(int64_t productionMillis);
  void relaxDifficulty();
  uint64_t countSentTransactions(const std::string &address) const;
  static std::string formatHashRate(double hashesPerSecond);

  Config config_;
  iii::BlockValidator &validator_;
  uint32_t difficulty_{ 0 };
  std::vector<Transaction> pending_;
  std::unordered_set<std::string> knownTxIds_; // pending and committed
  mutable std::shared_mutex mutex_;
};

} // namespace hl
