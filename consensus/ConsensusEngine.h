#pragma once

#include "Block.h"
#include "BlockValidator.hpp"
#include "Module.h"
#include "ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <map>
#include <random>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hl {
namespace consensus {

/**
 * Block acceptance rules and validator registry.
 *
 * Modes:
 * - POW: block hash must recompute and carry the required leading zeros
 * - POS: miner must be an active validator whose share of the total active
 *   stake exceeds the selection threshold
 * - HYBRID: both of the above
 */
class ConsensusEngine : public Module, public iii::BlockValidator {
public:
  struct Config {
    ConsensusType type{ ConsensusType::HYBRID };
    double minimumStake{ 32 };
    double slashingPenalty{ 0.1 };   // fraction of current stake
    double reputationPenalty{ 10 };  // points per slash, floored at 0
    double selectionThreshold{ 0.1 };
    int64_t maxFutureDriftMillis{ 60000 };
    int64_t maxPastDriftMillis{ 3600000 };
    uint64_t seed{ 0 }; // 0 = seed from std::random_device
  };

  struct Stats {
    std::string consensusType;
    uint64_t totalValidators{ 0 };
    uint64_t activeValidators{ 0 };
    double totalStake{ 0 };
    double minimumStake{ 0 };
    double averageReputation{ 0 };
    int64_t lastBlockTime{ 0 };

    nlohmann::json toJson() const;
  };

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_BLOCK_FIELD = 1;     // Missing hash or link
  constexpr static int32_t E_BLOCK_TIME = 2;      // Timestamp outside window
  constexpr static int32_t E_BLOCK_TX = 3;        // Malformed transaction
  constexpr static int32_t E_NO_VALIDATOR = 10;   // Nobody eligible
  constexpr static int32_t E_UNKNOWN_TYPE = 20;   // Bad consensus type name

  explicit ConsensusEngine(const Config &config);
  ~ConsensusEngine() override = default;

  static std::string toString(ConsensusType type);
  static Roe<ConsensusType> parseConsensusType(const std::string &name);

  // ----------------- accessors -------------------------------------
  const Config &getConfig() const { return config_; }
  ConsensusType getType() const { return config_.type; }
  std::vector<Validator> getValidators() const;
  Roe<Validator> getValidator(const std::string &address) const;
  double getTotalActiveStake() const;
  Stats getConsensusStats() const;

  // ----------------- BlockValidator --------------------------------
  bool isProofOfWorkRequired() const override;
  /** False when a stake check is due and the miner cannot pass it. */
  bool canProduceBlock(const std::string &minerAddress) const override;
  bool validateBlock(const Block &block) override;
  void onBlockCommitted(const Block &block) override;

  // ----------------- methods -------------------------------------
  Roe<void> checkBlockStructure(const Block &block) const;
  bool validateProofOfWork(const Block &block) const;
  bool validateProofOfStake(const Block &block) const;
  /** Registered, eligible, and stake share above selectionThreshold. */
  bool hasSufficientStake(const std::string &address) const;

  /** Stake-weighted roulette over active validators. */
  Roe<std::string> selectValidator();

  bool addValidator(const std::string &address, double stake);
  /** Raises stake of a registered validator, reactivating it at the minimum. */
  bool addStake(const std::string &address, double amount);
  bool slashValidator(const std::string &address, const std::string &reason);

private:
  double totalActiveStakeUnlocked() const;
  bool isEligible(const Validator &validator) const;

  Config config_;
  std::map<std::string, Validator> mValidators_;
  std::mt19937_64 rng_;
  mutable std::shared_mutex mutex_;
};

} // namespace consensus
} // namespace hl
