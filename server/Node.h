#ifndef HL_LEDGER_NODE_H
#define HL_LEDGER_NODE_H

#include "BlockProducer.h"
#include "BlockScheduler.h"
#include "ConsensusEngine.h"
#include "Ledger.h"
#include "Module.h"
#include "ResultOrError.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hl {

/**
 * Node - owns one ConsensusEngine, one Ledger and the block production
 * services, and exposes the request operation set both as typed methods
 * and as a JSON request dispatcher keyed by "type".
 */
class Node : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Error codes
  static constexpr const int32_t E_CONFIG = -1;
  static constexpr const int32_t E_REQUEST = -2;
  static constexpr const int32_t E_SERVICE = -3;

  static constexpr const size_t DEFAULT_CHAIN_LIMIT = 10;

  struct ValidatorEntry {
    std::string address;
    double stake{ 0 };
  };

  struct Config {
    Ledger::Config ledger;
    consensus::ConsensusEngine::Config consensus;
    BlockScheduler::Config producer;
    std::vector<ValidatorEntry> validators;
    std::string logLevel{ "info" };
    std::string logFile;

    static Roe<Config> fromJson(const nlohmann::json &jd);
  };

  explicit Node(const Config &config);
  ~Node() override;

  Roe<void> start();
  void stop();

  // ----------------- accessors -------------------------------------
  const Config &getConfig() const { return config_; }
  Ledger &getLedger() { return ledger_; }
  consensus::ConsensusEngine &getConsensus() { return consensus_; }
  BlockProducer &getProducer() { return producer_; }

  nlohmann::json getStats() const;

  // ----------------- methods -------------------------------------
  /** One JSON request in, one JSON response out; never throws. */
  std::string handleRequest(const std::string &request);

private:
  using Handler = std::function<Roe<nlohmann::json>(const nlohmann::json &)>;

  void initHandlers();
  void registerValidators();

  Roe<nlohmann::json> hGetStats(const nlohmann::json &req);
  Roe<nlohmann::json> hGetChain(const nlohmann::json &req);
  Roe<nlohmann::json> hGetPending(const nlohmann::json &req);
  Roe<nlohmann::json> hGetValidators(const nlohmann::json &req);
  Roe<nlohmann::json> hCreateTransaction(const nlohmann::json &req);
  Roe<nlohmann::json> hAddTransaction(const nlohmann::json &req);
  Roe<nlohmann::json> hMineBlock(const nlohmann::json &req);
  Roe<nlohmann::json> hValidateChain(const nlohmann::json &req);
  Roe<nlohmann::json> hAddValidator(const nlohmann::json &req);
  Roe<nlohmann::json> hAddStake(const nlohmann::json &req);
  Roe<nlohmann::json> hSlashValidator(const nlohmann::json &req);
  Roe<nlohmann::json> hGetBalance(const nlohmann::json &req);
  Roe<nlohmann::json> hSelectValidator(const nlohmann::json &req);
  Roe<nlohmann::json> hGetMinerStats(const nlohmann::json &req);

  static Roe<std::string> requireString(const nlohmann::json &req,
                                        const std::string &key);
  static Roe<double> requireNumber(const nlohmann::json &req,
                                   const std::string &key);

  Config config_;
  // Construction order matters: each member depends on the previous ones
  consensus::ConsensusEngine consensus_;
  Ledger ledger_;
  BlockProducer producer_;
  BlockScheduler scheduler_;

  std::map<std::string, Handler> requestHandlers_;
};

} // namespace hl

#endif // HL_LEDGER_NODE_H
