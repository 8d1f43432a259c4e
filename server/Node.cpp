#include "Node.h"
#include "Utilities.h"

#include <cmath>
#include <exception>
#include <limits>
#include <type_traits>

namespace hl {

using consensus::ConsensusEngine;

// ----------------- configuration -------------------------------------

namespace {

std::string fieldName(const std::string &section, const char *key) {
  return "'" + section + "." + key + "'";
}

template <typename T>
Node::Roe<void> readNumber(const nlohmann::json &jd, const std::string &section,
                           const char *key, T &out) {
  if (!jd.contains(key)) {
    return {};
  }
  if (!jd[key].is_number()) {
    return Node::Error(Node::E_CONFIG,
                       fieldName(section, key) + " must be a number");
  }
  out = jd[key].get<T>();
  return {};
}

template <typename T>
Node::Roe<void> readInteger(const nlohmann::json &jd,
                            const std::string &section, const char *key,
                            T &out) {
  if (!jd.contains(key)) {
    return {};
  }
  if (!jd[key].is_number_integer()) {
    return Node::Error(Node::E_CONFIG,
                       fieldName(section, key) + " must be an integer");
  }
  if (jd[key].is_number_unsigned()) {
    if (jd[key].get<uint64_t>() >
        static_cast<uint64_t>(std::numeric_limits<T>::max())) {
      return Node::Error(Node::E_CONFIG,
                         fieldName(section, key) + " is out of range");
    }
  } else {
    // Signed storage: values built from C++ ints land here even when >= 0
    int64_t value = jd[key].get<int64_t>();
    if (std::is_unsigned<T>::value && value < 0) {
      return Node::Error(Node::E_CONFIG,
                         fieldName(section, key) + " must not be negative");
    }
    if ((std::is_signed<T>::value &&
         value < static_cast<int64_t>(std::numeric_limits<T>::min())) ||
        (value > 0 && static_cast<uint64_t>(value) >
                          static_cast<uint64_t>(std::numeric_limits<T>::max()))) {
      return Node::Error(Node::E_CONFIG,
                         fieldName(section, key) + " is out of range");
    }
  }
  out = jd[key].get<T>();
  return {};
}

Node::Roe<void> readString(const nlohmann::json &jd,
                           const std::string &section, const char *key,
                           std::string &out) {
  if (!jd.contains(key)) {
    return {};
  }
  if (!jd[key].is_string()) {
    return Node::Error(Node::E_CONFIG,
                       fieldName(section, key) + " must be a string");
  }
  out = jd[key].get<std::string>();
  return {};
}

Node::Roe<void> readBool(const nlohmann::json &jd, const std::string &section,
                         const char *key, bool &out) {
  if (!jd.contains(key)) {
    return {};
  }
  if (!jd[key].is_boolean()) {
    return Node::Error(Node::E_CONFIG,
                       fieldName(section, key) + " must be a boolean");
  }
  out = jd[key].get<bool>();
  return {};
}

Node::Roe<nlohmann::json> getSection(const nlohmann::json &jd,
                                     const char *key) {
  if (!jd.contains(key)) {
    return nlohmann::json::object();
  }
  if (!jd[key].is_object()) {
    return Node::Error(Node::E_CONFIG,
                       std::string("'") + key + "' must be an object");
  }
  return jd[key];
}

bool isKnownLevel(const std::string &name) {
  // Unknown names fall back, so two different fallbacks disagree
  return logging::parseLevel(name, logging::Level::DEBUG) ==
         logging::parseLevel(name, logging::Level::CRITICAL);
}

Node::Roe<void> readLedgerSection(const nlohmann::json &jd,
                                  Node::Config &config) {
  auto section = getSection(jd, "ledger");
  if (!section) {
    return section.error();
  }
  const auto &lj = section.value();
  auto &ledger = config.ledger;

  auto result = readInteger(lj, "ledger", "difficulty", ledger.difficulty);
  if (!result) {
    return result;
  }
  result = readNumber(lj, "ledger", "miningReward", ledger.miningReward);
  if (!result) {
    return result;
  }
  result = readInteger(lj, "ledger", "maxMiningMillis", ledger.maxMiningMillis);
  if (!result) {
    return result;
  }
  result = readInteger(lj, "ledger", "targetBlockTimeMillis",
                       ledger.targetBlockTimeMillis);
  if (!result) {
    return result;
  }
  result = readBool(lj, "ledger", "adjustDifficulty", ledger.adjustDifficulty);
  if (!result) {
    return result;
  }
  result = readInteger(lj, "ledger", "maxFutureDriftMillis",
                       config.consensus.maxFutureDriftMillis);
  if (!result) {
    return result;
  }
  result = readInteger(lj, "ledger", "maxPastDriftMillis",
                       config.consensus.maxPastDriftMillis);
  if (!result) {
    return result;
  }

  if (ledger.difficulty < 1 || ledger.difficulty > 64) {
    return Node::Error(Node::E_CONFIG,
                       "'ledger.difficulty' must be between 1 and 64");
  }
  if (!std::isfinite(ledger.miningReward) || ledger.miningReward < 0) {
    return Node::Error(Node::E_CONFIG,
                       "'ledger.miningReward' must not be negative");
  }
  if (ledger.maxMiningMillis <= 0 || ledger.targetBlockTimeMillis <= 0) {
    return Node::Error(Node::E_CONFIG, "ledger time limits must be positive");
  }
  if (config.consensus.maxFutureDriftMillis < 0 ||
      config.consensus.maxPastDriftMillis < 0) {
    return Node::Error(Node::E_CONFIG,
                       "timestamp drift limits must not be negative");
  }
  return {};
}

Node::Roe<void> readConsensusSection(const nlohmann::json &jd,
                                     Node::Config &config) {
  auto section = getSection(jd, "consensus");
  if (!section) {
    return section.error();
  }
  const auto &cj = section.value();
  auto &consensus = config.consensus;

  std::string typeName = ConsensusEngine::toString(consensus.type);
  auto result = readString(cj, "consensus", "type", typeName);
  if (!result) {
    return result;
  }
  auto type = ConsensusEngine::parseConsensusType(typeName);
  if (!type) {
    return Node::Error(Node::E_CONFIG, type.error().message);
  }
  consensus.type = type.value();

  result = readNumber(cj, "consensus", "minimumStake", consensus.minimumStake);
  if (!result) {
    return result;
  }
  result = readNumber(cj, "consensus", "slashingPenalty",
                      consensus.slashingPenalty);
  if (!result) {
    return result;
  }
  result = readNumber(cj, "consensus", "reputationPenalty",
                      consensus.reputationPenalty);
  if (!result) {
    return result;
  }
  result = readNumber(cj, "consensus", "selectionThreshold",
                      consensus.selectionThreshold);
  if (!result) {
    return result;
  }
  result = readInteger(cj, "consensus", "seed", consensus.seed);
  if (!result) {
    return result;
  }

  if (!std::isfinite(consensus.minimumStake) || consensus.minimumStake < 0) {
    return Node::Error(Node::E_CONFIG,
                       "'consensus.minimumStake' must not be negative");
  }
  if (!(consensus.slashingPenalty >= 0 && consensus.slashingPenalty <= 1)) {
    return Node::Error(Node::E_CONFIG,
                       "'consensus.slashingPenalty' must be within [0, 1]");
  }
  if (!(consensus.reputationPenalty >= 0)) {
    return Node::Error(Node::E_CONFIG,
                       "'consensus.reputationPenalty' must not be negative");
  }
  if (!(consensus.selectionThreshold >= 0 &&
        consensus.selectionThreshold < 1)) {
    return Node::Error(Node::E_CONFIG,
                       "'consensus.selectionThreshold' must be within [0, 1)");
  }
  return {};
}

Node::Roe<void> readProducerSection(const nlohmann::json &jd,
                                    Node::Config &config) {
  auto section = getSection(jd, "producer");
  if (!section) {
    return section.error();
  }
  const auto &pj = section.value();
  auto &producer = config.producer;

  auto result = readInteger(pj, "producer", "intervalMillis",
                            producer.intervalMillis);
  if (!result) {
    return result;
  }
  result = readString(pj, "producer", "minerAddress", producer.minerAddress);
  if (!result) {
    return result;
  }

  if (producer.intervalMillis < 0) {
    return Node::Error(Node::E_CONFIG,
                       "'producer.intervalMillis' must not be negative");
  }
  if (producer.intervalMillis > 0 && producer.minerAddress.empty()) {
    return Node::Error(
        Node::E_CONFIG,
        "'producer.minerAddress' is required when an interval is set");
  }
  return {};
}

Node::Roe<void> readValidators(const nlohmann::json &jd,
                               Node::Config &config) {
  if (!jd.contains("validators")) {
    return {};
  }
  if (!jd["validators"].is_array()) {
    return Node::Error(Node::E_CONFIG, "'validators' must be an array");
  }
  for (const auto &vj : jd["validators"]) {
    if (!vj.is_object() || !vj.contains("address") ||
        !vj["address"].is_string() || !vj.contains("stake") ||
        !vj["stake"].is_number()) {
      return Node::Error(
          Node::E_CONFIG,
          "each validator needs a string 'address' and numeric 'stake'");
    }
    Node::ValidatorEntry entry;
    entry.address = vj["address"].get<std::string>();
    entry.stake = vj["stake"].get<double>();
    if (entry.stake < config.consensus.minimumStake) {
      return Node::Error(Node::E_CONFIG,
                         "validator '" + entry.address +
                             "' stake is below the minimum stake");
    }
    config.validators.push_back(entry);
  }
  return {};
}

Node::Roe<void> readLoggingSection(const nlohmann::json &jd,
                                   Node::Config &config) {
  auto section = getSection(jd, "logging");
  if (!section) {
    return section.error();
  }
  const auto &gj = section.value();

  auto result = readString(gj, "logging", "level", config.logLevel);
  if (!result) {
    return result;
  }
  result = readString(gj, "logging", "file", config.logFile);
  if (!result) {
    return result;
  }
  if (!isKnownLevel(config.logLevel)) {
    return Node::Error(Node::E_CONFIG,
                       "unknown log level: " + config.logLevel);
  }
  return {};
}

} // namespace

Node::Roe<Node::Config> Node::Config::fromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "configuration must be a JSON object");
  }

  Config config;
  auto result = readLedgerSection(jd, config);
  if (!result) {
    return result.error();
  }
  result = readConsensusSection(jd, config);
  if (!result) {
    return result.error();
  }
  result = readProducerSection(jd, config);
  if (!result) {
    return result.error();
  }
  // Validator stakes are checked against the configured minimum stake
  result = readValidators(jd, config);
  if (!result) {
    return result.error();
  }
  result = readLoggingSection(jd, config);
  if (!result) {
    return result.error();
  }
  return config;
}

// ----------------- lifecycle -------------------------------------

Node::Node(const Config &config)
    : Module("hl.node"), config_(config), consensus_(config_.consensus),
      ledger_(config_.ledger, consensus_), producer_(ledger_),
      scheduler_(config_.producer, producer_) {
  registerValidators();
  initHandlers();
}

Node::~Node() { stop(); }

void Node::registerValidators() {
  for (const auto &entry : config_.validators) {
    if (!consensus_.addValidator(entry.address, entry.stake)) {
      log().error << "Failed to register configured validator "
                  << entry.address;
    }
  }
}

Node::Roe<void> Node::start() {
  auto producerStart = producer_.start();
  if (!producerStart) {
    return Error(E_SERVICE, "Failed to start block producer: " +
                                producerStart.error().message);
  }

  if (config_.producer.intervalMillis > 0) {
    auto schedulerStart = scheduler_.start();
    if (!schedulerStart) {
      producer_.stop();
      return Error(E_SERVICE, "Failed to start block scheduler: " +
                                  schedulerStart.error().message);
    }
  }

  log().info << "Node started (" << ConsensusEngine::toString(consensus_.getType())
             << ", difficulty " << ledger_.getDifficulty() << ")";
  return {};
}

void Node::stop() {
  scheduler_.stop();
  producer_.stop();
}

nlohmann::json Node::getStats() const {
  auto consensusStats = consensus_.getConsensusStats();
  consensusStats.lastBlockTime = ledger_.getLatestBlock().timestamp;

  nlohmann::json j;
  j["network"] = ledger_.getNetworkStats().toJson();
  j["consensus"] = consensusStats.toJson();
  return j;
}

// ----------------- request dispatch -------------------------------------

void Node::initHandlers() {
  auto bind = [this](Roe<nlohmann::json> (Node::*fn)(const nlohmann::json &)) {
    return [this, fn](const nlohmann::json &req) { return (this->*fn)(req); };
  };

  requestHandlers_["get_stats"] = bind(&Node::hGetStats);
  requestHandlers_["get_chain"] = bind(&Node::hGetChain);
  requestHandlers_["get_pending"] = bind(&Node::hGetPending);
  requestHandlers_["get_validators"] = bind(&Node::hGetValidators);
  requestHandlers_["create_transaction"] = bind(&Node::hCreateTransaction);
  requestHandlers_["add_transaction"] = bind(&Node::hAddTransaction);
  requestHandlers_["mine_block"] = bind(&Node::hMineBlock);
  requestHandlers_["validate_chain"] = bind(&Node::hValidateChain);
  requestHandlers_["add_validator"] = bind(&Node::hAddValidator);
  requestHandlers_["add_stake"] = bind(&Node::hAddStake);
  requestHandlers_["slash_validator"] = bind(&Node::hSlashValidator);
  requestHandlers_["get_balance"] = bind(&Node::hGetBalance);
  requestHandlers_["select_validator"] = bind(&Node::hSelectValidator);
  requestHandlers_["get_miner_stats"] = bind(&Node::hGetMinerStats);
}

std::string Node::handleRequest(const std::string &request) {
  log().debug << "Received request (" << request.size() << " bytes)";

  nlohmann::json resp;
  auto jsonResult = utl::parseJsonRequest(request);
  if (!jsonResult) {
    resp["error"] = jsonResult.error().message;
    return resp.dump();
  }

  const nlohmann::json &req = jsonResult.value();
  std::string type = req["type"].get<std::string>();

  auto it = requestHandlers_.find(type);
  if (it == requestHandlers_.end()) {
    resp["error"] = "unknown request type: " + type;
    return resp.dump();
  }

  try {
    auto result = it->second(req);
    if (!result) {
      log().debug << "Request '" << type
                  << "' failed: " << result.error().message;
      resp["error"] = result.error().message;
      return resp.dump();
    }
    resp = result.value();
    resp["status"] = "ok";
  } catch (const std::exception &e) {
    log().error << "Exception handling request '" << type << "': " << e.what();
    resp = nlohmann::json::object();
    resp["error"] = std::string("internal error: ") + e.what();
  }
  return resp.dump();
}

Node::Roe<std::string> Node::requireString(const nlohmann::json &req,
                                           const std::string &key) {
  if (!req.contains(key) || !req[key].is_string()) {
    return Error(E_REQUEST, "missing or invalid field '" + key + "'");
  }
  return req[key].get<std::string>();
}

Node::Roe<double> Node::requireNumber(const nlohmann::json &req,
                                      const std::string &key) {
  if (!req.contains(key) || !req[key].is_number()) {
    return Error(E_REQUEST, "missing or invalid field '" + key + "'");
  }
  double value = req[key].get<double>();
  if (!std::isfinite(value)) {
    return Error(E_REQUEST, "field '" + key + "' must be finite");
  }
  return value;
}

Node::Roe<nlohmann::json> Node::hGetStats(const nlohmann::json &req) {
  return getStats();
}

Node::Roe<nlohmann::json> Node::hGetChain(const nlohmann::json &req) {
  size_t limit = DEFAULT_CHAIN_LIMIT;
  if (req.contains("limit")) {
    if (!req["limit"].is_number_unsigned()) {
      return Error(E_REQUEST, "'limit' must be a non-negative integer");
    }
    limit = req["limit"].get<size_t>();
  }

  nlohmann::json resp;
  resp["blocks"] = nlohmann::json::array();
  for (const auto &block : ledger_.getRecentBlocks(limit)) {
    resp["blocks"].push_back(block.toJson());
  }
  resp["length"] = ledger_.getChainLength();
  return resp;
}

Node::Roe<nlohmann::json> Node::hGetPending(const nlohmann::json &req) {
  nlohmann::json resp;
  resp["transactions"] = nlohmann::json::array();
  for (const auto &tx : ledger_.getPendingTransactions()) {
    resp["transactions"].push_back(tx.toJson());
  }
  return resp;
}

Node::Roe<nlohmann::json> Node::hGetValidators(const nlohmann::json &req) {
  nlohmann::json resp;
  resp["validators"] = nlohmann::json::array();
  for (const auto &validator : consensus_.getValidators()) {
    resp["validators"].push_back(validator.toJson());
  }
  resp["stats"] = consensus_.getConsensusStats().toJson();
  return resp;
}

Node::Roe<nlohmann::json> Node::hCreateTransaction(const nlohmann::json &req) {
  auto from = requireString(req, "from");
  if (!from) {
    return from.error();
  }
  auto to = requireString(req, "to");
  if (!to) {
    return to.error();
  }
  auto amount = requireNumber(req, "amount");
  if (!amount) {
    return amount.error();
  }
  auto key = requireString(req, "key");
  if (!key) {
    return key.error();
  }

  Transaction tx = ledger_.createTransaction(*from, *to, *amount, *key);
  nlohmann::json resp;
  resp["transaction"] = tx.toJson();
  return resp;
}

Node::Roe<nlohmann::json> Node::hAddTransaction(const nlohmann::json &req) {
  if (!req.contains("transaction")) {
    return Error(E_REQUEST, "missing field 'transaction'");
  }
  auto tx = Transaction::fromJson(req["transaction"]);
  if (!tx) {
    return Error(E_REQUEST, tx.error().message);
  }

  auto added = ledger_.addTransaction(*tx);
  nlohmann::json resp;
  resp["success"] = added.isOk();
  if (!added) {
    resp["reason"] = added.error().message;
  }
  return resp;
}

Node::Roe<nlohmann::json> Node::hMineBlock(const nlohmann::json &req) {
  auto miner = requireString(req, "minerAddress");
  if (!miner) {
    return miner.error();
  }

  auto block = producer_.produceNow(*miner);
  nlohmann::json resp;
  if (block) {
    resp["block"] = block->toJson();
  } else {
    resp["block"] = nullptr;
    resp["message"] = block.error().message;
  }
  return resp;
}

Node::Roe<nlohmann::json> Node::hValidateChain(const nlohmann::json &req) {
  nlohmann::json resp;
  resp["valid"] = ledger_.validateChain();
  return resp;
}

Node::Roe<nlohmann::json> Node::hAddValidator(const nlohmann::json &req) {
  auto address = requireString(req, "address");
  if (!address) {
    return address.error();
  }
  auto stake = requireNumber(req, "stake");
  if (!stake) {
    return stake.error();
  }

  nlohmann::json resp;
  resp["success"] = consensus_.addValidator(*address, *stake);
  return resp;
}

Node::Roe<nlohmann::json> Node::hAddStake(const nlohmann::json &req) {
  auto address = requireString(req, "address");
  if (!address) {
    return address.error();
  }
  auto amount = requireNumber(req, "amount");
  if (!amount) {
    return amount.error();
  }

  nlohmann::json resp;
  resp["success"] = consensus_.addStake(*address, *amount);
  return resp;
}

Node::Roe<nlohmann::json> Node::hSlashValidator(const nlohmann::json &req) {
  auto address = requireString(req, "address");
  if (!address) {
    return address.error();
  }
  std::string reason = "unspecified";
  if (req.contains("reason") && req["reason"].is_string()) {
    reason = req["reason"].get<std::string>();
  }

  nlohmann::json resp;
  resp["success"] = consensus_.slashValidator(*address, reason);
  return resp;
}

Node::Roe<nlohmann::json> Node::hGetBalance(const nlohmann::json &req) {
  auto address = requireString(req, "address");
  if (!address) {
    return address.error();
  }

  nlohmann::json resp;
  resp["address"] = *address;
  resp["balance"] = ledger_.getAccountBalance(*address);
  return resp;
}

Node::Roe<nlohmann::json> Node::hSelectValidator(const nlohmann::json &req) {
  auto selected = consensus_.selectValidator();
  nlohmann::json resp;
  if (selected) {
    resp["validator"] = *selected;
  } else {
    resp["validator"] = nullptr;
  }
  return resp;
}

Node::Roe<nlohmann::json> Node::hGetMinerStats(const nlohmann::json &req) {
  nlohmann::json resp;
  resp["miners"] = nlohmann::json::object();
  for (const auto &entry : producer_.getMinerStats()) {
    resp["miners"][entry.first] = entry.second.toJson();
  }
  return resp;
}

} // namespace hl
