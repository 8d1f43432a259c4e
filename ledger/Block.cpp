#include "Block.h"

#include <cmath>
#include <sstream>

namespace hl {

namespace {

// Shortest decimal form that round-trips, so equal values hash equally
std::string formatAmount(double value) { return nlohmann::json(value).dump(); }

} // namespace

// ---------------- Transaction ----------------

Roe<void> Transaction::validate() const {
  if (id.empty()) {
    return Error(E_MISSING_ID, "transaction id is missing");
  }
  if (from.empty() || to.empty()) {
    return Error(E_MISSING_PARTY, "transaction sender or recipient is missing");
  }
  if (!std::isfinite(amount) || amount <= 0) {
    return Error(E_AMOUNT, "transaction amount must be positive");
  }
  if (!std::isfinite(fee) || fee < 0) {
    return Error(E_FEE, "transaction fee must not be negative");
  }
  if (signature.size() != SIGNATURE_LENGTH) {
    return Error(E_SIGNATURE, "transaction signature is malformed");
  }
  return {};
}

std::string Transaction::signingPayload() const {
  std::ostringstream ss;
  ss << from << '|' << to << '|' << formatAmount(amount) << '|'
     << formatAmount(fee) << '|' << timestamp << '|' << nonce;
  return ss.str();
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["from"] = from;
  j["to"] = to;
  j["amount"] = amount;
  j["fee"] = fee;
  j["signature"] = signature;
  j["timestamp"] = timestamp;
  j["nonce"] = nonce;
  j["data"] = data;
  return j;
}

Roe<Transaction> Transaction::fromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_NOT_OBJECT, "transaction must be a JSON object");
  }

  Transaction tx;
  for (const char *key : { "id", "from", "to", "signature" }) {
    if (!jd.contains(key) || !jd[key].is_string()) {
      return Error(E_FIELD_TYPE, std::string("transaction field '") + key +
                           "' missing or not a string");
    }
  }
  if (!jd.contains("amount") || !jd["amount"].is_number()) {
    return Error(E_FIELD_VALUE, "transaction field 'amount' missing or not a number");
  }

  tx.id = jd["id"].get<std::string>();
  tx.from = jd["from"].get<std::string>();
  tx.to = jd["to"].get<std::string>();
  tx.signature = jd["signature"].get<std::string>();
  tx.amount = jd["amount"].get<double>();

  if (jd.contains("fee")) {
    if (!jd["fee"].is_number()) {
      return Error(E_FIELD_VALUE, "transaction field 'fee' is not a number");
    }
    tx.fee = jd["fee"].get<double>();
  }
  if (jd.contains("timestamp")) {
    if (!jd["timestamp"].is_number_integer()) {
      return Error(E_FIELD_VALUE, "transaction field 'timestamp' is not an integer");
    }
    tx.timestamp = jd["timestamp"].get<int64_t>();
  }
  if (jd.contains("nonce")) {
    const auto &nonce = jd["nonce"];
    if (!nonce.is_number_integer() ||
        (!nonce.is_number_unsigned() && nonce.get<int64_t>() < 0)) {
      return Error(E_FIELD_VALUE,
                   "transaction field 'nonce' is not an unsigned integer");
    }
    tx.nonce = jd["nonce"].get<uint64_t>();
  }
  if (jd.contains("data") && jd["data"].is_string()) {
    tx.data = jd["data"].get<std::string>();
  }
  return tx;
}

// ---------------- Block ----------------

std::string Block::HashInput::hashWithNonce(uint64_t nonce) const {
  return utl::sha256(head + std::to_string(nonce) + tail);
}

Block::HashInput Block::getHashInput() const {
  nlohmann::json txes = nlohmann::json::array();
  for (const auto &tx : transactions) {
    txes.push_back(tx.toJson());
  }

  HashInput input;
  std::ostringstream head;
  head << index << '|' << timestamp << '|' << txes.dump() << '|'
       << previousHash << '|';
  input.head = head.str();

  std::ostringstream tail;
  tail << '|' << merkleRoot << '|' << difficulty << '|' << miner << '|'
       << formatAmount(reward);
  input.tail = tail.str();
  return input;
}

std::string Block::calculateHash() const {
  return getHashInput().hashWithNonce(nonce);
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["transactions"] = nlohmann::json::array();
  for (const auto &tx : transactions) {
    j["transactions"].push_back(tx.toJson());
  }
  j["previousHash"] = previousHash;
  j["hash"] = hash;
  j["nonce"] = nonce;
  j["merkleRoot"] = merkleRoot;
  j["difficulty"] = difficulty;
  j["miner"] = miner;
  j["reward"] = reward;
  return j;
}

std::string Block::calculateMerkleRoot(const std::vector<Transaction> &txes) {
  if (txes.empty()) {
    return utl::sha256("");
  }

  std::vector<std::string> hashes;
  hashes.reserve(txes.size());
  for (const auto &tx : txes) {
    hashes.push_back(utl::sha256(tx.toJson().dump()));
  }

  while (hashes.size() > 1) {
    std::vector<std::string> next;
    next.reserve((hashes.size() + 1) / 2);
    for (size_t i = 0; i < hashes.size(); i += 2) {
      const std::string &left = hashes[i];
      // Odd node is paired with itself
      const std::string &right = i + 1 < hashes.size() ? hashes[i + 1] : left;
      next.push_back(utl::sha256(left + right));
    }
    hashes.swap(next);
  }
  return hashes.front();
}

bool Block::meetsDifficulty(const std::string &hash, uint32_t difficulty) {
  if (hash.size() < difficulty) {
    return false;
  }
  for (uint32_t i = 0; i < difficulty; ++i) {
    if (hash[i] != '0') {
      return false;
    }
  }
  return true;
}

} // namespace hl
