#pragma once

#include "Utilities.h"

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hl {

/**
 * Transfer request between two addresses.
 * Immutable once submitted; consumed when included in a committed block.
 */
struct Transaction {
  constexpr static size_t SIGNATURE_LENGTH = 64; // hex-encoded 32-byte tag

  // validate() codes
  static constexpr const int32_t E_MISSING_ID = 1;
  static constexpr const int32_t E_MISSING_PARTY = 2;
  static constexpr const int32_t E_AMOUNT = 3;
  static constexpr const int32_t E_FEE = 4;
  static constexpr const int32_t E_SIGNATURE = 5;
  // fromJson() codes
  static constexpr const int32_t E_NOT_OBJECT = 10;
  static constexpr const int32_t E_FIELD_TYPE = 11;
  static constexpr const int32_t E_FIELD_VALUE = 12;

  std::string id;
  std::string from;
  std::string to;
  double amount{ 0 };
  double fee{ 0 };
  std::string signature;
  int64_t timestamp{ 0 }; // milliseconds since epoch
  uint64_t nonce{ 0 };    // sender's committed transaction count at creation
  std::string data;

  /**
   * Structural checks only: required fields present, amount > 0, fee >= 0,
   * signature of exactly SIGNATURE_LENGTH characters. The signature itself
   * is not verified.
   */
  Roe<void> validate() const;

  /** Canonical field string covered by the signature. */
  std::string signingPayload() const;

  nlohmann::json toJson() const;
  static Roe<Transaction> fromJson(const nlohmann::json &jd);
};

/**
 * Ordered batch of transactions linked to its predecessor by hash.
 */
struct Block {
  /**
   * Hash input split around the nonce so a nonce search only rebuilds
   * the part that changes.
   */
  struct HashInput {
    std::string head;
    std::string tail;

    std::string hashWithNonce(uint64_t nonce) const;
  };

  uint64_t index{ 0 };
  int64_t timestamp{ 0 }; // milliseconds since epoch
  std::vector<Transaction> transactions;
  std::string previousHash;
  std::string hash;
  uint64_t nonce{ 0 };
  std::string merkleRoot;
  uint32_t difficulty{ 0 }; // required leading '0' characters, 0 = no PoW
  std::string miner;
  double reward{ 0 };

  HashInput getHashInput() const;

  /** SHA-256 over every field except hash itself. */
  std::string calculateHash() const;

  nlohmann::json toJson() const;

  static std::string calculateMerkleRoot(const std::vector<Transaction> &txes);
  static bool meetsDifficulty(const std::string &hash, uint32_t difficulty);
};

} // namespace hl
