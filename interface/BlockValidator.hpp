#pragma once

#include <string>

namespace hl {

struct Block;

namespace iii {

/**
 * Acceptance rule consulted by the Ledger before a candidate block is
 * committed. Implemented by the consensus engine.
 */
class BlockValidator {
public:
  virtual ~BlockValidator() = default;

  // True if candidates must carry a proof-of-work nonce
  virtual bool isProofOfWorkRequired() const = 0;

  // Cheap pre-check run before any nonce search for this miner
  virtual bool canProduceBlock(const std::string &minerAddress) const = 0;

  virtual bool validateBlock(const Block &block) = 0;

  // Called once the block has been appended to the chain
  virtual void onBlockCommitted(const Block &block) = 0;
};

} // namespace iii
} // namespace hl
