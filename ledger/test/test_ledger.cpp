#include "Ledger.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <set>
#include <thread>

using namespace hl;
using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class MockBlockValidator : public iii::BlockValidator {
public:
  MOCK_METHOD(bool, isProofOfWorkRequired, (), (const, override));
  MOCK_METHOD(bool, canProduceBlock, (const std::string &minerAddress),
              (const, override));
  MOCK_METHOD(bool, validateBlock, (const Block &block), (override));
  MOCK_METHOD(void, onBlockCommitted, (const Block &block), (override));
};

// Exposes the committed chain so integrity checks can be exercised
class TamperableLedger : public Ledger {
public:
  using Ledger::Ledger;
  std::vector<Block> &blocks() { return chain_; }
};

Transaction makeTx(const std::string &id, const std::string &from,
                   const std::string &to, double amount, double fee = 0) {
  Transaction tx;
  tx.id = id;
  tx.from = from;
  tx.to = to;
  tx.amount = amount;
  tx.fee = fee;
  tx.timestamp = utl::getCurrentTimeMillis();
  tx.signature = std::string(Transaction::SIGNATURE_LENGTH, 'a');
  return tx;
}

} // namespace

class LedgerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ON_CALL(validator_, isProofOfWorkRequired()).WillByDefault(Return(true));
    ON_CALL(validator_, canProduceBlock(_)).WillByDefault(Return(true));
    ON_CALL(validator_, validateBlock(_)).WillByDefault(Return(true));

    config_.difficulty = 1;
    config_.miningReward = 10;
    config_.adjustDifficulty = false;
  }

  NiceMock<MockBlockValidator> validator_;
  Ledger::Config config_;
};

TEST_F(LedgerTest, StartsWithGenesisBlock) {
  Ledger ledger(config_, validator_);

  ASSERT_EQ(ledger.getChainLength(), 1u);
  Block genesis = ledger.getLatestBlock();
  EXPECT_EQ(genesis.index, 0u);
  EXPECT_EQ(genesis.previousHash, Ledger::GENESIS_PREVIOUS_HASH);
  EXPECT_EQ(genesis.miner, Ledger::GENESIS_MINER);
  EXPECT_TRUE(genesis.transactions.empty());
  EXPECT_DOUBLE_EQ(genesis.reward, 0);
  EXPECT_EQ(genesis.hash, Ledger::calculateHash(genesis));
  EXPECT_TRUE(ledger.validateChain());
}

TEST_F(LedgerTest, MinedTransferCreditsRecipientAndMiner) {
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 10)).isOk());

  auto block = ledger.mineBlock("M1");
  ASSERT_TRUE(block.isOk()) << block.error().message;

  EXPECT_EQ(ledger.getChainLength(), 2u);
  EXPECT_EQ(block->index, 1u);
  EXPECT_EQ(block->miner, "M1");
  EXPECT_DOUBLE_EQ(ledger.getAccountBalance("B"), 10);
  EXPECT_DOUBLE_EQ(ledger.getAccountBalance("A"), -10);
  EXPECT_DOUBLE_EQ(ledger.getAccountBalance("M1"), config_.miningReward);
  EXPECT_TRUE(ledger.getPendingTransactions().empty());
}

TEST_F(LedgerTest, SenderPaysFeeAndFeeIsBurned) {
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 5, 0.5)).isOk());
  ASSERT_TRUE(ledger.mineBlock("M").isOk());

  EXPECT_DOUBLE_EQ(ledger.getAccountBalance("A"), -5.5);
  EXPECT_DOUBLE_EQ(ledger.getAccountBalance("B"), 5);
  EXPECT_DOUBLE_EQ(ledger.getAccountBalance("M"), 10);
}

TEST_F(LedgerTest, MineWithEmptyPoolLeavesChainUntouched) {
  Ledger ledger(config_, validator_);
  EXPECT_CALL(validator_, validateBlock(_)).Times(0);

  auto block = ledger.mineBlock("M1");
  ASSERT_TRUE(block.isError());
  EXPECT_EQ(block.error().code, Ledger::E_NO_PENDING);
  EXPECT_EQ(ledger.getChainLength(), 1u);
}

TEST_F(LedgerTest, RejectsMalformedTransactions) {
  Ledger ledger(config_, validator_);

  auto zeroAmount = ledger.addTransaction(makeTx("tx1", "A", "B", 0));
  ASSERT_TRUE(zeroAmount.isError());
  EXPECT_EQ(zeroAmount.error().code, Ledger::E_TX_INVALID);

  auto badSignature = makeTx("tx2", "A", "B", 1);
  badSignature.signature = "not-a-signature";
  EXPECT_TRUE(ledger.addTransaction(badSignature).isError());

  EXPECT_TRUE(ledger.addTransaction(makeTx("tx3", "", "B", 1)).isError());
  EXPECT_TRUE(ledger.getPendingTransactions().empty());
}

TEST_F(LedgerTest, RejectsDuplicateIdsPendingOrCommitted) {
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("dup", "A", "B", 1)).isOk());

  auto pendingDup = ledger.addTransaction(makeTx("dup", "A", "C", 2));
  ASSERT_TRUE(pendingDup.isError());
  EXPECT_EQ(pendingDup.error().code, Ledger::E_TX_DUPLICATE);

  ASSERT_TRUE(ledger.mineBlock("M").isOk());
  auto committedDup = ledger.addTransaction(makeTx("dup", "A", "B", 1));
  ASSERT_TRUE(committedDup.isError());
  EXPECT_EQ(committedDup.error().code, Ledger::E_TX_DUPLICATE);
}

TEST_F(LedgerTest, ConsensusRejectionRestoresPendingTransactions) {
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 1)).isOk());
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx2", "A", "C", 2)).isOk());

  EXPECT_CALL(validator_, validateBlock(_))
      .WillOnce(Return(false))
      .WillOnce(Return(true));
  EXPECT_CALL(validator_, onBlockCommitted(Field(&Block::index, 1u))).Times(1);

  auto rejected = ledger.mineBlock("M");
  ASSERT_TRUE(rejected.isError());
  EXPECT_EQ(rejected.error().code, Ledger::E_CONSENSUS_REJECT);
  EXPECT_EQ(ledger.getChainLength(), 1u);

  auto pending = ledger.getPendingTransactions();
  ASSERT_EQ(pending.size(), 2u);
  EXPECT_EQ(pending[0].id, "tx1");
  EXPECT_EQ(pending[1].id, "tx2");

  auto accepted = ledger.mineBlock("M");
  ASSERT_TRUE(accepted.isOk());
  EXPECT_EQ(accepted->transactions.size(), 2u);
  EXPECT_TRUE(ledger.getPendingTransactions().empty());
}

TEST_F(LedgerTest, ProofOfWorkProducesLeadingZeros) {
  config_.difficulty = 2;
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 1)).isOk());

  auto block = ledger.mineBlock("M");
  ASSERT_TRUE(block.isOk());
  EXPECT_EQ(block->difficulty, 2u);
  EXPECT_EQ(block->hash.substr(0, 2), "00");
  EXPECT_EQ(block->hash, Ledger::calculateHash(*block));
}

TEST_F(LedgerTest, StakeOnlyBlocksSkipNonceSearch) {
  ON_CALL(validator_, isProofOfWorkRequired()).WillByDefault(Return(false));
  config_.difficulty = 64;
  config_.maxMiningMillis = 10;
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 1)).isOk());

  auto block = ledger.mineBlock("V");
  ASSERT_TRUE(block.isOk());
  EXPECT_EQ(block->difficulty, 0u);
  EXPECT_EQ(block->nonce, 0u);
  EXPECT_TRUE(ledger.validateChain());
}

TEST_F(LedgerTest, NonceSearchTimesOutAndRestoresPool) {
  config_.difficulty = 64;
  config_.maxMiningMillis = 20;
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 1)).isOk());

  auto block = ledger.mineBlock("M");
  ASSERT_TRUE(block.isError());
  EXPECT_EQ(block.error().code, Ledger::E_MINING_TIMEOUT);
  EXPECT_EQ(ledger.getChainLength(), 1u);
  EXPECT_EQ(ledger.getPendingTransactions().size(), 1u);
  EXPECT_EQ(ledger.getDifficulty(), 64u);
}

TEST_F(LedgerTest, NonceSearchTimeoutLowersDifficulty) {
  config_.difficulty = 64;
  config_.maxMiningMillis = 20;
  config_.adjustDifficulty = true;
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 1)).isOk());

  ASSERT_EQ(ledger.mineBlock("M").error().code, Ledger::E_MINING_TIMEOUT);
  EXPECT_EQ(ledger.getDifficulty(), 63u);
  ASSERT_EQ(ledger.mineBlock("M").error().code, Ledger::E_MINING_TIMEOUT);
  EXPECT_EQ(ledger.getDifficulty(), 62u);
}

TEST_F(LedgerTest, IneligibleMinerSkipsNonceSearch) {
  config_.difficulty = 64;
  config_.maxMiningMillis = 60000;
  EXPECT_CALL(validator_, canProduceBlock(std::string("outsider")))
      .WillOnce(Return(false));
  EXPECT_CALL(validator_, validateBlock(_)).Times(0);
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 1)).isOk());

  auto started = std::chrono::steady_clock::now();
  auto block = ledger.mineBlock("outsider");
  ASSERT_TRUE(block.isError());
  EXPECT_EQ(block.error().code, Ledger::E_CONSENSUS_REJECT);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
  EXPECT_EQ(ledger.getPendingTransactions().size(), 1u);
}

TEST_F(LedgerTest, BlocksLinkToPredecessor) {
  Ledger ledger(config_, validator_);
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(
        ledger.addTransaction(makeTx("tx" + std::to_string(i), "A", "B", 1))
            .isOk());
    ASSERT_TRUE(ledger.mineBlock("M").isOk());
  }

  auto chain = ledger.getChain();
  ASSERT_EQ(chain.size(), 4u);
  for (size_t i = 1; i < chain.size(); ++i) {
    EXPECT_EQ(chain[i].previousHash, chain[i - 1].hash);
    EXPECT_EQ(chain[i].hash, Ledger::calculateHash(chain[i]));
  }
  EXPECT_TRUE(ledger.validateChain());
}

TEST_F(LedgerTest, TamperedAmountBreaksChainValidation) {
  TamperableLedger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 10)).isOk());
  ASSERT_TRUE(ledger.mineBlock("M").isOk());
  ASSERT_TRUE(ledger.validateChain());

  ledger.blocks()[1].transactions[0].amount = 1000;
  EXPECT_FALSE(ledger.validateChain());
}

TEST_F(LedgerTest, BrokenLinkBreaksChainValidation) {
  TamperableLedger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 10)).isOk());
  ASSERT_TRUE(ledger.mineBlock("M").isOk());

  Block &block = ledger.blocks()[1];
  block.previousHash = std::string(64, '0');
  block.hash = block.calculateHash();
  EXPECT_FALSE(ledger.validateChain());
}

TEST_F(LedgerTest, CreateTransactionSignsAndChargesFee) {
  Ledger ledger(config_, validator_);

  Transaction tx = ledger.createTransaction("A", "B", 50, "secret");
  EXPECT_EQ(tx.id.rfind("tx_", 0), 0u);
  EXPECT_EQ(tx.id.size(), 3 + std::to_string(tx.timestamp).size() + 1 + 9);
  EXPECT_DOUBLE_EQ(tx.fee, 0.05);
  EXPECT_EQ(tx.nonce, 0u);
  EXPECT_EQ(tx.signature, utl::hmacSha256("secret", tx.signingPayload()));
  EXPECT_TRUE(tx.validate().isOk());

  // Creating does not enqueue
  EXPECT_TRUE(ledger.getPendingTransactions().empty());

  ASSERT_TRUE(ledger.addTransaction(tx).isOk());
  ASSERT_TRUE(ledger.mineBlock("M").isOk());
  EXPECT_EQ(ledger.createTransaction("A", "C", 1, "secret").nonce, 1u);
}

TEST_F(LedgerTest, FeeHasFloor) {
  EXPECT_DOUBLE_EQ(Ledger::calculateFee(0.5), 0.001);
  EXPECT_DOUBLE_EQ(Ledger::calculateFee(100), 0.1);
}

TEST_F(LedgerTest, RecentBlocksAreMostRecentInOrder) {
  Ledger ledger(config_, validator_);
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(
        ledger.addTransaction(makeTx("tx" + std::to_string(i), "A", "B", 1))
            .isOk());
    ASSERT_TRUE(ledger.mineBlock("M").isOk());
  }

  auto recent = ledger.getRecentBlocks(2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].index, 2u);
  EXPECT_EQ(recent[1].index, 3u);
  EXPECT_EQ(ledger.getRecentBlocks(100).size(), 4u);
  EXPECT_TRUE(ledger.getRecentBlocks(0).empty());
}

TEST_F(LedgerTest, NetworkStatsSummarizeChain) {
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 1)).isOk());
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx2", "A", "B", 1)).isOk());
  ASSERT_TRUE(ledger.mineBlock("M").isOk());
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx3", "A", "B", 1)).isOk());

  auto stats = ledger.getNetworkStats();
  EXPECT_EQ(stats.blockHeight, 1u);
  EXPECT_EQ(stats.totalTransactions, 2u);
  EXPECT_EQ(stats.pendingTransactions, 1u);
  EXPECT_EQ(stats.difficulty, 1u);
  EXPECT_GE(stats.averageBlockTime, 0);
  EXPECT_NE(stats.networkHashRate.find("H/s"), std::string::npos);

  auto j = stats.toJson();
  EXPECT_EQ(j["blockHeight"], 1);
}

TEST_F(LedgerTest, FastBlocksRaiseDifficulty) {
  config_.adjustDifficulty = true;
  config_.targetBlockTimeMillis = 3600000;
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 1)).isOk());
  ASSERT_TRUE(ledger.mineBlock("M").isOk());

  EXPECT_EQ(ledger.getDifficulty(), 2u);
}

TEST_F(LedgerTest, SlowProductionDoesNotRaiseDifficulty) {
  config_.adjustDifficulty = true;
  config_.targetBlockTimeMillis = 3600000;
  config_.maxMiningMillis = 100;
  ON_CALL(validator_, validateBlock(_)).WillByDefault(Invoke([](const Block &) {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    return true;
  }));
  Ledger ledger(config_, validator_);
  ASSERT_TRUE(ledger.addTransaction(makeTx("tx1", "A", "B", 1)).isOk());
  ASSERT_TRUE(ledger.mineBlock("M").isOk());

  EXPECT_EQ(ledger.getDifficulty(), 1u);
}

TEST_F(LedgerTest, SlowBlocksLowerDifficultyDownToOne) {
  config_.adjustDifficulty = true;
  config_.difficulty = 3;
  config_.targetBlockTimeMillis = 1;
  Ledger ledger(config_, validator_);

  for (uint32_t expected : { 2u, 1u, 1u }) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ASSERT_TRUE(ledger.addTransaction(
                          makeTx("tx" + std::to_string(ledger.getChainLength()),
                                 "A", "B", 1))
                    .isOk());
    ASSERT_TRUE(ledger.mineBlock("M").isOk());
    EXPECT_EQ(ledger.getDifficulty(), expected);
  }
}

TEST_F(LedgerTest, HashRateUsesLargestFittingUnit) {
  config_.targetBlockTimeMillis = 1000;
  auto hashRateAt = [this](uint32_t difficulty) {
    config_.difficulty = difficulty;
    Ledger ledger(config_, validator_);
    return ledger.getNetworkStats().networkHashRate;
  };

  EXPECT_EQ(hashRateAt(12), "4.10 KH/s");
  EXPECT_EQ(hashRateAt(20), "1.05 MH/s");
  EXPECT_EQ(hashRateAt(30), "1.07 GH/s");
  EXPECT_EQ(hashRateAt(40), "1.10 TH/s");
}

TEST_F(LedgerTest, ConcurrentMinersNeverSpendTheSameTransaction) {
  Ledger ledger(config_, validator_);
  const int txCount = 40;

  std::atomic<bool> done{ false };
  auto miner = [&ledger, &done](const std::string &address) {
    while (!done) {
      auto result = ledger.mineBlock(address);
      (void)result;
    }
    // Drain whatever was left
    while (ledger.mineBlock(address).isOk()) {
    }
  };

  std::thread minerA(miner, "MA");
  std::thread minerB(miner, "MB");
  for (int i = 0; i < txCount; ++i) {
    EXPECT_TRUE(
        ledger.addTransaction(makeTx("tx" + std::to_string(i), "A", "B", 1))
            .isOk());
  }
  done = true;
  minerA.join();
  minerB.join();

  std::set<std::string> seen;
  size_t committed = 0;
  for (const auto &block : ledger.getChain()) {
    for (const auto &tx : block.transactions) {
      seen.insert(tx.id);
      ++committed;
    }
  }
  EXPECT_EQ(committed, static_cast<size_t>(txCount));
  EXPECT_EQ(seen.size(), static_cast<size_t>(txCount));
  EXPECT_TRUE(ledger.getPendingTransactions().empty());
  EXPECT_TRUE(ledger.validateChain());
}
