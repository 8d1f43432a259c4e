#include "BlockProducer.h"
#include "BlockScheduler.h"
#include "ConsensusEngine.h"
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace hl;

namespace {

Transaction makeTx(const std::string &id) {
  Transaction tx;
  tx.id = id;
  tx.from = "alice";
  tx.to = "bob";
  tx.amount = 2;
  tx.timestamp = utl::getCurrentTimeMillis();
  tx.signature = std::string(Transaction::SIGNATURE_LENGTH, 'c');
  return tx;
}

consensus::ConsensusEngine::Config makeEngineConfig() {
  consensus::ConsensusEngine::Config config;
  config.type = consensus::ConsensusType::POW;
  config.seed = 7;
  return config;
}

Ledger::Config makeLedgerConfig() {
  Ledger::Config config;
  config.difficulty = 1;
  config.adjustDifficulty = false;
  return config;
}

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

} // namespace

class BlockProducerTest : public ::testing::Test {
protected:
  consensus::ConsensusEngine engine_{ makeEngineConfig() };
  Ledger ledger_{ makeLedgerConfig(), engine_ };
};

TEST_F(BlockProducerTest, ProduceNowRecordsMinerStats) {
  BlockProducer producer(ledger_);
  ASSERT_TRUE(ledger_.addTransaction(makeTx("tx1")).isOk());

  auto block = producer.produceNow("M");
  ASSERT_TRUE(block.isOk()) << block.error().message;

  auto stats = producer.getMinerStats();
  ASSERT_EQ(stats.count("M"), 1u);
  EXPECT_EQ(stats["M"].attempts, 1u);
  EXPECT_EQ(stats["M"].blocksProduced, 1u);
  EXPECT_EQ(stats["M"].failedAttempts, 0u);
  EXPECT_DOUBLE_EQ(stats["M"].rewardsEarned, block->reward);
}

TEST_F(BlockProducerTest, EmptyPoolIsNotCountedAsAttempt) {
  BlockProducer producer(ledger_);

  auto block = producer.produceNow("M");
  ASSERT_TRUE(block.isError());
  EXPECT_EQ(block.error().code, Ledger::E_NO_PENDING);
  EXPECT_TRUE(producer.getMinerStats().empty());
}

TEST_F(BlockProducerTest, RejectedBlockCountsAsFailure) {
  consensus::ConsensusEngine::Config config = makeEngineConfig();
  config.type = consensus::ConsensusType::POS;
  consensus::ConsensusEngine stakeEngine(config);
  Ledger stakeLedger(makeLedgerConfig(), stakeEngine);
  BlockProducer producer(stakeLedger);

  ASSERT_TRUE(stakeLedger.addTransaction(makeTx("tx1")).isOk());
  auto block = producer.produceNow("not-a-validator");
  ASSERT_TRUE(block.isError());
  EXPECT_EQ(block.error().code, Ledger::E_CONSENSUS_REJECT);

  auto stats = producer.getMinerStats();
  EXPECT_EQ(stats["not-a-validator"].attempts, 1u);
  EXPECT_EQ(stats["not-a-validator"].failedAttempts, 1u);
  EXPECT_EQ(stakeLedger.getPendingTransactions().size(), 1u);
}

TEST_F(BlockProducerTest, WorkerConsumesQueuedRequests) {
  BlockProducer producer(ledger_);
  ASSERT_TRUE(producer.start().isOk());

  ASSERT_TRUE(ledger_.addTransaction(makeTx("tx1")).isOk());
  producer.requestBlock("worker-miner");

  EXPECT_TRUE(waitFor([this] { return ledger_.getChainLength() == 2; },
                      std::chrono::seconds(5)));
  producer.stop();

  EXPECT_EQ(ledger_.getLatestBlock().miner, "worker-miner");
  EXPECT_EQ(producer.getQueueSize(), 0u);
}

TEST_F(BlockProducerTest, SchedulerEmitsEventsAtInterval) {
  BlockProducer producer(ledger_);
  BlockScheduler::Config config;
  config.intervalMillis = 30;
  config.minerAddress = "scheduled";
  BlockScheduler scheduler(config, producer);

  ASSERT_TRUE(producer.start().isOk());
  ASSERT_TRUE(scheduler.start().isOk());
  ASSERT_TRUE(ledger_.addTransaction(makeTx("tx1")).isOk());

  EXPECT_TRUE(waitFor([this] { return ledger_.getChainLength() == 2; },
                      std::chrono::seconds(5)));
  EXPECT_TRUE(waitFor([&scheduler] { return scheduler.getEmittedCount() >= 2; },
                      std::chrono::seconds(5)));

  scheduler.stop();
  producer.stop();
  EXPECT_EQ(ledger_.getLatestBlock().miner, "scheduled");
}

TEST_F(BlockProducerTest, SchedulerRefusesToStartWithoutInterval) {
  BlockProducer producer(ledger_);
  BlockScheduler scheduler(BlockScheduler::Config{}, producer);

  auto result = scheduler.start();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Service::E_ON_START);
  EXPECT_FALSE(scheduler.isRunning());
}
