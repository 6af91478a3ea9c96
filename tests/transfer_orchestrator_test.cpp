#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>

#include "core/ledger/ProgressLedger.hpp"
#include "core/storage/ResourceGuard.hpp"
#include "core/storage/ScratchStore.hpp"
#include "core/upload/TransferOrchestrator.hpp"
#include "core/upload/UploadQueue.hpp"
#include "core/util/ShutdownSignal.hpp"
#include "test_helpers.hpp"

using namespace frl;
using namespace std::chrono_literals;
using frl::test::FakeExtractor;
using frl::test::FakeProber;
using frl::test::FakeTransport;
using frl::test::TempDir;
using frl::test::bytesPerSecond;
using frl::test::execOnLedgerDb;
using frl::test::makeLedger;
using frl::test::writeFile;

namespace {

class TransferOrchestratorTest : public ::testing::Test {
protected:
  TempDir dir;
  ScratchStore scratch{dir.file("videos"), dir.file("tmp")};
  std::unique_ptr<ProgressLedger> ledger = makeLedger(dir);
  ShutdownSignal shutdown;
  FakeProber prober;
  FakeTransport transport;
  FakeExtractor extractor{bytesPerSecond(10)};
  std::unique_ptr<UploadQueue> queue;
  std::unique_ptr<ResourceGuard> guard;

  const std::string video = dir.file("videos/2024-05-01--12-30-00-ecamera.mp4");

  void SetUp() override {
    scratch.ensureDirs();
    writeFile(video, 1024);
    MediaInfo info;
    info.byteSize = 1024;
    info.durationSeconds = 3700;
    info.width = 1928;
    info.height = 1208;
    prober.set(video, info);

    UploadQueueOptions qo;
    qo.idleInterval = 10ms;
    queue = std::make_unique<UploadQueue>(transport, *ledger, qo);
    queue->start();
    guard = std::make_unique<ResourceGuard>(scratch.tmpRoot(), std::nullopt, shutdown, 10ms);
  }

  void TearDown() override { queue->shutdown(); }

  TransferOrchestrator orchestrator(OrchestratorOptions o = {}) {
    o.capBytes = 1ull << 30;
    o.ledgerRetryDelay = 1ms;
    return TransferOrchestrator(prober, extractor, *ledger, *queue, *guard, scratch, o);
  }
};

} // namespace

TEST_F(TransferOrchestratorTest, UploadsEveryChunkInOrder) {
  auto orch = orchestrator();
  EXPECT_EQ(orch.transfer(video), TransferOutcome::Completed);

  auto sent = transport.sent();
  ASSERT_EQ(sent.size(), 3u);
  EXPECT_EQ(sent[0].durationSeconds, 1800);
  EXPECT_EQ(sent[2].durationSeconds, 100);
  EXPECT_EQ(sent[0].width, 1928);
  EXPECT_EQ(sent[0].fileName, "2024-05-01--12-30-00-ecamera.mp4");
  EXPECT_TRUE(sent[0].supportsStreaming);
  EXPECT_NE(sent[1].caption.find("0:30:00 - 1:00:00"), std::string::npos);

  EXPECT_DOUBLE_EQ(ledger->read("2024-05-01", "ecamera"), 3700);
  EXPECT_TRUE(ledger->isProcessed("2024-05-01", "ecamera"));
  EXPECT_TRUE(std::filesystem::exists(video));
  EXPECT_TRUE(std::filesystem::is_empty(scratch.tmpRoot()));
}

TEST_F(TransferOrchestratorTest, ResumesFromLedgerPosition) {
  ledger->advance("2024-05-01", "ecamera", 1800);
  auto orch = orchestrator();
  EXPECT_EQ(orch.transfer(video), TransferOutcome::Completed);

  auto calls = extractor.calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_DOUBLE_EQ(calls[0].first, 1800);
  EXPECT_DOUBLE_EQ(calls[1].second, 3700);
  EXPECT_EQ(transport.sent().size(), 2u);
}

TEST_F(TransferOrchestratorTest, AlreadyCoveredFileOnlyDoesHousekeeping) {
  ledger->advance("2024-05-01", "ecamera", 3700);
  OrchestratorOptions o;
  o.deleteSourceWhenDone = true;
  auto orch = orchestrator(o);

  EXPECT_EQ(orch.transfer(video), TransferOutcome::AlreadyComplete);
  EXPECT_TRUE(extractor.calls().empty());
  EXPECT_TRUE(transport.sent().empty());
  EXPECT_TRUE(ledger->isProcessed("2024-05-01", "ecamera"));
  EXPECT_FALSE(std::filesystem::exists(video));
}

TEST_F(TransferOrchestratorTest, DeletesSourceOnlyWhenConfigured) {
  OrchestratorOptions o;
  o.deleteSourceWhenDone = true;
  auto orch = orchestrator(o);
  EXPECT_EQ(orch.transfer(video), TransferOutcome::Completed);
  EXPECT_FALSE(std::filesystem::exists(video));
}

TEST_F(TransferOrchestratorTest, InvalidNameIsRejectedBeforeProbing) {
  const std::string odd = dir.file("videos/holiday.mp4");
  writeFile(odd, 10);
  auto orch = orchestrator();
  EXPECT_EQ(orch.transfer(odd), TransferOutcome::InvalidName);
  EXPECT_TRUE(extractor.calls().empty());
}

TEST_F(TransferOrchestratorTest, ProbeFailureLeavesLedgerUntouched) {
  const std::string broken = dir.file("videos/r2--0-dcamera.mp4");
  writeFile(broken, 10);
  auto orch = orchestrator();
  EXPECT_EQ(orch.transfer(broken), TransferOutcome::ProbeFailed);
  EXPECT_FALSE(ledger->get("r2", "dcamera"));
}

TEST_F(TransferOrchestratorTest, IrreducibleRangeFailsTheFile) {
  OrchestratorOptions o;
  o.capBytes = 100;
  o.ledgerRetryDelay = 1ms;
  TransferOrchestrator orch(prober, extractor, *ledger, *queue, *guard, scratch, o);
  EXPECT_EQ(orch.transfer(video), TransferOutcome::Failed);
  EXPECT_TRUE(transport.sent().empty());
  EXPECT_DOUBLE_EQ(ledger->read("2024-05-01", "ecamera"), 0);
  EXPECT_FALSE(ledger->isProcessed("2024-05-01", "ecamera"));
}

TEST_F(TransferOrchestratorTest, DeliveryFailureStopsAtLastConfirmedRange) {
  transport.failFor(scratch.chunkPath("2024-05-01", "ecamera", 1800));
  auto orch = orchestrator();
  EXPECT_EQ(orch.transfer(video), TransferOutcome::Failed);

  EXPECT_EQ(transport.sent().size(), 1u);
  EXPECT_DOUBLE_EQ(ledger->read("2024-05-01", "ecamera"), 1800);
  EXPECT_FALSE(ledger->isProcessed("2024-05-01", "ecamera"));
  EXPECT_TRUE(std::filesystem::is_empty(scratch.tmpRoot()));
}

TEST_F(TransferOrchestratorTest, ShutdownWhileWaitingForScratchIsAnInterruption) {
  writeFile(scratch.chunkPath("other", "ecamera", 0), 5000);
  guard = std::make_unique<ResourceGuard>(scratch.tmpRoot(), 1000, shutdown, 10ms);
  shutdown.request();

  auto orch = orchestrator();
  EXPECT_EQ(orch.transfer(video), TransferOutcome::Interrupted);
  EXPECT_TRUE(extractor.calls().empty());
}

TEST_F(TransferOrchestratorTest, ShrunkLastRangeStillDeliversTheTail) {
  FakeExtractor tailHeavy([](double start, double end) -> std::uint64_t {
    return (start == 0 && end > 3599) ? 100 : 1;
  });
  MediaInfo info;
  info.durationSeconds = 3600;
  prober.set(video, info);

  OrchestratorOptions o;
  o.capBytes = 50;
  o.planner.windowSeconds = 3600;
  o.planner.shrinkSeconds = 1;
  TransferOrchestrator orch(prober, tailHeavy, *ledger, *queue, *guard, scratch, o);

  EXPECT_EQ(orch.transfer(video), TransferOutcome::Completed);
  EXPECT_EQ(transport.sent().size(), 2u);
  EXPECT_DOUBLE_EQ(ledger->read("2024-05-01", "ecamera"), 3600);
  EXPECT_TRUE(ledger->isProcessed("2024-05-01", "ecamera"));
}

TEST_F(TransferOrchestratorTest, UnreadableLedgerRestartsFromZero) {
  ledger->advance("2024-05-01", "ecamera", 1800);
  execOnLedgerDb(dir, "DROP TABLE route_cameras;");

  auto orch = orchestrator();
  // the first chunk goes out, then its ledger update fails
  EXPECT_EQ(orch.transfer(video), TransferOutcome::Failed);

  auto calls = extractor.calls();
  ASSERT_FALSE(calls.empty());
  EXPECT_DOUBLE_EQ(calls[0].first, 0);
  EXPECT_EQ(transport.sent().size(), 1u);
  EXPECT_TRUE(std::filesystem::is_empty(scratch.tmpRoot()));
}

TEST_F(TransferOrchestratorTest, FailedProcessedMarkLeavesFileForNextPass) {
  ledger->advance("2024-05-01", "ecamera", 3700);
  execOnLedgerDb(dir,
    "CREATE TRIGGER refuse_processed BEFORE UPDATE OF processed_at ON route_cameras "
    "WHEN NEW.processed_at IS NOT NULL BEGIN SELECT RAISE(ABORT, 'read-only'); END;");

  OrchestratorOptions o;
  o.deleteSourceWhenDone = true;
  auto orch = orchestrator(o);

  EXPECT_EQ(orch.transfer(video), TransferOutcome::AlreadyComplete);
  EXPECT_FALSE(ledger->isProcessed("2024-05-01", "ecamera"));
  EXPECT_TRUE(std::filesystem::exists(video));
}
