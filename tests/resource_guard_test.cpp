#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <future>
#include <thread>

#include "core/storage/ResourceGuard.hpp"
#include "core/storage/ScratchStore.hpp"
#include "core/util/ShutdownSignal.hpp"
#include "test_helpers.hpp"

using namespace frl;
using namespace std::chrono_literals;
using frl::test::TempDir;
using frl::test::writeFile;

TEST(ResourceGuard, UnboundedNeverWaits) {
  TempDir dir;
  writeFile(dir.file("big.mp4"), 100000);
  ShutdownSignal shutdown;
  ResourceGuard guard(dir.path(), std::nullopt, shutdown, 10ms);
  EXPECT_TRUE(guard.awaitCapacity());
}

TEST(ResourceGuard, UnderBudgetPassesImmediately) {
  TempDir dir;
  writeFile(dir.file("a.mp4"), 1000);
  ShutdownSignal shutdown;
  ResourceGuard guard(dir.path(), 5000, shutdown, 10ms);
  EXPECT_TRUE(guard.hasCapacity());
  EXPECT_TRUE(guard.awaitCapacity());
}

TEST(ResourceGuard, WaitsUntilScratchDrains) {
  TempDir dir;
  writeFile(dir.file("a.mp4"), 3000);
  writeFile(dir.file("b.mp4"), 3000);
  ShutdownSignal shutdown;
  ResourceGuard guard(dir.path(), 5000, shutdown, 10ms);
  EXPECT_FALSE(guard.hasCapacity());

  auto waiter = std::async(std::launch::async, [&] { return guard.awaitCapacity(); });
  EXPECT_EQ(waiter.wait_for(100ms), std::future_status::timeout);

  std::filesystem::remove(dir.file("a.mp4"));
  ASSERT_EQ(waiter.wait_for(5s), std::future_status::ready);
  EXPECT_TRUE(waiter.get());
}

TEST(ResourceGuard, ShutdownReleasesWaiter) {
  TempDir dir;
  writeFile(dir.file("a.mp4"), 6000);
  ShutdownSignal shutdown;
  ResourceGuard guard(dir.path(), 5000, shutdown, 10s);

  auto waiter = std::async(std::launch::async, [&] { return guard.awaitCapacity(); });
  std::this_thread::sleep_for(50ms);
  shutdown.request();
  ASSERT_EQ(waiter.wait_for(5s), std::future_status::ready);
  EXPECT_FALSE(waiter.get());
}

TEST(ResourceGuard, DirectorySizeCountsNestedFiles) {
  TempDir dir;
  writeFile(dir.file("a.mp4"), 100);
  writeFile(dir.file("nested/b.mp4"), 250);
  EXPECT_EQ(ScratchStore::directorySize(dir.path()), 350u);
  EXPECT_EQ(ScratchStore::directorySize(dir.file("missing")), 0u);
}
