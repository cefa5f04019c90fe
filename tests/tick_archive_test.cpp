// =============================================================================
// tick_archive_test.cpp
// =============================================================================
// Unit tests for breakout::TickArchive against a real file in the test
// temporary directory.
//
// Validates:
//   - Buffered appends reach the file once the buffer fills, or on flush()
//   - query() sees both the file and the unflushed buffer, filtered by time
//     and instrument id
//   - prune() drops ticks older than the cutoff from file and buffer
//   - Unparseable lines are skipped
//   - An unwritable path counts failures and keeps the ticks buffered, up to
//     a bounded buffer
// =============================================================================

#include "breakout/persistence/tick_archive.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

breakout::domain::Tick makeTick(const std::string& id, double ltp,
                                std::int64_t ts) {
  breakout::domain::Tick t;
  t.instrument_id = id;
  t.ltp = ltp;
  t.exchange_ts_ms = ts;
  return t;
}

std::size_t lineCount(const std::string& path) {
  std::ifstream in(path);
  std::size_t n = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++n;
  }
  return n;
}

}  // namespace

class TickArchiveTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path = (fs::path(::testing::TempDir()) /
            (std::string("tick_archive_") + info->name() + ".jsonl"))
               .string();
    fs::remove(path);
    fs::remove(path + ".tmp");
  }

  void TearDown() override {
    fs::remove(path);
    fs::remove(path + ".tmp");
  }

  std::string path;
};

TEST_F(TickArchiveTest, FlushesWhenBufferFills) {
  breakout::TickArchive archive(path, 2);

  archive.append(makeTick("NSE_FO|A", 10.0, 1'000));
  EXPECT_FALSE(fs::exists(path));

  archive.append(makeTick("NSE_FO|A", 11.0, 2'000));
  EXPECT_EQ(lineCount(path), 2u);

  archive.append(makeTick("NSE_FO|A", 12.0, 3'000));
  EXPECT_EQ(lineCount(path), 2u);
  EXPECT_TRUE(archive.flush());
  EXPECT_EQ(lineCount(path), 3u);
  EXPECT_EQ(archive.appended(), 3u);
  EXPECT_EQ(archive.writeFailures(), 0u);
}

// -----------------------------------------------------------------------------
// Two ticks on disk, one still buffered: query() sees all three.
// -----------------------------------------------------------------------------
TEST_F(TickArchiveTest, QueryCoversFileAndBuffer) {
  breakout::TickArchive archive(path, 2);
  archive.append(makeTick("NSE_FO|A", 10.0, 1'000));
  archive.append(makeTick("NSE_FO|B", 20.0, 2'000));
  archive.append(makeTick("NSE_FO|A", 9.5, 3'000));

  auto all = archive.query(0, 10'000, {});
  ASSERT_EQ(all.size(), 3u);
  EXPECT_DOUBLE_EQ(all[0].ltp, 10.0);
  EXPECT_DOUBLE_EQ(all[2].ltp, 9.5);

  auto only_a = archive.query(0, 10'000, {"NSE_FO|A"});
  ASSERT_EQ(only_a.size(), 2u);
  EXPECT_EQ(only_a[0].instrument_id, "NSE_FO|A");
  EXPECT_EQ(only_a[1].exchange_ts_ms, 3'000);

  // Bounds are inclusive.
  auto ranged = archive.query(2'000, 3'000, {});
  ASSERT_EQ(ranged.size(), 2u);
  EXPECT_EQ(ranged[0].instrument_id, "NSE_FO|B");
}

TEST_F(TickArchiveTest, ReadsTicksWrittenByEarlierInstance) {
  {
    breakout::TickArchive first(path, 100);
    first.append(makeTick("NSE_FO|A", 10.0, 1'000));
    first.append(makeTick("NSE_FO|A", 8.0, 2'000));
  }  // Destructor flushes.

  breakout::TickArchive second(path, 100);
  auto ticks = second.query(0, 5'000, {});
  ASSERT_EQ(ticks.size(), 2u);
  EXPECT_DOUBLE_EQ(ticks[1].ltp, 8.0);
}

TEST_F(TickArchiveTest, PruneRemovesOldTicks) {
  breakout::TickArchive archive(path, 2);
  archive.append(makeTick("NSE_FO|A", 10.0, 1'000));
  archive.append(makeTick("NSE_FO|A", 11.0, 2'000));  // Flushed with the first
  archive.append(makeTick("NSE_FO|A", 12.0, 2'500));  // Buffered
  archive.append(makeTick("NSE_FO|A", 13.0, 5'000));  // Flushed with 2'500

  archive.append(makeTick("NSE_FO|A", 1.0, 500));  // Buffered, stale

  EXPECT_EQ(archive.prune(2'500), 3u);

  auto left = archive.query(0, 10'000, {});
  ASSERT_EQ(left.size(), 2u);
  EXPECT_EQ(left[0].exchange_ts_ms, 2'500);
  EXPECT_EQ(left[1].exchange_ts_ms, 5'000);
  EXPECT_EQ(lineCount(path), 2u);
  EXPECT_FALSE(fs::exists(path + ".tmp"));
}

TEST_F(TickArchiveTest, SkipsUnparseableLines) {
  {
    std::ofstream out(path);
    out << R"({"t":1000,"i":"NSE_FO|A","p":10.5})" << '\n'
        << "not json at all\n"
        << R"({"t":2000,"i":"NSE_FO|A"})" << '\n'
        << R"({"t":3000,"i":"NSE_FO|A","p":9.0)";  // Torn last line
  }

  breakout::TickArchive archive(path, 10);
  auto ticks = archive.query(0, 10'000, {});
  ASSERT_EQ(ticks.size(), 1u);
  EXPECT_DOUBLE_EQ(ticks[0].ltp, 10.5);
}

TEST(TickArchiveFailureTest, UnwritablePathKeepsTicksBuffered) {
  breakout::TickArchive archive("/nonexistent-breakout-dir/ticks.jsonl", 1);

  archive.append(makeTick("NSE_FO|A", 10.0, 1'000));
  EXPECT_EQ(archive.writeFailures(), 1u);
  EXPECT_FALSE(archive.flush());
  EXPECT_EQ(archive.writeFailures(), 2u);

  auto ticks = archive.query(0, 10'000, {});
  ASSERT_EQ(ticks.size(), 1u);
  EXPECT_DOUBLE_EQ(ticks[0].ltp, 10.0);
}

// -----------------------------------------------------------------------------
// A file that stays unwritable bounds the buffer at 10 x buffer_size: the
// oldest ticks go and are counted, the newest remain queryable.
// -----------------------------------------------------------------------------
TEST(TickArchiveFailureTest, UnwritablePathBoundsTheBuffer) {
  breakout::TickArchive archive("/nonexistent-breakout-dir/ticks.jsonl", 2);

  for (int i = 0; i < 100; ++i) {
    archive.append(makeTick("NSE_FO|A", 100.0 - i, 1'000 + i));
  }

  EXPECT_EQ(archive.appended(), 100u);
  EXPECT_EQ(archive.buffered(), 20u);
  EXPECT_EQ(archive.droppedTicks(), 80u);
  EXPECT_EQ(archive.writeFailures(), 50u);

  auto ticks = archive.query(0, 10'000, {});
  ASSERT_EQ(ticks.size(), 20u);
  EXPECT_EQ(ticks.front().exchange_ts_ms, 1'080);
  EXPECT_EQ(ticks.back().exchange_ts_ms, 1'099);
}
