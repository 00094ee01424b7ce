#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <sstream>
#include <thread>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include "core/accounting/stats.hpp"

using namespace xferacct::core::accounting;
using xferacct::infra::Config;
using xferacct::infra::DataRateUnit;
using xferacct::infra::ErrorCode;
using xferacct::infra::make_error;
using namespace std::chrono_literals;

namespace {

auto contains(const std::string& haystack, const std::string& needle) -> bool {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

class StatsTest : public ::testing::Test {
protected:
    Config config{};
    StatsAggregator stats{config};
};

TEST_F(StatsTest, InitialValues)
{
    EXPECT_EQ(stats.get_bytes(), 0u);
    EXPECT_EQ(stats.get_errors(), 0u);
    EXPECT_EQ(stats.get_checks(), 0u);
    EXPECT_EQ(stats.get_transfers(), 0u);
    EXPECT_EQ(stats.get_deletes(), 0u);
    EXPECT_FALSE(stats.has_errored());
    EXPECT_FALSE(stats.get_last_error().has_value());
    EXPECT_TRUE(stats.checking().empty());
    EXPECT_TRUE(stats.transferring().empty());
}

TEST_F(StatsTest, AddBytesAccumulates)
{
    stats.add_bytes(1000);
    stats.add_bytes(24);
    stats.add_bytes(0);
    EXPECT_EQ(stats.get_bytes(), 1024u);
}

TEST_F(StatsTest, LastRecordedErrorWins)
{
    stats.record_error(make_error(ErrorCode::ReadFailed, "errX"));
    stats.record_error(make_error(ErrorCode::WriteFailed, "errY"));

    EXPECT_EQ(stats.get_errors(), 2u);
    EXPECT_TRUE(stats.has_errored());
    auto last = stats.get_last_error();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->code, ErrorCode::WriteFailed);
    EXPECT_EQ(last->message, "errY");
}

TEST_F(StatsTest, AddErrorsDoesNotTouchLastError)
{
    stats.add_errors(3);
    EXPECT_EQ(stats.get_errors(), 3u);
    EXPECT_FALSE(stats.get_last_error().has_value());
}

TEST_F(StatsTest, RecordsThroughErrorSink)
{
    ErrorSink& sink = stats;
    sink.record_error(make_error(ErrorCode::DeleteFailed, "gone"));
    EXPECT_EQ(stats.get_errors(), 1u);
    EXPECT_EQ(stats.get_last_error()->message, "gone");
}

TEST_F(StatsTest, AddDeletesReturnsRunningTotal)
{
    EXPECT_EQ(stats.add_deletes(1), 1u);
    EXPECT_EQ(stats.add_deletes(1), 2u);
    EXPECT_EQ(stats.add_deletes(5), 7u);
    EXPECT_EQ(stats.get_deletes(), 7u);
}

TEST_F(StatsTest, ResetCountersKeepsQueuesAndStartTime)
{
    const auto start = stats.start_time();
    stats.add_bytes(10);
    stats.add_errors(2);
    stats.finish_check("c");
    stats.finish_transfer("t", true);
    (void)stats.add_deletes(4);
    stats.set_check_queue(1, 2);
    stats.set_transfer_queue(3, 4);
    stats.set_rename_queue(5, 6);

    stats.reset_counters();

    EXPECT_EQ(stats.get_bytes(), 0u);
    EXPECT_EQ(stats.get_errors(), 0u);
    EXPECT_EQ(stats.get_checks(), 0u);
    EXPECT_EQ(stats.get_transfers(), 0u);
    EXPECT_EQ(stats.get_deletes(), 0u);

    auto queues = stats.get_queues();
    EXPECT_EQ(queues.check_count, 1u);
    EXPECT_EQ(queues.check_bytes, 2u);
    EXPECT_EQ(queues.transfer_count, 3u);
    EXPECT_EQ(queues.transfer_bytes, 4u);
    EXPECT_EQ(queues.rename_count, 5u);
    EXPECT_EQ(queues.rename_bytes, 6u);
    EXPECT_EQ(stats.start_time(), start);
}

TEST_F(StatsTest, ResetErrorsKeepsLastError)
{
    stats.record_error(make_error(ErrorCode::ReadFailed, "kept"));
    stats.add_bytes(5);
    stats.reset_errors();

    EXPECT_EQ(stats.get_errors(), 0u);
    EXPECT_FALSE(stats.has_errored());
    EXPECT_EQ(stats.get_bytes(), 5u);
    ASSERT_TRUE(stats.get_last_error().has_value());
    EXPECT_EQ(stats.get_last_error()->message, "kept");
}

TEST_F(StatsTest, CheckLifecycle)
{
    stats.start_check("dir/file");
    EXPECT_TRUE(stats.checking().contains("dir/file"));
    EXPECT_EQ(stats.get_checks(), 0u);

    stats.finish_check("dir/file");
    EXPECT_FALSE(stats.checking().contains("dir/file"));
    EXPECT_EQ(stats.get_checks(), 1u);
}

TEST_F(StatsTest, FinishCheckCountsEvenIfNeverStarted)
{
    stats.finish_check("unknown");
    EXPECT_EQ(stats.get_checks(), 1u);
    EXPECT_TRUE(stats.checking().empty());
}

TEST_F(StatsTest, FinishTransferCountsOnlySuccess)
{
    stats.start_transfer("a");
    stats.finish_transfer("a", false);
    EXPECT_EQ(stats.get_transfers(), 0u);
    EXPECT_TRUE(stats.transferring().empty());

    stats.start_transfer("a");
    stats.finish_transfer("a", true);
    stats.finish_transfer("b", true);
    EXPECT_EQ(stats.get_transfers(), 2u);
}

TEST_F(StatsTest, QueueSettersReplaceWholesale)
{
    stats.set_transfer_queue(10, 1000);
    stats.set_transfer_queue(2, 50);
    auto queues = stats.get_queues();
    EXPECT_EQ(queues.transfer_count, 2u);
    EXPECT_EQ(queues.transfer_bytes, 50u);
    EXPECT_EQ(queues.check_count, 0u);
}

TEST_F(StatsTest, SnapshotTotals)
{
    stats.add_bytes(3000);
    stats.set_transfer_queue(5, 5000);
    stats.set_check_queue(4, 0);
    stats.finish_check("x");
    stats.finish_transfer("y", true);

    auto s = stats.snapshot();
    EXPECT_EQ(s.total_size, 8000u);
    EXPECT_EQ(s.total_transfers, 6u);
    EXPECT_EQ(s.total_checks, 5u);
    EXPECT_EQ(s.elapsed.count() % 100, 0);
}

TEST_F(StatsTest, TransferSuffixShowsProgress)
{
    stats.set_transfer_queue(5, 5000);
    for (int i = 0; i < 3; ++i) {
        stats.finish_transfer("a", true);
    }
    auto text = stats.render();
    EXPECT_TRUE(contains(text, "(xfr#3/8)")) << text;
    EXPECT_FALSE(contains(text, "chk#")) << text;
    EXPECT_TRUE(contains(text, "Transferred:            3 / 8, 38%\n")) << text;
}

TEST_F(StatsTest, BothSuffixesWhenBothQueuesBusy)
{
    stats.set_transfer_queue(1, 10);
    stats.set_check_queue(2, 0);
    stats.finish_check("c");
    auto text = stats.render();
    EXPECT_TRUE(contains(text, "(xfr#0/1, chk#1/3)")) << text;
}

TEST_F(StatsTest, NoSuffixWithoutQueuedWork)
{
    stats.finish_transfer("a", true);
    stats.finish_check("b");
    auto text = stats.render();
    EXPECT_FALSE(contains(text, "xfr#")) << text;
    EXPECT_FALSE(contains(text, "chk#")) << text;
}

TEST_F(StatsTest, UnknownEtaWithoutBytes)
{
    stats.set_transfer_queue(1, 1000);
    auto s = stats.snapshot();
    EXPECT_DOUBLE_EQ(s.speed, 0.0);
    EXPECT_FALSE(s.eta.has_value());
    EXPECT_TRUE(contains(render_snapshot(s), ", ETA -")) << render_snapshot(s);
}

TEST_F(StatsTest, RenderLayout)
{
    stats.add_errors(2);
    stats.finish_check("c");
    auto text = stats.render();

    EXPECT_EQ(text.rfind("Transferred:   ", 0), 0u) << text;
    EXPECT_TRUE(contains(text, "\nErrors:                 2\n")) << text;
    EXPECT_TRUE(contains(text, "\nChecks:                 1 / 1, 100%\n")) << text;
    EXPECT_TRUE(contains(text, "\nTransferred:            0 / 0, 0%\n")) << text;
    EXPECT_TRUE(contains(text, "\nElapsed time:  00:00:0")) << text;
    EXPECT_FALSE(contains(text, "Checking:")) << text;
    EXPECT_FALSE(contains(text, "Transferring:")) << text;
}

TEST_F(StatsTest, RenderListsInFlightItems)
{
    stats.start_check("c1");
    stats.start_transfer("t1");
    stats.start_transfer("t2");

    auto text = stats.render();
    EXPECT_TRUE(contains(text, "Checking:\n * c1\n")) << text;
    EXPECT_TRUE(contains(text, "Transferring:\n * t1\n * t2\n")) << text;

    stats.finish_check("c1");
    stats.finish_transfer("t1", true);
    stats.finish_transfer("t2", true);
    text = stats.render();
    EXPECT_FALSE(contains(text, "Checking:")) << text;
    EXPECT_FALSE(contains(text, "Transferring:")) << text;
}

TEST_F(StatsTest, SpeedFollowsElapsedTime)
{
    stats.add_bytes(1000);
    std::this_thread::sleep_for(1100ms);
    stats.add_bytes(1000);
    EXPECT_EQ(stats.get_bytes(), 2000u);

    auto s = stats.snapshot();
    const double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - stats.start_time()).count();
    const double expected = 2000.0 / elapsed;
    EXPECT_NEAR(s.speed, expected, expected * 0.05);
    EXPECT_LT(s.speed, 2000.0 / 1.1 + 1.0);
}

TEST(StatsRenderTest, BitsUnit)
{
    Config config{};
    config.stats_unit = DataRateUnit::Bits;
    StatsAggregator stats(config);
    stats.add_bytes(4096);

    auto s = stats.snapshot();
    EXPECT_EQ(s.unit, DataRateUnit::Bits);
    EXPECT_TRUE(contains(render_snapshot(s), "Bits/s")) << render_snapshot(s);
}

TEST(StatsRenderTest, BitsModeEtaUsesDisplayedRate)
{
    Config config{};
    config.stats_unit = DataRateUnit::Bits;
    StatsAggregator stats(config);
    stats.add_bytes(1000);
    stats.set_transfer_queue(1, 100000);
    std::this_thread::sleep_for(1s);

    auto s = stats.snapshot();
    ASSERT_GT(s.speed, 0.0);
    ASSERT_TRUE(s.eta.has_value());
    // байты очереди делятся на битовую скорость
    EXPECT_EQ(s.eta->count(), std::llround(100000.0 / s.speed));
    EXPECT_LT(s.eta->count(), 20);
}

TEST(StatsRenderTest, RateIsTruncatedToWholeUnits)
{
    Snapshot s;
    s.speed = 512.5;
    EXPECT_TRUE(contains(render_snapshot(s), ", 512 Bytes/s, ")) << render_snapshot(s);

    s.speed = 1536.9;
    s.unit = DataRateUnit::Bits;
    EXPECT_TRUE(contains(render_snapshot(s), ", 1.500 KiBits/s, ")) << render_snapshot(s);
}

TEST(StatsRenderTest, ZeroElapsedSnapshot)
{
    Snapshot s;
    s.queues.transfer_count = 1;
    s.queues.transfer_bytes = 1000;
    s.total_transfers = 1;
    s.total_size = 1000;

    auto text = render_snapshot(s);
    EXPECT_EQ(text,
        "Transferred:            0 / 1000 Bytes, 0%, 0 Bytes/s, ETA - (xfr#0/1)\n"
        "Errors:                 0\n"
        "Checks:                 0 / 0, 0%\n"
        "Transferred:            0 / 1, 0%\n"
        "Elapsed time:  00:00:00.0\n");
}

TEST(StatsRenderTest, KnownEta)
{
    Snapshot s;
    s.bytes = 2048;
    s.total_size = 4096;
    s.speed = 1024;
    s.eta = 2s;
    s.elapsed = 2000ms;

    auto text = render_snapshot(s);
    EXPECT_TRUE(contains(text, "Transferred:          2Ki / 4 KiBytes, 50%, 1 KiBytes/s, ETA 00:00:02\n")) << text;
    EXPECT_TRUE(contains(text, "Elapsed time:  00:00:02.0\n")) << text;
}

TEST(StatsLogTest, WritesAtConfiguredLevel)
{
    auto out = std::make_shared<std::ostringstream>();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(*out);
    auto logger = std::make_shared<spdlog::logger>("stats_test", sink);
    logger->set_level(spdlog::level::info);
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(logger);

    Config config{};
    config.stats_log_level = spdlog::level::debug;
    StatsAggregator stats(config);
    stats.log();
    logger->flush();
    EXPECT_TRUE(out->str().empty()) << out->str();

    config.stats_log_level = spdlog::level::warn;
    stats.log();
    logger->flush();
    EXPECT_TRUE(contains(out->str(), "Transferred:")) << out->str();
    EXPECT_TRUE(contains(out->str(), "Elapsed time:")) << out->str();

    spdlog::set_default_logger(previous);
}
