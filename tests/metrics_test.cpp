#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include "core/accounting/metrics.hpp"

using namespace xferacct::core::accounting;
using xferacct::infra::DataRateUnit;
using namespace std::chrono_literals;

TEST(MetricsTest, PercentGuardsZeroTotal)
{
    EXPECT_EQ(percent(0, 0), 0);
    EXPECT_EQ(percent(12345, 0), 0);
    EXPECT_EQ(percent(0, 10), 0);
    EXPECT_EQ(percent(10, 10), 100);
    EXPECT_EQ(percent(1, 3), 33);
    EXPECT_EQ(percent(2, 3), 67);
    EXPECT_EQ(percent(1, 200), 1);  // 0.5 округляется вверх
}

TEST(MetricsTest, PercentIsNotClamped)
{
    EXPECT_EQ(percent(150, 100), 150);
}

TEST(MetricsTest, PercentSaturatesInsteadOfOverflowing)
{
    constexpr auto max = std::numeric_limits<int>::max();
    EXPECT_EQ(percent(std::numeric_limits<std::uint64_t>::max(), 1), max);
    EXPECT_EQ(percent(std::uint64_t{1} << 40, 1), max);
    EXPECT_EQ(percent(20'000'000, 1), 2'000'000'000);
}

TEST(MetricsTest, SpeedZeroWithoutElapsedTime)
{
    EXPECT_DOUBLE_EQ(transfer_speed(1000, 0.0, DataRateUnit::Bytes), 0.0);
    EXPECT_DOUBLE_EQ(transfer_speed(1000, -1.0, DataRateUnit::Bits), 0.0);
    EXPECT_DOUBLE_EQ(transfer_speed(1000, 2.0, DataRateUnit::Bytes), 500.0);
    EXPECT_DOUBLE_EQ(transfer_speed(1000, 2.0, DataRateUnit::Bits), 4000.0);
}

TEST(MetricsTest, EtaUnknownWithoutSpeed)
{
    EXPECT_FALSE(estimate_eta(5000, 0.0).has_value());
    EXPECT_EQ(estimate_eta(5000, 1000.0), 5s);
    EXPECT_EQ(estimate_eta(1500, 1000.0), 2s);
    EXPECT_EQ(estimate_eta(0, 1000.0), 0s);
}

TEST(MetricsTest, FormatSizeBinaryPrefixes)
{
    EXPECT_EQ(format_size(0), "0");
    EXPECT_EQ(format_size(1023), "1023");
    EXPECT_EQ(format_size(1024), "1Ki");
    EXPECT_EQ(format_size(2000), "1.953Ki");
    EXPECT_EQ(format_size(3.0 * 1024 * 1024), "3Mi");
    EXPECT_EQ(format_size(1024.0 * 1024 * 1024 * 1.5), "1.500Gi");
}

TEST(MetricsTest, FormatSizeWithUnit)
{
    EXPECT_EQ(format_size(0, "Bytes"), "0 Bytes");
    EXPECT_EQ(format_size(2000, "Bytes"), "1.953 KiBytes");
    EXPECT_EQ(format_size(16384, rate_unit_label(DataRateUnit::Bits)), "16 KiBits/s");
    EXPECT_EQ(format_size(512.5, "Bytes/s"), "512.500 Bytes/s");
}

TEST(MetricsTest, FormatDurations)
{
    EXPECT_EQ(format_duration(0s), "00:00:00");
    EXPECT_EQ(format_duration(3723s), "01:02:03");
    EXPECT_EQ(format_duration(100h), "100:00:00");
    EXPECT_EQ(format_elapsed(0ms), "00:00:00.0");
    EXPECT_EQ(format_elapsed(1299ms), "00:00:01.2");
    EXPECT_EQ(format_elapsed(61'950ms), "00:01:01.9");
}
