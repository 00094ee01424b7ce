#include "metrics.hpp"
#include <array>
#include <cmath>
#include <limits>
#include <fmt/core.h>

namespace xferacct::core::accounting {

namespace {

constexpr std::array<std::string_view, 7> binary_prefixes = {"", "Ki", "Mi", "Gi", "Ti", "Pi", "Ei"};

struct ScaledValue {
    std::string number;
    std::string_view prefix;
};

auto scale(double value) -> ScaledValue {
    if (value <= 0) {
        return {"0", ""};
    }
    std::size_t idx = 0;
    while (value >= 1024.0 && idx + 1 < binary_prefixes.size()) {
        value /= 1024.0;
        ++idx;
    }
    if (std::floor(value) == value) {
        return {fmt::format("{:.0f}", value), binary_prefixes[idx]};
    }
    return {fmt::format("{:.3f}", value), binary_prefixes[idx]};
}

} // namespace

auto percent(std::uint64_t a, std::uint64_t b) -> int {
    if (b == 0) {
        return 0;
    }
    const double value = static_cast<double>(a) * 100.0 / static_cast<double>(b) + 0.5;
    if (value >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(value);
}

auto transfer_speed(std::uint64_t bytes, double elapsed_seconds,
                    infra::DataRateUnit unit) -> double {
    if (elapsed_seconds <= 0) {
        return 0.0;
    }
    double speed = static_cast<double>(bytes) / elapsed_seconds;
    if (unit == infra::DataRateUnit::Bits) {
        speed *= 8;
    }
    return speed;
}

auto estimate_eta(std::uint64_t remaining_bytes, double bytes_per_second)
    -> std::optional<std::chrono::seconds> {
    if (!(bytes_per_second > 0)) {
        return std::nullopt;
    }
    return std::chrono::seconds(std::llround(static_cast<double>(remaining_bytes) / bytes_per_second));
}

auto rate_unit_label(infra::DataRateUnit unit) -> std::string_view {
    return unit == infra::DataRateUnit::Bits ? "Bits/s" : "Bytes/s";
}

auto format_size(double value) -> std::string {
    auto scaled = scale(value);
    return scaled.number + std::string(scaled.prefix);
}

auto format_size(double value, std::string_view unit) -> std::string {
    auto scaled = scale(value);
    return fmt::format("{} {}{}", scaled.number, scaled.prefix, unit);
}

auto format_duration(std::chrono::seconds d) -> std::string {
    auto total = d.count() < 0 ? 0 : d.count();
    return fmt::format("{:02d}:{:02d}:{:02d}", total / 3600, (total % 3600) / 60, total % 60);
}

auto format_elapsed(std::chrono::milliseconds d) -> std::string {
    auto ms = d.count() < 0 ? 0 : d.count();
    auto seconds = ms / 1000;
    auto tenths = (ms % 1000) / 100;
    return fmt::format("{:02d}:{:02d}:{:02d}.{}", seconds / 3600, (seconds % 3600) / 60, seconds % 60, tenths);
}

} // namespace xferacct::core::accounting
