#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "../../infra/config/config.hpp"

namespace xferacct::core::accounting {

// round(100*a/b), 0 при b == 0. Не ограничено сверху: если очередь
// сокращается быстрее, чем учитываются байты, результат может быть > 100.
// Насыщается на INT_MAX.
[[nodiscard]] auto percent(std::uint64_t a, std::uint64_t b) -> int;

// Скорость в выбранных единицах в секунду; 0 при нулевом времени
[[nodiscard]] auto transfer_speed(std::uint64_t bytes, double elapsed_seconds,
                                  infra::DataRateUnit unit) -> double;

// nullopt, если скорость неизвестна (<= 0)
[[nodiscard]] auto estimate_eta(std::uint64_t remaining_bytes, double bytes_per_second)
    -> std::optional<std::chrono::seconds>;

[[nodiscard]] auto rate_unit_label(infra::DataRateUnit unit) -> std::string_view;

/// Двоичные префиксы: "0", "1023", "1.953Ki", "2Mi".
[[nodiscard]] auto format_size(double value) -> std::string;

/// То же с единицей: "1.953 KiBytes", "0 Bytes", "16 KiBits/s".
[[nodiscard]] auto format_size(double value, std::string_view unit) -> std::string;

/// HH:MM:SS
[[nodiscard]] auto format_duration(std::chrono::seconds d) -> std::string;

/// HH:MM:SS.d, d отбрасывается до десятых
[[nodiscard]] auto format_elapsed(std::chrono::milliseconds d) -> std::string;

} // namespace xferacct::core::accounting
