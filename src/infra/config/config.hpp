#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>
#include <filesystem>
#include <spdlog/common.h>

namespace xferacct::cli {
    struct CLIArgs;
}

namespace xferacct::infra {

enum class DataRateUnit {
    Bytes,
    Bits,
};

[[nodiscard]] auto parse_rate_unit(std::string_view text) -> std::optional<DataRateUnit>;
[[nodiscard]] auto parse_log_level(std::string_view text) -> std::optional<spdlog::level::level_enum>;

struct Config {
    static constexpr std::uint32_t default_checkers = 8;
    static constexpr std::uint32_t default_transfers = 4;
    static constexpr std::uint32_t default_stats_interval_ms = 1000;
    static constexpr std::size_t default_buffer_size = 64 * 1024;
    static constexpr int default_retries = 3;

    // Параллелизм (и подсказки ёмкости для in-flight наборов)
    std::optional<std::uint32_t> checkers;
    std::optional<std::uint32_t> transfers;

    // Статистика
    std::optional<std::uint32_t> stats_interval_ms;  // 0 = без периодического вывода
    std::optional<DataRateUnit> stats_unit;
    std::optional<spdlog::level::level_enum> stats_log_level;

    // I/O
    std::optional<std::size_t> buffer_size;
    std::optional<int> retries;

    // Поведение
    bool delete_extra = false;
    bool quiet = false;

    [[nodiscard]] auto checkers_or_default() const -> std::uint32_t;
    [[nodiscard]] auto transfers_or_default() const -> std::uint32_t;
    [[nodiscard]] auto stats_interval() const -> std::chrono::milliseconds;
    [[nodiscard]] auto rate_unit() const -> DataRateUnit {
        return stats_unit.value_or(DataRateUnit::Bytes);
    }
    [[nodiscard]] auto log_level() const -> spdlog::level::level_enum {
        return stats_log_level.value_or(spdlog::level::info);
    }
    [[nodiscard]] auto buffer_size_or_default() const -> std::size_t;
    [[nodiscard]] auto retries_or_default() const -> int;

    // Значения из other (CLI) перекрывают текущие (файл)
    void merge_with(const Config& other);
};

/// Разбирает YAML-документ с настройками.
/// Неизвестные ключи игнорируются, некорректные значения дают ошибку.
[[nodiscard]] auto parse_config(std::string_view yaml_text) -> std::expected<Config, std::string>;

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.xferacct.yaml
///   2. $XDG_CONFIG_HOME/xferacct/config.yaml
///   3. ~/.config/xferacct/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов
[[nodiscard]] auto config_from_cli(const cli::CLIArgs& args) -> Config;

} // namespace xferacct::infra
