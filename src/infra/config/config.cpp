#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace xferacct::infra {

namespace {

auto lowercase(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Локальный файл
    paths.push_back(".xferacct.yaml");

    // 2. Глобальный файл
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "xferacct" / "config.yaml");
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "xferacct" / "config.yaml");
        }
    }

    return paths;
}

auto config_from_node(const YAML::Node& node) -> std::expected<Config, std::string> {
    Config cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        return std::unexpected(std::string("top-level YAML node must be a map"));
    }

    if (node["checkers"]) cfg.checkers = node["checkers"].as<std::uint32_t>();
    if (node["transfers"]) cfg.transfers = node["transfers"].as<std::uint32_t>();
    if (node["stats_interval_ms"]) cfg.stats_interval_ms = node["stats_interval_ms"].as<std::uint32_t>();
    if (node["buffer_size"]) cfg.buffer_size = node["buffer_size"].as<std::size_t>();
    if (node["retries"]) cfg.retries = node["retries"].as<int>();
    if (node["delete"]) cfg.delete_extra = node["delete"].as<bool>();
    if (node["quiet"]) cfg.quiet = node["quiet"].as<bool>();

    if (node["stats_unit"]) {
        auto text = node["stats_unit"].as<std::string>();
        auto unit = parse_rate_unit(text);
        if (!unit) {
            return std::unexpected(fmt::format("stats_unit must be 'bytes' or 'bits', got '{}'", text));
        }
        cfg.stats_unit = *unit;
    }
    if (node["stats_log_level"]) {
        auto text = node["stats_log_level"].as<std::string>();
        auto level = parse_log_level(text);
        if (!level) {
            return std::unexpected(fmt::format("unknown stats_log_level '{}'", text));
        }
        cfg.stats_log_level = *level;
    }

    if (cfg.checkers && *cfg.checkers == 0) {
        return std::unexpected(std::string("checkers must be at least 1"));
    }
    if (cfg.transfers && *cfg.transfers == 0) {
        return std::unexpected(std::string("transfers must be at least 1"));
    }
    if (cfg.buffer_size && *cfg.buffer_size == 0) {
        return std::unexpected(std::string("buffer_size must be positive"));
    }
    if (cfg.retries && *cfg.retries < 1) {
        return std::unexpected(std::string("retries must be at least 1"));
    }
    return cfg;
}

} // namespace

auto parse_rate_unit(std::string_view text) -> std::optional<DataRateUnit> {
    auto value = lowercase(text);
    if (value == "bytes") return DataRateUnit::Bytes;
    if (value == "bits") return DataRateUnit::Bits;
    return std::nullopt;
}

auto parse_log_level(std::string_view text) -> std::optional<spdlog::level::level_enum> {
    auto value = lowercase(text);
    if (value == "warning") value = "warn";
    // from_str возвращает off для неизвестных строк
    auto level = spdlog::level::from_str(value);
    if (level == spdlog::level::off && value != "off") {
        return std::nullopt;
    }
    return level;
}

auto Config::checkers_or_default() const -> std::uint32_t {
    return checkers.value_or(default_checkers);
}

auto Config::transfers_or_default() const -> std::uint32_t {
    return transfers.value_or(default_transfers);
}

auto Config::stats_interval() const -> std::chrono::milliseconds {
    return std::chrono::milliseconds(stats_interval_ms.value_or(default_stats_interval_ms));
}

auto Config::buffer_size_or_default() const -> std::size_t {
    return buffer_size.value_or(default_buffer_size);
}

auto Config::retries_or_default() const -> int {
    return retries.value_or(default_retries);
}

void Config::merge_with(const Config& other) {
    if (other.checkers) checkers = other.checkers;
    if (other.transfers) transfers = other.transfers;
    if (other.stats_interval_ms) stats_interval_ms = other.stats_interval_ms;
    if (other.stats_unit) stats_unit = other.stats_unit;
    if (other.stats_log_level) stats_log_level = other.stats_log_level;
    if (other.buffer_size) buffer_size = other.buffer_size;
    if (other.retries) retries = other.retries;
    if (other.delete_extra) delete_extra = true;
    if (other.quiet) quiet = true;
}

auto parse_config(std::string_view yaml_text) -> std::expected<Config, std::string> {
    try {
        return config_from_node(YAML::Load(std::string(yaml_text)));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("Failed to parse config: {}", e.what()));
    }
}

auto load_config_from_file(const std::filesystem::path& path) -> std::expected<Config, std::string> {
    try {
        auto cfg = config_from_node(YAML::LoadFile(path.string()));
        if (!cfg) {
            return std::unexpected(fmt::format("{}: {}", path.string(), cfg.error()));
        }
        spdlog::debug("Loaded config from {}", path.string());
        return cfg;
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

auto load_config_from_file() -> std::expected<Config, std::string> {
    for (const auto& path : get_config_paths()) {
        if (!std::filesystem::exists(path)) continue;
        return load_config_from_file(path);
    }

    // Файл не найден: пустой конфиг, не ошибка
    return Config{};
}

[[nodiscard]]
auto config_from_cli(const cli::CLIArgs& args) -> Config {
    Config cfg{};
    cfg.checkers = args.checkers;
    cfg.transfers = args.transfers;
    cfg.stats_interval_ms = args.stats_interval_ms;
    if (args.stats_unit) cfg.stats_unit = parse_rate_unit(*args.stats_unit);
    if (args.stats_log_level) cfg.stats_log_level = parse_log_level(*args.stats_log_level);
    cfg.buffer_size = args.buffer_size;
    cfg.retries = args.retries;
    cfg.delete_extra = args.delete_extra;
    cfg.quiet = args.quiet;
    return cfg;
}

} // namespace xferacct::infra
