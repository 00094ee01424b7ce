#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/periodic_reporter.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/accounting/stats.hpp"
#include "core/sync_engine/sync_engine.hpp"
#include <build_info.hpp>

namespace build_info = xferacct::build_info;

static auto
print_version()
-> void {
    fmt::print("xferacct {}\n", build_info::version);
    fmt::print("Git commit: {}{}\n", build_info::git_commit, build_info::git_dirty ? " (dirty)" : "");
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        xferacct::infra::install_signal_handler();

        auto args_opt = xferacct::cli::parse_args(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.version) {
            print_version();
            return 0;
        }
        if (args.verbose) {
            spdlog::set_level(spdlog::level::debug);
        }

        // 1. Загрузить из файла
        auto config_res = xferacct::infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(xferacct::infra::config_from_cli(args));
        if (config.quiet) {
            spdlog::set_level(spdlog::level::err);
        }

        spdlog::debug("checkers={} transfers={} stats={}ms",
                      config.checkers_or_default(), config.transfers_or_default(),
                      config.stats_interval().count());

        xferacct::core::accounting::StatsAggregator stats(config);
        xferacct::core::SyncEngine engine(config, stats);

        xferacct::infra::PeriodicReporter reporter(
            config.stats_interval(),
            [&stats] { stats.log(); },
            !config.quiet);

        spdlog::info("Syncing {} -> {}", args.source, args.destination);
        auto result = engine.run(args.source, args.destination);
        reporter.stop();

        if (!result) {
            const auto& err = result.error();
            spdlog::error("Sync failed: {}", err.message);
            return err.to_exit_code();
        }

        const auto& summary = *result;
        if (auto last = stats.get_last_error()) {
            spdlog::error("{} errors, last: {}", summary.errors, last->message);
        }
        spdlog::info("Checked {}, transferred {}, deleted {} files",
                     summary.checked, summary.transferred, summary.deleted);

        return stats.has_errored() ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
