#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <expected>
#include <mutex>
#include <unordered_set>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../accounting/stats.hpp"

namespace xferacct::core {

struct SyncSummary {
    std::uint64_t checked = 0;
    std::uint64_t transferred = 0;
    std::uint64_t deleted = 0;
    std::uint64_t bytes = 0;
    std::uint64_t errors = 0;
};

// Синхронизирует дерево source в destination: пул проверяющих сравнивает
// размер и mtime, изменившиеся файлы уходят в пул передачи. Всё
// учитывается в StatsAggregator; ошибки по файлам не прерывают прогон.
class SyncEngine {
public:
    SyncEngine(const infra::Config& config, accounting::StatsAggregator& stats);

    [[nodiscard]] auto run(const std::filesystem::path& source,
                           const std::filesystem::path& destination)
        -> std::expected<SyncSummary, infra::Error>;

private:
    struct SourceFile {
        std::filesystem::path relative;
        std::uintmax_t size = 0;
    };

    struct Backlog {
        std::uint64_t count = 0;
        std::uint64_t bytes = 0;
    };

    [[nodiscard]] auto scan(const std::filesystem::path& root) -> infra::Result<std::vector<SourceFile>>;
    [[nodiscard]] auto needs_transfer(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      std::uintmax_t size) const -> bool;
    void transfer(const std::string& id, const std::filesystem::path& src,
                  const std::filesystem::path& dst, std::uintmax_t size);
    [[nodiscard]] auto copy_contents(const std::string& id, const std::filesystem::path& src,
                                     const std::filesystem::path& dst, std::uintmax_t size)
        -> infra::VoidResult;
    void delete_extra(const std::filesystem::path& destination,
                      const std::unordered_set<std::string>& keep);

    void check_done(std::uint64_t size);
    void transfer_queued(std::uint64_t size);
    void transfer_done(std::uint64_t size);

    const infra::Config& config_;
    accounting::StatsAggregator& stats_;
    accounting::ErrorSink& errors_;

    // Порядок: backlog_mutex_ -> блокировка агрегатора, не наоборот
    std::mutex backlog_mutex_;
    Backlog checks_left_{};
    Backlog transfers_left_{};
};

} // namespace xferacct::core
