#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "error_sink.hpp"
#include "in_flight_set.hpp"
#include "progress_tracker.hpp"

namespace xferacct::core::accounting {

// Очереди, которые сообщает планировщик. Заменяются целиком.
struct QueueState {
    std::uint64_t check_count = 0;
    std::uint64_t check_bytes = 0;
    std::uint64_t transfer_count = 0;
    std::uint64_t transfer_bytes = 0;
    std::uint64_t rename_count = 0;
    std::uint64_t rename_bytes = 0;
};

// Снимок счётчиков и производных метрик для вывода
struct Snapshot {
    std::uint64_t bytes = 0;
    std::uint64_t errors = 0;
    std::uint64_t checks = 0;
    std::uint64_t transfers = 0;
    std::uint64_t deletes = 0;
    QueueState queues{};

    std::uint64_t total_checks = 0;
    std::uint64_t total_transfers = 0;
    std::uint64_t total_size = 0;

    std::chrono::milliseconds elapsed{0};  // отброшено до десятых секунды
    double speed = 0.0;                    // в единицах unit за секунду
    infra::DataRateUnit unit = infra::DataRateUnit::Bytes;
    std::optional<std::chrono::seconds> eta;

    // InFlightSet::render(); пустые строки, если наборы пусты
    std::string checking;
    std::string transferring;
};

/// Текстовое представление снимка: пять строк итогов и, при наличии,
/// блоки "Checking:" и "Transferring:".
[[nodiscard]] auto render_snapshot(const Snapshot& snapshot) -> std::string;

/// Счётчики одного прогона: байты, ошибки, проверки, передачи, удаления.
///
/// Все изменяющие методы безопасны при произвольных параллельных вызовах
/// и не возвращают ошибок. Счётчики защищены одним std::shared_mutex
/// (запись эксклюзивно, чтение разделяемо). Наборы checking/transferring
/// и ProgressTracker имеют собственные mutex.
///
/// Порядок блокировок: mutex_ никогда не удерживается при обращении к
/// in-flight наборам. snapshot() копирует числа под mutex_, отпускает его
/// и только затем опрашивает наборы. Код, удерживающий блокировку набора,
/// поэтому может вызывать методы агрегатора без риска взаимоблокировки.
/// Снимок из-за этого не атомарен: файл может одновременно числиться
/// завершённым и ещё находиться в наборе.
class StatsAggregator : public ErrorSink {
public:
    using Clock = std::chrono::steady_clock;

    explicit StatsAggregator(const infra::Config& config);

    StatsAggregator(const StatsAggregator&) = delete;
    StatsAggregator& operator=(const StatsAggregator&) = delete;

    void add_bytes(std::uint64_t n);
    void add_errors(std::uint64_t n);
    void record_error(infra::Error err) override;
    // Возвращает новое общее число удалений (для нумерации удалённых файлов)
    auto add_deletes(std::uint64_t n) -> std::uint64_t;

    // Обнуляет bytes, errors, checks, transfers, deletes; очереди и время старта не трогает
    void reset_counters();
    // Обнуляет только errors; last error остаётся
    void reset_errors();

    void start_check(const std::string& id);
    // checks увеличивается всегда, даже если id не было в наборе
    void finish_check(const std::string& id);
    void start_transfer(const std::string& id);
    void finish_transfer(const std::string& id, bool ok);

    void set_check_queue(std::uint64_t n, std::uint64_t size);
    void set_transfer_queue(std::uint64_t n, std::uint64_t size);
    void set_rename_queue(std::uint64_t n, std::uint64_t size);

    [[nodiscard]] auto get_bytes() const -> std::uint64_t;
    [[nodiscard]] auto get_errors() const -> std::uint64_t;
    [[nodiscard]] auto get_last_error() const -> std::optional<infra::Error>;
    [[nodiscard]] auto get_checks() const -> std::uint64_t;
    [[nodiscard]] auto get_transfers() const -> std::uint64_t;
    [[nodiscard]] auto get_deletes() const -> std::uint64_t;
    [[nodiscard]] auto get_queues() const -> QueueState;
    [[nodiscard]] auto has_errored() const -> bool;
    [[nodiscard]] auto start_time() const -> Clock::time_point { return start_; }

    [[nodiscard]] auto snapshot() const -> Snapshot;
    [[nodiscard]] auto render() const -> std::string;
    // Пишет render() в лог с уровнем stats_log_level, после снятия всех блокировок
    void log() const;

    [[nodiscard]] auto checking() const -> const InFlightSet& { return checking_; }
    [[nodiscard]] auto transferring() const -> const InFlightSet& { return transferring_; }
    [[nodiscard]] auto progress() -> ProgressTracker& { return progress_; }

private:
    const infra::Config& config_;
    const Clock::time_point start_;

    mutable std::shared_mutex mutex_;
    std::uint64_t bytes_ = 0;
    std::uint64_t errors_ = 0;
    std::optional<infra::Error> last_error_;
    std::uint64_t checks_ = 0;
    std::uint64_t transfers_ = 0;
    std::uint64_t deletes_ = 0;
    QueueState queues_{};

    // Собственные блокировки, см. порядок выше
    InFlightSet checking_;
    InFlightSet transferring_;
    ProgressTracker progress_;
};

} // namespace xferacct::core::accounting
