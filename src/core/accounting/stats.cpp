#include "stats.hpp"
#include "metrics.hpp"
#include <cmath>
#include <mutex>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace xferacct::core::accounting {

StatsAggregator::StatsAggregator(const infra::Config& config)
    : config_(config)
    , start_(Clock::now())
    , checking_(config.checkers_or_default())
    , transferring_(config.transfers_or_default())
{}

void StatsAggregator::add_bytes(std::uint64_t n) {
    std::lock_guard lock(mutex_);
    bytes_ += n;
}

void StatsAggregator::add_errors(std::uint64_t n) {
    std::lock_guard lock(mutex_);
    errors_ += n;
}

void StatsAggregator::record_error(infra::Error err) {
    std::lock_guard lock(mutex_);
    ++errors_;
    last_error_ = std::move(err);
}

auto StatsAggregator::add_deletes(std::uint64_t n) -> std::uint64_t {
    std::lock_guard lock(mutex_);
    deletes_ += n;
    return deletes_;
}

void StatsAggregator::reset_counters() {
    std::lock_guard lock(mutex_);
    bytes_ = 0;
    errors_ = 0;
    checks_ = 0;
    transfers_ = 0;
    deletes_ = 0;
}

void StatsAggregator::reset_errors() {
    std::lock_guard lock(mutex_);
    errors_ = 0;
}

void StatsAggregator::start_check(const std::string& id) {
    checking_.add(id);
}

void StatsAggregator::finish_check(const std::string& id) {
    checking_.remove(id);
    std::lock_guard lock(mutex_);
    ++checks_;
}

void StatsAggregator::start_transfer(const std::string& id) {
    transferring_.add(id);
}

void StatsAggregator::finish_transfer(const std::string& id, bool ok) {
    transferring_.remove(id);
    if (ok) {
        std::lock_guard lock(mutex_);
        ++transfers_;
    }
}

void StatsAggregator::set_check_queue(std::uint64_t n, std::uint64_t size) {
    std::lock_guard lock(mutex_);
    queues_.check_count = n;
    queues_.check_bytes = size;
}

void StatsAggregator::set_transfer_queue(std::uint64_t n, std::uint64_t size) {
    std::lock_guard lock(mutex_);
    queues_.transfer_count = n;
    queues_.transfer_bytes = size;
}

void StatsAggregator::set_rename_queue(std::uint64_t n, std::uint64_t size) {
    std::lock_guard lock(mutex_);
    queues_.rename_count = n;
    queues_.rename_bytes = size;
}

auto StatsAggregator::get_bytes() const -> std::uint64_t {
    std::shared_lock lock(mutex_);
    return bytes_;
}

auto StatsAggregator::get_errors() const -> std::uint64_t {
    std::shared_lock lock(mutex_);
    return errors_;
}

auto StatsAggregator::get_last_error() const -> std::optional<infra::Error> {
    std::shared_lock lock(mutex_);
    return last_error_;
}

auto StatsAggregator::get_checks() const -> std::uint64_t {
    std::shared_lock lock(mutex_);
    return checks_;
}

auto StatsAggregator::get_transfers() const -> std::uint64_t {
    std::shared_lock lock(mutex_);
    return transfers_;
}

auto StatsAggregator::get_deletes() const -> std::uint64_t {
    std::shared_lock lock(mutex_);
    return deletes_;
}

auto StatsAggregator::get_queues() const -> QueueState {
    std::shared_lock lock(mutex_);
    return queues_;
}

auto StatsAggregator::has_errored() const -> bool {
    std::shared_lock lock(mutex_);
    return errors_ != 0;
}

auto StatsAggregator::snapshot() const -> Snapshot {
    Snapshot s;
    s.unit = config_.rate_unit();
    {
        std::shared_lock lock(mutex_);

        const auto elapsed = Clock::now() - start_;
        const double elapsed_seconds = std::chrono::duration<double>(elapsed).count();

        s.bytes = bytes_;
        s.errors = errors_;
        s.checks = checks_;
        s.transfers = transfers_;
        s.deletes = deletes_;
        s.queues = queues_;
        s.total_checks = queues_.check_count + checks_;
        s.total_transfers = queues_.transfer_count + transfers_;
        s.total_size = queues_.transfer_bytes + bytes_;
        s.elapsed = std::chrono::floor<std::chrono::milliseconds>(elapsed);
        s.elapsed -= s.elapsed % std::chrono::milliseconds(100);
        s.speed = transfer_speed(bytes_, elapsed_seconds, s.unit);
        // В режиме bits байты очереди делятся на битовую скорость: ETA в 8 раз короче
        s.eta = estimate_eta(queues_.transfer_bytes, s.speed);
    }

    // Наборы блокируются отдельно; mutex_ к этому моменту уже отпущен
    if (!checking_.empty()) {
        s.checking = checking_.render();
    }
    if (!transferring_.empty()) {
        s.transferring = transferring_.render();
    }
    return s;
}

auto StatsAggregator::render() const -> std::string {
    return render_snapshot(snapshot());
}

void StatsAggregator::log() const {
    auto text = render();
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    spdlog::log(config_.log_level(), "\n{}", text);
}

auto render_snapshot(const Snapshot& s) -> std::string {
    std::vector<std::string> xfrchk;
    if (s.total_transfers > 0 && s.queues.transfer_count > 0) {
        xfrchk.push_back(fmt::format("xfr#{}/{}", s.transfers, s.total_transfers));
    }
    if (s.total_checks > 0 && s.queues.check_count > 0) {
        xfrchk.push_back(fmt::format("chk#{}/{}", s.checks, s.total_checks));
    }
    std::string xfrchk_text;
    if (!xfrchk.empty()) {
        xfrchk_text = " (" + xfrchk.front();
        for (std::size_t i = 1; i < xfrchk.size(); ++i) {
            xfrchk_text += ", " + xfrchk[i];
        }
        xfrchk_text += ")";
    }

    // ETA в 0 секунд показываем так же, как неизвестную
    const std::string eta_text = (s.eta && s.eta->count() > 0) ? format_duration(*s.eta) : "-";

    auto out = fmt::format(
        "Transferred:   {:>10} / {}, {}%, {}, ETA {}{}\n"
        "Errors:        {:>10}\n"
        "Checks:        {:>10} / {}, {}%\n"
        "Transferred:   {:>10} / {}, {}%\n"
        "Elapsed time:  {:>10}\n",
        format_size(static_cast<double>(s.bytes)),
        format_size(static_cast<double>(s.total_size), "Bytes"),
        percent(s.bytes, s.total_size),
        format_size(std::floor(s.speed), rate_unit_label(s.unit)),
        eta_text, xfrchk_text,
        s.errors,
        s.checks, s.total_checks, percent(s.checks, s.total_checks),
        s.transfers, s.total_transfers, percent(s.transfers, s.total_transfers),
        format_elapsed(s.elapsed));

    if (!s.checking.empty()) {
        out += fmt::format("Checking:\n{}\n", s.checking);
    }
    if (!s.transferring.empty()) {
        out += fmt::format("Transferring:\n{}\n", s.transferring);
    }
    return out;
}

} // namespace xferacct::core::accounting
