#include "periodic_reporter.hpp"
#include <spdlog/spdlog.h>

namespace xferacct::infra {

PeriodicReporter::PeriodicReporter(std::chrono::milliseconds interval, Callback report,
                                   bool enabled, bool final_report)
    : interval_(interval)
    , report_(std::move(report))
    , final_report_(final_report)
{
    if (enabled && interval_.count() > 0) {
        render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) { run_(st); });
        spdlog::debug("Stats reporter started, interval {} ms", interval_.count());
    }
}

PeriodicReporter::~PeriodicReporter() {
    stop();
}

void PeriodicReporter::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
    }
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_->join();
        render_thread_.reset();
    }
    if (final_report_) {
        report_();
    }
}

void PeriodicReporter::run_(std::stop_token st) {
    std::unique_lock lock(mutex_);
    while (!st.stop_requested()) {
        // Просыпаемся по таймауту или по request_stop()
        (void)cv_.wait_for(lock, st, interval_, [] { return false; });
        if (st.stop_requested()) break;

        // Колбэк пишет в лог, поэтому вызываем его без удержания mutex_
        lock.unlock();
        report_();
        lock.lock();
    }
}

} // namespace xferacct::infra
