#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace xferacct::infra {

// Фоновый поток, вызывающий report раз в interval и ещё раз при остановке.
// interval == 0 или enabled == false: поток не запускается, но финальный
// отчёт в stop() всё равно выводится (если final_report).
class PeriodicReporter {
public:
    using Callback = std::function<void()>;

    PeriodicReporter(std::chrono::milliseconds interval, Callback report,
                     bool enabled = true, bool final_report = true);
    ~PeriodicReporter();

    PeriodicReporter(const PeriodicReporter&) = delete;
    PeriodicReporter& operator=(const PeriodicReporter&) = delete;

    // Идемпотентна
    void stop();

    [[nodiscard]] auto is_running() const -> bool { return render_thread_ != nullptr; }

private:
    void run_(std::stop_token st);

    const std::chrono::milliseconds interval_;
    const Callback report_;
    const bool final_report_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    bool stopped_ = false;
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace xferacct::infra
