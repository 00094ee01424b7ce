#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace xferacct::infra {

// Пул фиксированного размера. Задачи могут ставить новые задачи в этот же
// или другой пул; wait() ждёт, пока очередь опустеет и все задачи завершатся.
// Задачи сами сообщают о своих ошибках; исключение, дошедшее до пула,
// только логируется.
class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void submit(Task task);

    // Блокирующее ожидание завершения всех задач
    void wait();

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }

private:
    void worker_loop_(std::stop_token st);

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idle_cv_;
    std::size_t active_tasks_ = 0;
    bool stop_ = false;

    // Последним: потоки join'ятся раньше, чем разрушаются очередь и cv
    std::vector<std::jthread> workers_;
};

inline ThreadPool::ThreadPool(std::size_t nthreads) {
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);
    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    // jthread сам вызовет request_stop и join
}

inline void ThreadPool::submit(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });

            // Оставшиеся задачи дорабатываем до конца
            if (tasks_.empty()) {
                if (stop_ || st.stop_requested()) return;
                continue;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_tasks_;
        }

        // Исключение задачи не должно уронить поток пула
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker task failed: {}", e.what());
        }

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace xferacct::infra
