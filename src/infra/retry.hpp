#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <cmath>
#include <thread>

namespace xferacct::infra {
/*

auto res = infra::with_retry([&]() {
    return copy_one(src, dst);
}, infra::RetryPolicy{ .max_attempts = config.retries_or_default() });

*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100);
    double backoff_factor = 2.0;
};

// Повторяет operation, пока она возвращает transient-ошибку.
// on_retry(attempt, error) вызывается перед каждой повторной попыткой.
template<typename F, typename OnRetry>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy, OnRetry&& on_retry)
    -> decltype(operation())
{
    const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    for (int attempt = 1; ; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result;
        }
        if (!result.error().is_transient() || attempt >= attempts) {
            return result;
        }

        on_retry(attempt, result.error());
        auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
            policy.initial_delay * std::pow(policy.backoff_factor, attempt - 1));
        std::this_thread::sleep_for(delay);
    }
}

template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {})
    -> decltype(operation())
{
    return with_retry(std::forward<F>(operation), policy, [](int, const Error&) {});
}

} // namespace xferacct::infra
