#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace xferacct::core::accounting {

// Прогресс одного файла на момент запроса
struct ItemProgress {
    std::uint64_t bytes = 0;
    std::uint64_t size = 0;
    int percent = 0;
    double speed = 0.0;                       // байт/с
    std::optional<std::chrono::seconds> eta;  // nullopt пока скорость неизвестна
};

// Оценщик прогресса по отдельным файлам. Собственный mutex; никогда не
// вызывается под блокировкой StatsAggregator.
// Агрегатор его только хранит и в render() не читает; get() нужен
// исполнителю передач (итоговая скорость файла в логе) и другим вызывающим.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    void begin(const std::string& id, std::uint64_t size);
    void advance(const std::string& id, std::uint64_t bytes);
    void end(const std::string& id);

    [[nodiscard]] auto get(const std::string& id) const -> std::optional<ItemProgress>;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    struct Entry {
        std::uint64_t bytes = 0;
        std::uint64_t size = 0;
        Clock::time_point started;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> items_;
};

} // namespace xferacct::core::accounting
