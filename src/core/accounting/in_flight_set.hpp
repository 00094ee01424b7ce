#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace xferacct::core::accounting {

// Набор идентификаторов, которые сейчас проверяются или передаются.
// Имеет собственный mutex, независимый от блокировки StatsAggregator.
class InFlightSet {
public:
    explicit InFlightSet(std::size_t capacity_hint = 0);

    // Повторное добавление ничего не меняет
    void add(const std::string& id);
    // Удаление отсутствующего id ничего не делает
    void remove(const std::string& id);

    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto contains(const std::string& id) const -> bool;

    /// Строки " * <id>" в порядке добавления, через '\n', без завершающего перевода строки.
    [[nodiscard]] auto render() const -> std::string;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::uint64_t> members_;  // id -> порядковый номер добавления
    std::uint64_t next_seq_ = 0;
};

} // namespace xferacct::core::accounting
