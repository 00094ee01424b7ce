#include "progress_tracker.hpp"
#include "metrics.hpp"

namespace xferacct::core::accounting {

void ProgressTracker::begin(const std::string& id, std::uint64_t size) {
    std::lock_guard lock(mutex_);
    items_.insert_or_assign(id, Entry{.bytes = 0, .size = size, .started = Clock::now()});
}

void ProgressTracker::advance(const std::string& id, std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    auto it = items_.find(id);
    if (it != items_.end()) {
        it->second.bytes += bytes;
    }
}

void ProgressTracker::end(const std::string& id) {
    std::lock_guard lock(mutex_);
    items_.erase(id);
}

auto ProgressTracker::get(const std::string& id) const -> std::optional<ItemProgress> {
    Entry entry;
    {
        std::lock_guard lock(mutex_);
        auto it = items_.find(id);
        if (it == items_.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }

    const double elapsed = std::chrono::duration<double>(Clock::now() - entry.started).count();
    const double speed = transfer_speed(entry.bytes, elapsed, infra::DataRateUnit::Bytes);
    const auto remaining = entry.size > entry.bytes ? entry.size - entry.bytes : 0;

    return ItemProgress{
        .bytes = entry.bytes,
        .size = entry.size,
        .percent = percent(entry.bytes, entry.size),
        .speed = speed,
        .eta = estimate_eta(remaining, speed)
    };
}

auto ProgressTracker::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return items_.size();
}

} // namespace xferacct::core::accounting
