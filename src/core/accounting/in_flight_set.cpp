#include "in_flight_set.hpp"
#include <algorithm>
#include <utility>
#include <vector>
#include <fmt/core.h>

namespace xferacct::core::accounting {

InFlightSet::InFlightSet(std::size_t capacity_hint) {
    members_.reserve(capacity_hint);
}

void InFlightSet::add(const std::string& id) {
    std::lock_guard lock(mutex_);
    if (members_.try_emplace(id, next_seq_).second) {
        ++next_seq_;
    }
}

void InFlightSet::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    members_.erase(id);
}

auto InFlightSet::empty() const -> bool {
    std::lock_guard lock(mutex_);
    return members_.empty();
}

auto InFlightSet::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return members_.size();
}

auto InFlightSet::contains(const std::string& id) const -> bool {
    std::lock_guard lock(mutex_);
    return members_.contains(id);
}

auto InFlightSet::render() const -> std::string {
    std::vector<std::pair<std::uint64_t, std::string>> ordered;
    {
        std::lock_guard lock(mutex_);
        ordered.reserve(members_.size());
        for (const auto& [id, seq] : members_) {
            ordered.emplace_back(seq, id);
        }
    }
    std::sort(ordered.begin(), ordered.end());

    std::string out;
    for (const auto& entry : ordered) {
        if (!out.empty()) out += '\n';
        out += fmt::format(" * {}", entry.second);
    }
    return out;
}

} // namespace xferacct::core::accounting
