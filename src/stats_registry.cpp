#include "braid/stats_registry.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace braid {

void StatsRegistry::reset(const std::vector<ByteRange>& ranges) {
    std::vector<Stat> slots;
    slots.reserve(ranges.size());
    for (const auto& range : ranges) {
        slots.push_back({range.length(), 0});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    slots_ = std::move(slots);
}

Stat StatsRegistry::snapshot() const {
    Stat total;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& slot : slots_) {
        total.total_bytes += slot.total_bytes;
        total.read_bytes += slot.read_bytes;
    }
    return total;
}

Stat StatsRegistry::get(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= slots_.size()) {
        throw std::out_of_range(fmt::format("stat slot {} out of range ({} slots)", index, slots_.size()));
    }
    return slots_[index];
}

void StatsRegistry::setReadBytes(std::size_t index, std::int64_t read_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= slots_.size()) {
        throw std::out_of_range(fmt::format("stat slot {} out of range ({} slots)", index, slots_.size()));
    }
    slots_[index].read_bytes = read_bytes;
}

std::size_t StatsRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace braid
