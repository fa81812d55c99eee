#pragma once

#include "range_planner.hpp"
#include "stat.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace braid {

// One Stat slot per worker. The slot count is fixed by reset() before any
// worker starts; afterwards each worker writes only its own slot.
class StatsRegistry {
public:
    void reset(const std::vector<ByteRange>& ranges);

    [[nodiscard]] Stat snapshot() const;
    [[nodiscard]] Stat get(std::size_t index) const;
    void setReadBytes(std::size_t index, std::int64_t read_bytes);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Stat> slots_;
};

} // namespace braid
