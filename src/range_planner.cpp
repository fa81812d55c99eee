#include "braid/range_planner.hpp"

#include <algorithm>
#include <stdexcept>

namespace braid {

std::vector<ByteRange> planRanges(std::int64_t content_length, int job_count) {
    if (content_length < 0) {
        throw std::invalid_argument("content length must not be negative");
    }

    const int jobs = std::max(1, job_count);
    const std::int64_t chunk_size = content_length / jobs;
    const std::int64_t remainder = content_length % jobs;

    std::vector<ByteRange> ranges;
    ranges.reserve(static_cast<std::size_t>(jobs));
    for (int i = 0; i < jobs; ++i) {
        ByteRange range{static_cast<std::int64_t>(i) * chunk_size,
                        static_cast<std::int64_t>(i + 1) * chunk_size};
        if (i == jobs - 1) {
            range.end += remainder;
        }
        ranges.push_back(range);
    }
    return ranges;
}

} // namespace braid
