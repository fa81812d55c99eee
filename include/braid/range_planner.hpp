#pragma once

#include <cstdint>
#include <vector>

namespace braid {

// Half-open span [start, end) of the remote resource.
struct ByteRange {
    std::int64_t start{0};
    std::int64_t end{0};

    [[nodiscard]] std::int64_t length() const { return end - start; }
    [[nodiscard]] bool empty() const { return end <= start; }
};

// Splits [0, content_length) into exactly max(1, job_count) contiguous ranges.
// The last range absorbs the remainder of the division.
[[nodiscard]] std::vector<ByteRange> planRanges(std::int64_t content_length, int job_count);

} // namespace braid
