#pragma once

#include <cstdint>

namespace braid {

struct Stat {
    std::int64_t total_bytes{0};
    std::int64_t read_bytes{0};
};

} // namespace braid
