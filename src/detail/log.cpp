#include "braid/detail/log.hpp"

#include <spdlog/sinks/null_sink.h>

namespace braid::detail {

std::shared_ptr<spdlog::logger> makeNullLogger() {
    return std::make_shared<spdlog::logger>("braid", std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace braid::detail
