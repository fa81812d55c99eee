#pragma once

#include <memory>
#include <utility>

#include <fmt/format.h>
#include <spdlog/logger.h>

namespace braid::detail {

// Logger that discards everything; the library is silent unless a caller
// installs its own logger.
[[nodiscard]] std::shared_ptr<spdlog::logger> makeNullLogger();

// Every line the library emits is tagged with its name.
template <typename... Args>
void log(spdlog::logger& logger, spdlog::level::level_enum level,
         fmt::format_string<Args...> format, Args&&... args) {
    if (!logger.should_log(level)) {
        return;
    }
    logger.log(level, "braid: {}", fmt::format(format, std::forward<Args>(args)...));
}

} // namespace braid::detail
