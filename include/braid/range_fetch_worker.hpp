#pragma once

#include "context.hpp"
#include "output_file.hpp"
#include "range_planner.hpp"
#include "stats_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace spdlog {
class logger;
}

namespace braid {

struct WorkerSettings {
    std::string url;
    std::string user_agent;
};

// Fetches one byte range with a single GET and writes the body into the
// shared file at the range's absolute offset.
class RangeFetchWorker {
public:
    RangeFetchWorker(WorkerSettings settings, ByteRange range, std::size_t index,
                     const OutputFile& file, StatsRegistry& stats, Context ctx,
                     std::shared_ptr<spdlog::logger> logger);

    // Returns the failure message, or std::nullopt when the whole range was written.
    [[nodiscard]] std::optional<std::string> run();

    [[nodiscard]] std::int64_t bytesWritten() const noexcept { return written_; }
    [[nodiscard]] const ByteRange& range() const noexcept { return range_; }

private:
    static std::size_t writeCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);

    [[nodiscard]] std::string describe(const std::string& reason) const;

    WorkerSettings settings_;
    ByteRange range_;
    std::size_t index_;
    const OutputFile& file_;
    StatsRegistry& stats_;
    Context ctx_;
    std::shared_ptr<spdlog::logger> logger_;

    std::int64_t written_{0};
    std::string write_error_;
};

} // namespace braid
