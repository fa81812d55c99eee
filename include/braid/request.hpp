#pragma once

#include "context.hpp"
#include "output_file.hpp"
#include "stat.hpp"

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace braid {

inline constexpr int kDefaultJobs = 5;

struct FetchResult {
    OutputFilePtr file;
    bool has_error{false};
    std::string error_message;
};

// Fetches one HTTP resource with several concurrent range GETs and
// assembles it into a single file. Configure first, then call fetchFile()
// once per instance.
class Request {
public:
    Request();
    explicit Request(std::shared_ptr<spdlog::logger> logger);
    ~Request();

    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;

    void setJobs(int jobs);
    void setUserAgent(std::string user_agent);
    // Diagnostic sink. Passing nullptr restores the silent default.
    void setLogger(std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] int jobs() const;
    [[nodiscard]] const std::string& userAgent() const;

    // Throws FetchError when the destination cannot be opened or the
    // resource length cannot be determined. Worker failures are collected
    // and reported in the result, which always carries the open file.
    [[nodiscard]] FetchResult fetchFile(const Context& ctx, const std::string& url, const std::string& filename);
    [[nodiscard]] FetchResult fetchFile(const std::string& url, const std::string& filename);

    // Sum over all workers. Safe to call from any thread at any time.
    [[nodiscard]] Stat stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace braid
