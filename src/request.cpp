#include "braid/request.hpp"

#include "braid/detail/curl_utils.hpp"
#include "braid/detail/log.hpp"
#include "braid/errors.hpp"
#include "braid/range_fetch_worker.hpp"
#include "braid/range_planner.hpp"
#include "braid/stats_registry.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>

namespace braid {

class Request::Impl {
public:
    explicit Impl(std::shared_ptr<spdlog::logger> logger)
        : logger_(logger ? std::move(logger) : detail::makeNullLogger()) {
        detail::ensureCurlInitialized();
    }

    FetchResult fetchFile(const Context& ctx, const std::string& url, const std::string& filename) {
        OutputFilePtr file;
        try {
            file = std::make_unique<OutputFile>(filename);
        } catch (const std::system_error& ex) {
            throw FetchError(FetchError::Kind::FileOpen, ex.what());
        }

        detail::log(*logger_, spdlog::level::info, "fetching {}", url);
        const std::int64_t length = fetchContentLength(ctx, url);
        detail::log(*logger_, spdlog::level::info, "content length {} bytes", length);

        const int jobs = std::max(1, jobs_);
        const auto ranges = planRanges(length, jobs);
        stats_.reset(ranges);

        detail::log(*logger_, spdlog::level::info, "launching {} jobs", jobs);

        const WorkerSettings settings{url, user_agent_};
        std::vector<std::unique_ptr<RangeFetchWorker>> workers;
        workers.reserve(ranges.size());
        for (std::size_t i = 0; i < ranges.size(); ++i) {
            workers.push_back(std::make_unique<RangeFetchWorker>(settings, ranges[i], i, *file, stats_, ctx, logger_));
        }

        ErrorCollector errors;
        std::vector<std::thread> threads;
        threads.reserve(workers.size());
        for (auto& worker : workers) {
            try {
                threads.emplace_back([this, &errors, w = worker.get()]() { runWorker(*w, errors); });
            } catch (const std::system_error& ex) {
                errors.add(fmt::format("cannot start worker thread: {}", ex.what()));
                break;
            }
        }

        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }

        FetchResult result;
        result.file = std::move(file);
        if (!errors.empty()) {
            result.has_error = true;
            result.error_message = errors.combined();
            detail::log(*logger_, spdlog::level::warn, "{} of {} jobs failed", errors.count(), jobs);
        } else {
            const auto total = stats_.snapshot();
            detail::log(*logger_, spdlog::level::info, "fetched {} of {} bytes", total.read_bytes, total.total_bytes);
        }
        return result;
    }

    [[nodiscard]] Stat stats() const { return stats_.snapshot(); }

    void setLogger(std::shared_ptr<spdlog::logger> logger) {
        logger_ = logger ? std::move(logger) : detail::makeNullLogger();
    }

    int jobs_{kDefaultJobs};
    std::string user_agent_;

private:
    std::int64_t fetchContentLength(const Context& ctx, const std::string& url) const {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw FetchError(FetchError::Kind::Metadata, "Failed to allocate curl handle");
        }

        char error_buffer[CURL_ERROR_SIZE] = {};
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &detail::abortWhenCancelled);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        if (!user_agent_.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
        }

        const CURLcode res = curl_easy_perform(curl.get());
        if (res == CURLE_ABORTED_BY_CALLBACK) {
            throw FetchError(FetchError::Kind::Metadata,
                             fmt::format("error fetching HEAD: {}",
                                         ctx.deadlineExceeded() ? "deadline exceeded" : "context cancelled"));
        }
        if (res != CURLE_OK) {
            const std::string reason = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
            throw FetchError(FetchError::Kind::Metadata, fmt::format("error fetching HEAD: {}", reason));
        }

        // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T accepts "12abc" as 12, so read the raw
        // header of the last response (after redirects) and parse it ourselves.
        curl_header* header = nullptr;
        if (curl_easy_header(curl.get(), "Content-Length", 0, CURLH_HEADER, -1, &header) != CURLHE_OK || !header) {
            throw FetchError(FetchError::Kind::Metadata, fmt::format("no Content-Length for {}", url));
        }

        const std::string raw_length = header->value ? header->value : "";
        const auto length = detail::parseContentLength(raw_length);
        if (!length) {
            throw FetchError(FetchError::Kind::Metadata, fmt::format("invalid Content-Length '{}' for {}", raw_length, url));
        }
        return *length;
    }

    void runWorker(RangeFetchWorker& worker, ErrorCollector& errors) const {
        std::optional<std::string> error;
        try {
            error = worker.run();
        } catch (const std::exception& ex) {
            error = ex.what();
        }

        if (error) {
            detail::log(*logger_, spdlog::level::warn, "{}", *error);
            errors.add(std::move(*error));
        }
    }

    std::shared_ptr<spdlog::logger> logger_;
    StatsRegistry stats_;
};

Request::Request() : impl_(std::make_unique<Impl>(nullptr)) {}

Request::Request(std::shared_ptr<spdlog::logger> logger) : impl_(std::make_unique<Impl>(std::move(logger))) {}

Request::~Request() = default;

void Request::setJobs(int jobs) { impl_->jobs_ = jobs; }

void Request::setUserAgent(std::string user_agent) { impl_->user_agent_ = std::move(user_agent); }

void Request::setLogger(std::shared_ptr<spdlog::logger> logger) { impl_->setLogger(std::move(logger)); }

int Request::jobs() const { return impl_->jobs_; }

const std::string& Request::userAgent() const { return impl_->user_agent_; }

FetchResult Request::fetchFile(const Context& ctx, const std::string& url, const std::string& filename) {
    return impl_->fetchFile(ctx, url, filename);
}

FetchResult Request::fetchFile(const std::string& url, const std::string& filename) {
    return impl_->fetchFile(Context{}, url, filename);
}

Stat Request::stats() const { return impl_->stats(); }

} // namespace braid
