#include "braid/range_fetch_worker.hpp"

#include "braid/detail/curl_utils.hpp"
#include "braid/detail/log.hpp"

#include <cerrno>
#include <exception>
#include <system_error>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace braid {

RangeFetchWorker::RangeFetchWorker(WorkerSettings settings, ByteRange range, std::size_t index,
                                   const OutputFile& file, StatsRegistry& stats, Context ctx,
                                   std::shared_ptr<spdlog::logger> logger)
    : settings_(std::move(settings)),
      range_(range),
      index_(index),
      file_(file),
      stats_(stats),
      ctx_(std::move(ctx)),
      logger_(logger ? std::move(logger) : detail::makeNullLogger()) {}

std::optional<std::string> RangeFetchWorker::run() {
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    written_ = 0;
    write_error_.clear();

    // Nothing to request for an empty range; "bytes=N-(N-1)" is not a valid header.
    if (range_.empty()) {
        detail::log(*logger_, spdlog::level::debug, "job {} has an empty range, nothing to fetch", index_);
        return std::nullopt;
    }

    if (ctx_.isCancelled()) {
        return describe(ctx_.deadlineExceeded() ? "deadline exceeded" : "context cancelled");
    }

    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        return describe("Failed to allocate curl handle");
    }

    const std::string range = fmt::format("{}-{}", range_.start, range_.end - 1);
    char error_buffer[CURL_ERROR_SIZE] = {};

    detail::log(*logger_, spdlog::level::debug, "job {} fetching bytes={}", index_, range);

    curl_easy_setopt(curl.get(), CURLOPT_URL, settings_.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &RangeFetchWorker::writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, this);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &detail::abortWhenCancelled);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx_);
    if (!settings_.user_agent.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, settings_.user_agent.c_str());
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        if (!write_error_.empty()) {
            return describe(write_error_);
        }
        if (res == CURLE_ABORTED_BY_CALLBACK) {
            return describe(ctx_.deadlineExceeded() ? "deadline exceeded" : "context cancelled");
        }
        const std::string reason = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        return describe(fmt::format("curl error: {}", reason));
    }

    // curl_easy_perform() only returns CURLE_OK once the body is exhausted,
    // so anything short of the range length here is a truncated response.
    if (written_ != range_.length()) {
        return describe(fmt::format("range incomplete: received {} of {} bytes", written_, range_.length()));
    }

    return std::nullopt;
}

std::size_t RangeFetchWorker::writeCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* self = static_cast<RangeFetchWorker*>(userdata);
    if (!self) {
        return 0;
    }

    const std::size_t total = size * nmemb;
    if (total == 0) {
        return 0;
    }

    if (self->written_ + static_cast<std::int64_t>(total) > self->range_.length()) {
        self->write_error_ = fmt::format("server sent more than the {} bytes requested", self->range_.length());
        return 0;
    }

    const std::int64_t written = self->file_.writeAt(ptr, total, self->range_.start + self->written_);
    if (written < 0) {
        self->write_error_ = fmt::format("Failed to write output file: {}",
                                         std::error_code(errno, std::generic_category()).message());
        return 0;
    }
    if (written != static_cast<std::int64_t>(total)) {
        self->write_error_ = fmt::format("short write: expected {} bytes, wrote {}", total, written);
        return 0;
    }

    self->written_ += written;
    try {
        self->stats_.setReadBytes(self->index_, self->written_);
    } catch (const std::exception& ex) {
        self->write_error_ = ex.what();
        return 0;
    }

    return total;
}

std::string RangeFetchWorker::describe(const std::string& reason) const {
    return fmt::format("job {} (bytes {}-{}): {}", index_, range_.start, range_.end - 1, reason);
}

} // namespace braid
