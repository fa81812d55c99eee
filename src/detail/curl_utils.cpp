#include "braid/detail/curl_utils.hpp"

#include "braid/context.hpp"

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <mutex>

namespace braid::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

int abortWhenCancelled(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<const Context*>(clientp);
    return (ctx && ctx->isCancelled()) ? 1 : 0;
}

std::optional<std::int64_t> parseContentLength(std::string_view value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    value = value.substr(first, value.find_last_not_of(" \t") - first + 1);

    // from_chars accepts a leading '-'; a length never has one.
    if (value.front() < '0' || value.front() > '9') {
        return std::nullopt;
    }

    std::int64_t length = 0;
    const char* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, length);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return length;
}

} // namespace braid::detail
