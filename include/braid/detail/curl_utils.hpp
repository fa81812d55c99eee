#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <curl/curl.h>

namespace braid::detail {

// Runs curl_global_init() once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

// CURLOPT_XFERINFOFUNCTION taking a braid::Context* as clientp. Returning
// non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int abortWhenCancelled(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

// Strict Content-Length value: decimal digits only, surrounding spaces and
// tabs allowed. std::nullopt for anything else, including overflow.
[[nodiscard]] std::optional<std::int64_t> parseContentLength(std::string_view value);

} // namespace braid::detail
