//
// Created by Giuseppe Francione on 05/03/26.
//

/**
 * @file http_client.hpp
 * @brief Network seam of the job executor.
 */

#ifndef TRAWL_HTTP_CLIENT_HPP
#define TRAWL_HTTP_CLIENT_HPP

#include "errors.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace trawl {

/**
 * @brief Receives response body chunks as they arrive.
 *
 * Throwing from the sink aborts the transfer; the exception is rethrown
 * from IHttpClient::fetch.
 */
using ByteSink = std::function<void(std::span<const char>)>;

struct FetchRequest {
    std::string url;
    std::string referer;                 ///< Empty for none
    std::vector<std::string> headers;    ///< Extra "Name: value" lines
    std::string user_agent;
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds stall_timeout{60}; ///< Abort when no byte arrives for this long
};

struct FetchResponse {
    long status = 0;
    std::string content_type;            ///< Content-Type header, may be empty
    std::string effective_url;           ///< URL after redirects
    std::uintmax_t bytes = 0;            ///< Body bytes delivered to the sink
};

/**
 * @brief Performs one GET request and streams the body into a sink.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Fetches @p request, writing the body to @p sink.
     *
     * Only bodies of successful (2xx after redirects) responses reach the sink.
     *
     * @throws TransferError classified by cause (HTTP status, network error).
     * @throws OperationCancelled once @p st is stopped.
     */
    virtual FetchResponse fetch(const FetchRequest& request,
                                const ByteSink& sink,
                                const std::stop_token& st) = 0;
};

/**
 * @brief Maps a libcurl result code to an error class.
 *
 * Malformed URLs, unsupported protocols, redirect loops, TLS verification
 * failures and denied access are permanent. Other failures are transient.
 */
[[nodiscard]] ErrorClass classify_curl_code(int code) noexcept;

/**
 * @brief libcurl implementation of IHttpClient.
 *
 * Each fetch uses its own easy handle, so one instance may be shared by
 * all workers. Cancellation is observed through the transfer progress
 * callback and through exceptions raised by the sink.
 */
class CurlHttpClient final : public IHttpClient {
public:
    CurlHttpClient();

    FetchResponse fetch(const FetchRequest& request,
                        const ByteSink& sink,
                        const std::stop_token& st) override;
};

} // namespace trawl

#endif // TRAWL_HTTP_CLIENT_HPP
