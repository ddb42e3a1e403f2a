//
// Created by Giuseppe Francione on 05/03/26.
//

#include "../../include/http_client.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <curl/curl.h>
#include <exception>
#include <mutex>
#include <stdexcept>

namespace trawl {

namespace {

const char* client_tag() {
    return "CurlHttpClient";
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() {
        h = curl_easy_init();
        if (!h) throw TransferError(ErrorClass::Transient, "curl_easy_init failed");
    }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    curl_slist* list{nullptr};
    ~HeaderList() { if (list) curl_slist_free_all(list); }
    void append(const std::string& line) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) throw std::bad_alloc();
        list = next;
    }
};

struct TransferContext {
    const ByteSink* sink;
    const std::stop_token* st;
    std::exception_ptr error;
    std::uintmax_t bytes = 0;
};

size_t write_cb(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nmemb;
    try {
        (*ctx->sink)(std::span<const char>(ptr, total));
    } catch (...) {
        // rethrown by fetch() once curl_easy_perform has unwound
        ctx->error = std::current_exception();
        return 0;
    }
    ctx->bytes += total;
    return total;
}

int progress_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<TransferContext*>(userdata);
    return ctx->st->stop_requested() ? 1 : 0;
}

} // namespace

ErrorClass classify_curl_code(const int code) noexcept {
    switch (static_cast<CURLcode>(code)) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_TOO_MANY_REDIRECTS:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_LOGIN_DENIED:
            return ErrorClass::Permanent;
        default:
            return ErrorClass::Transient;
    }
}

CurlHttpClient::CurlHttpClient() {
    static std::once_flag init_flag;
    std::call_once(init_flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

FetchResponse CurlHttpClient::fetch(const FetchRequest& request,
                                    const ByteSink& sink,
                                    const std::stop_token& st) {
    if (st.stop_requested()) throw OperationCancelled();

    CurlHandle c;
    HeaderList headers;
    for (const auto& line : request.headers) {
        headers.append(line);
    }

    TransferContext ctx{&sink, &st, nullptr, 0};

    curl_easy_setopt(c.h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c.h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(c.h, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(c.h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.stall_timeout.count()));
    if (!request.user_agent.empty()) {
        curl_easy_setopt(c.h, CURLOPT_USERAGENT, request.user_agent.c_str());
    }
    if (!request.referer.empty()) {
        curl_easy_setopt(c.h, CURLOPT_REFERER, request.referer.c_str());
    }
    if (headers.list) {
        curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
    }
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(c.h, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(c.h, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(c.h, CURLOPT_NOPROGRESS, 0L);

    Logger::log(LogLevel::Debug, "GET " + request.url, client_tag());
    const CURLcode code = curl_easy_perform(c.h);

    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }
    if (st.stop_requested() || code == CURLE_ABORTED_BY_CALLBACK) {
        throw OperationCancelled();
    }

    FetchResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);

    if (code == CURLE_HTTP_RETURNED_ERROR) {
        throw TransferError(classify_http_status(resp.status),
                            "HTTP " + std::to_string(resp.status) + " for " + request.url,
                            resp.status);
    }
    if (code != CURLE_OK) {
        throw TransferError(classify_curl_code(code),
                            std::string(curl_easy_strerror(code)) + " (" + request.url + ")");
    }

    const char* content_type = nullptr;
    if (curl_easy_getinfo(c.h, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        resp.content_type = content_type;
    }
    const char* effective_url = nullptr;
    if (curl_easy_getinfo(c.h, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK && effective_url) {
        resp.effective_url = effective_url;
    } else {
        resp.effective_url = request.url;
    }
    resp.bytes = ctx.bytes;

    Logger::log(LogLevel::Debug,
                "HTTP " + std::to_string(resp.status) + " " + std::to_string(resp.bytes) + " bytes from " + resp.effective_url,
                client_tag());
    return resp;
}

} // namespace trawl
