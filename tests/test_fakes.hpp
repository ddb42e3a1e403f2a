//
// Created by Giuseppe Francione on 19/03/26.
//

#ifndef TRAWL_TEST_FAKES_HPP
#define TRAWL_TEST_FAKES_HPP

#include "../libtrawl/include/errors.hpp"
#include "../libtrawl/include/file_utils.hpp"
#include "../libtrawl/include/http_client.hpp"
#include "../libtrawl/include/random_utils.hpp"
#include "../libtrawl/include/remuxer.hpp"
#include "../libtrawl/include/sleep_utils.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace trawl::test {

namespace fs = std::filesystem;

/**
 * @brief Fresh directory under the system temp dir, removed with its content.
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() / ("trawl_test_" + RandomUtils::random_suffix())) {
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }
    [[nodiscard]] fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/// Names of the hidden temporary files left in @p dir.
inline std::vector<std::string> temp_files_in(const fs::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (is_temp_path(entry.path())) names.push_back(entry.path().filename().string());
    }
    return names;
}

/**
 * @brief Scripted IHttpClient.
 *
 * Each URL maps to a list of replies consumed one per request; the last
 * reply repeats. Unknown URLs answer 404.
 */
class FakeHttpClient final : public IHttpClient {
public:
    struct Reply {
        std::string body;
        std::string content_type = "video/mp4";
        std::optional<ErrorClass> error;   ///< Throw instead of answering
        std::string error_message = "simulated failure";
        long status = 200;
        std::chrono::milliseconds delay{0}; ///< Interruptible latency before the body
    };

    static Reply ok(std::string body, std::string content_type = "video/mp4") {
        Reply r;
        r.body = std::move(body);
        r.content_type = std::move(content_type);
        return r;
    }

    static Reply fail(const ErrorClass cls, const long status = 0, std::string message = "simulated failure") {
        Reply r;
        r.error = cls;
        r.status = status;
        r.error_message = std::move(message);
        return r;
    }

    void route(const std::string& url, std::vector<Reply> replies) {
        std::lock_guard lock(mtx_);
        routes_[url] = std::move(replies);
        served_[url] = 0;
    }

    void route(const std::string& url, Reply reply) {
        route(url, std::vector<Reply>{std::move(reply)});
    }

    /// Body chunk size delivered to the sink.
    std::size_t chunk_size = 4;

    FetchResponse fetch(const FetchRequest& request,
                        const ByteSink& sink,
                        const std::stop_token& st) override {
        if (st.stop_requested()) throw OperationCancelled();
        ++calls_;

        Reply reply;
        {
            std::lock_guard lock(mtx_);
            requests_.push_back(request);
            const auto it = routes_.find(request.url);
            if (it == routes_.end() || it->second.empty()) {
                reply = fail(ErrorClass::Permanent, 404, "HTTP 404 for " + request.url);
            } else {
                auto& served = served_[request.url];
                reply = it->second[std::min(served, it->second.size() - 1)];
                ++served;
            }
        }

        if (reply.delay.count() > 0 && !interruptible_sleep(reply.delay, st)) {
            throw OperationCancelled();
        }
        if (reply.error) {
            throw TransferError(*reply.error, reply.error_message, reply.status);
        }

        for (std::size_t pos = 0; pos < reply.body.size(); pos += chunk_size) {
            const auto n = std::min(chunk_size, reply.body.size() - pos);
            sink(std::span<const char>(reply.body.data() + pos, n));
        }

        FetchResponse response;
        response.status = reply.status;
        response.content_type = reply.content_type;
        response.effective_url = request.url;
        response.bytes = reply.body.size();
        return response;
    }

    [[nodiscard]] unsigned calls() const { return calls_.load(); }

    [[nodiscard]] std::vector<FetchRequest> requests() const {
        std::lock_guard lock(mtx_);
        return requests_;
    }

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::vector<Reply>> routes_;
    std::map<std::string, std::size_t> served_;
    std::vector<FetchRequest> requests_;
    std::atomic<unsigned> calls_{0};
};

/**
 * @brief IRemuxer that copies its input, failing the first @c fail_first calls.
 *
 * Failures throw RemuxError, or a TransferError of @c fail_class when set.
 */
class FakeRemuxer final : public IRemuxer {
public:
    unsigned fail_first = 0;
    std::optional<ErrorClass> fail_class;

    void remux(const fs::path& input, const fs::path& output, const std::stop_token& st) override {
        if (st.stop_requested()) throw OperationCancelled();
        const unsigned n = ++calls_;
        {
            std::lock_guard lock(mtx_);
            inputs_seen_.push_back(read_file(input));
        }
        if (n <= fail_first) {
            write_file(output, "partial");
            if (fail_class) {
                throw TransferError(*fail_class, "Failed to write packet: No space left on device");
            }
            throw RemuxError("corrupt stream");
        }
        fs::copy_file(input, output, fs::copy_options::overwrite_existing);
    }

    [[nodiscard]] unsigned calls() const { return calls_.load(); }

    /// Content of the input file at every call (single-threaded tests only).
    [[nodiscard]] const std::vector<std::string>& inputs_seen() const { return inputs_seen_; }

private:
    std::atomic<unsigned> calls_{0};
    std::mutex mtx_;
    std::vector<std::string> inputs_seen_;
};

} // namespace trawl::test

#endif // TRAWL_TEST_FAKES_HPP
