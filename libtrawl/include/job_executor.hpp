//
// Created by Giuseppe Francione on 10/03/26.
//

/**
 * @file job_executor.hpp
 * @brief Runs one job from skip check to committed output.
 */

#ifndef TRAWL_JOB_EXECUTOR_HPP
#define TRAWL_JOB_EXECUTOR_HPP

#include "cadence_guard.hpp"
#include "event_bus.hpp"
#include "http_client.hpp"
#include "job.hpp"
#include "media_type.hpp"
#include "output_index.hpp"
#include "rate_governor.hpp"
#include "remuxer.hpp"
#include "retry_policy.hpp"
#include <chrono>
#include <filesystem>
#include <stop_token>
#include <string>

namespace trawl {

struct ExecutorOptions {
    std::string user_agent = "trawl/1.0";
    RemuxRetryPolicy remux_policy = RemuxRetryPolicy::RemuxOnly;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{30000};
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds stall_timeout{60};
};

/**
 * @brief Executes jobs against the shared run resources.
 *
 * @details One executor is shared by all workers; it holds no per-job
 * state, so execute() may run concurrently. Every collaborator is
 * borrowed and must outlive the executor.
 *
 * An attempt fetches the source into a hidden temporary file next to the
 * output, expands HLS playlists segment by segment, remuxes segmented
 * media into MP4 and finally renames the result onto the output path.
 * Every remote request passes the CadenceGuard and every received byte
 * the RateGovernor.
 */
class JobExecutor {
public:
    JobExecutor(const OutputIndex& index,
                RateGovernor& governor,
                CadenceGuard& cadence,
                IHttpClient& http,
                IRemuxer& remuxer,
                EventBus& bus,
                ExecutorOptions options = {});

    JobExecutor(const JobExecutor&) = delete;
    JobExecutor& operator=(const JobExecutor&) = delete;

    /**
     * @brief Runs @p job to a final outcome.
     *
     * Never throws for job-level failures: network, content, remux and
     * filesystem errors become Failed or Fatal outcomes, a stop request
     * becomes a Cancelled outcome. No temporary file survives any exit path.
     */
    [[nodiscard]] JobOutcome execute(const Job& job, const std::stop_token& st);

    [[nodiscard]] const ExecutorOptions& options() const noexcept { return options_; }

private:
    MediaFormat download(const Job& job, const std::filesystem::path& raw, const std::stop_token& st);
    MediaFormat download_hls(const Job& job, const std::filesystem::path& raw,
                             const std::string& playlist_url, const std::stop_token& st);
    FetchResponse fetch_to_file(const Job& job, const std::string& url,
                                const std::filesystem::path& path, const char* mode,
                                const std::stop_token& st);
    std::uintmax_t commit(const Job& job, const std::filesystem::path& source);

    const OutputIndex& index_;
    RateGovernor& governor_;
    CadenceGuard& cadence_;
    IHttpClient& http_;
    IRemuxer& remuxer_;
    EventBus& bus_;
    ExecutorOptions options_;
};

} // namespace trawl

#endif // TRAWL_JOB_EXECUTOR_HPP
