//
// Created by Giuseppe Francione on 10/03/26.
//

#include "../../include/job_executor.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/hls_playlist.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/sleep_utils.hpp"
#include <cerrno>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace trawl {

namespace {

constexpr const char* kTag = "JobExecutor";

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

std::error_code last_errno() {
    return {errno != 0 ? errno : EIO, std::generic_category()};
}

// an output we may not replace fails the job before any request is made
void ensure_output_free(const Job& job) {
    std::error_code ec;
    if (!job.allow_overwrite && fs::exists(job.output_path, ec)) {
        throw TransferError(ErrorClass::Permanent, "Output already exists: " + job.output_path.string());
    }
}

} // namespace

JobExecutor::JobExecutor(const OutputIndex& index,
                         RateGovernor& governor,
                         CadenceGuard& cadence,
                         IHttpClient& http,
                         IRemuxer& remuxer,
                         EventBus& bus,
                         ExecutorOptions options)
    : index_(index),
      governor_(governor),
      cadence_(cadence),
      http_(http),
      remuxer_(remuxer),
      bus_(bus),
      options_(std::move(options)) {}

JobOutcome JobExecutor::execute(const Job& job, const std::stop_token& st) {
    const auto start = std::chrono::steady_clock::now();
    JobOutcome outcome;
    outcome.job = job;

    if (job.skip_if_exists && index_.contains(job.logical_name())) {
        outcome.kind = OutcomeKind::Skipped;
        outcome.reason = "already exists";
        Logger::log(LogLevel::Debug, "Skipping " + job.logical_name() + ": output already present", kTag);
        bus_.publish(JobSkippedEvent{job.output_path, outcome.reason});
        return outcome;
    }

    bus_.publish(JobStartEvent{job.url, job.output_path});

    const auto cancelled = [&] {
        outcome.kind = OutcomeKind::Cancelled;
        outcome.reason = "cancelled";
        outcome.duration = elapsed_since(start);
        Logger::log(LogLevel::Debug, "Cancelled " + job.output_path.filename().string(), kTag);
        bus_.publish(JobCancelledEvent{job.output_path});
        return outcome;
    };

    const ScopedTempFile raw(job.output_path, "raw");
    const ScopedTempFile muxed(job.output_path, "mux");
    bool have_raw = false;
    MediaFormat format = MediaFormat::Unknown;

    for (unsigned attempt = 1;; ++attempt) {
        outcome.attempts = attempt;
        std::optional<ErrorClass> error;
        std::string reason;

        try {
            if (st.stop_requested()) throw OperationCancelled();
            ensure_output_free(job);

            if (!have_raw) {
                format = download(job, raw.path(), st);
                have_raw = true;
            }

            fs::path source = raw.path();
            if (needs_remux(format)) {
                remuxer_.remux(raw.path(), muxed.path(), st);
                source = muxed.path();
            }
            outcome.bytes = commit(job, source);
        } catch (const OperationCancelled&) {
            return cancelled();
        } catch (const TransferError& e) {
            error = e.error_class();
            reason = e.what();
        } catch (const RemuxError& e) {
            error = ErrorClass::Transient;
            reason = std::string("remux failed: ") + e.what();
            if (options_.remux_policy == RemuxRetryPolicy::Refetch) {
                have_raw = false;
            }
        } catch (const fs::filesystem_error& e) {
            error = classify_filesystem_error(e.code());
            reason = e.what();
        }

        // a failed step may have raced a stop request, report it as such
        if (error && st.stop_requested()) {
            return cancelled();
        }

        const AttemptState state = next_state(error, attempt, job.retry_budget);
        Logger::log(LogLevel::Debug,
                    job.output_path.filename().string() + " attempt " + std::to_string(attempt) + ": " +
                        std::string(to_string(state)) + (reason.empty() ? "" : " (" + reason + ")"),
                    kTag);

        switch (state) {
            case AttemptState::Succeeded:
                outcome.kind = OutcomeKind::Completed;
                outcome.duration = elapsed_since(start);
                bus_.publish(JobCompleteEvent{job.output_path, outcome.bytes, attempt, outcome.duration});
                return outcome;

            case AttemptState::BackingOff: {
                const auto delay = backoff_delay(attempt, options_.backoff_base, options_.backoff_cap);
                Logger::log(LogLevel::Warning,
                            job.output_path.filename().string() + ": " + reason + ", retrying in " +
                                std::to_string(delay.count()) + " ms",
                            kTag);
                bus_.publish(JobRetryEvent{job.output_path, attempt, delay, reason});
                if (!interruptible_sleep(delay, st)) {
                    return cancelled();
                }
                break;
            }

            case AttemptState::FailedTransient:
            case AttemptState::FailedPermanent: {
                const bool fatal = error == ErrorClass::Fatal;
                outcome.kind = fatal ? OutcomeKind::Fatal : OutcomeKind::Failed;
                outcome.reason = reason;
                outcome.duration = elapsed_since(start);
                Logger::log(fatal ? LogLevel::Error : LogLevel::Warning,
                            job.output_path.filename().string() + " failed after " + std::to_string(attempt) +
                                " attempt(s): " + reason,
                            kTag);
                bus_.publish(JobFailedEvent{job.output_path, reason, attempt, fatal});
                return outcome;
            }

            case AttemptState::Attempting:
                break;
        }
    }
}

FetchResponse JobExecutor::fetch_to_file(const Job& job,
                                         const std::string& url,
                                         const fs::path& path,
                                         const char* mode,
                                         const std::stop_token& st) {
    cadence_.before_request(st);

    const FilePtr out(open_file(path, mode));
    if (!out) {
        throw_io_error(last_errno(), "Failed to open " + path.string());
    }

    ByteSink write = [&out, &path](const std::span<const char> chunk) {
        if (std::fwrite(chunk.data(), 1, chunk.size(), out.get()) != chunk.size()) {
            throw_io_error(last_errno(), "Failed to write " + path.string());
        }
    };
    const ByteSink metered = make_metered_sink(governor_, std::move(write), st);

    FetchRequest request;
    request.url = url;
    request.referer = job.referer;
    request.headers = job.headers;
    request.user_agent = options_.user_agent;
    request.connect_timeout = options_.connect_timeout;
    request.stall_timeout = options_.stall_timeout;

    FetchResponse response = http_.fetch(request, metered, st);
    if (std::fflush(out.get()) != 0) {
        throw_io_error(last_errno(), "Failed to flush " + path.string());
    }
    if (response.effective_url.empty()) {
        response.effective_url = url;
    }
    return response;
}

MediaFormat JobExecutor::download(const Job& job, const fs::path& raw, const std::stop_token& st) {
    const FetchResponse response = fetch_to_file(job, job.url, raw, "wb", st);
    if (response.bytes == 0) {
        throw TransferError(ErrorClass::Transient, "Empty response body from " + job.url);
    }

    const MediaFormat format = sniff_media_format(raw, response.content_type, response.effective_url);
    switch (format) {
        case MediaFormat::Html:
            throw TransferError(ErrorClass::Permanent, "Unsupported content: got an HTML page from " + job.url);
        case MediaFormat::Unknown:
            throw TransferError(ErrorClass::Permanent, "Unsupported content type from " + job.url);
        case MediaFormat::HlsPlaylist:
            return download_hls(job, raw, response.effective_url, st);
        default:
            return format;
    }
}

MediaFormat JobExecutor::download_hls(const Job& job,
                                      const fs::path& raw,
                                      const std::string& playlist_url,
                                      const std::stop_token& st) {
    HlsPlaylist playlist = parse_hls_playlist(read_text_file(raw), playlist_url);

    if (playlist.is_master) {
        const HlsVariant variant = playlist.best_variant();
        Logger::log(LogLevel::Debug,
                    "Selected variant " + variant.uri + " (" + std::to_string(variant.bandwidth) + " bps)",
                    kTag);
        const FetchResponse response = fetch_to_file(job, variant.uri, raw, "wb", st);
        playlist = parse_hls_playlist(read_text_file(raw), response.effective_url);
        if (playlist.is_master) {
            throw TransferError(ErrorClass::Permanent, "Nested master playlist at " + variant.uri);
        }
    }

    if (playlist.encrypted) {
        throw TransferError(ErrorClass::Permanent,
                            "Encrypted HLS stream (" + playlist.key_method + ") is not supported");
    }

    const char* mode = "wb";
    if (!playlist.init_segment.empty()) {
        fetch_to_file(job, playlist.init_segment, raw, mode, st);
        mode = "ab";
    }
    for (const auto& segment : playlist.segments) {
        fetch_to_file(job, segment, raw, mode, st);
        mode = "ab";
    }

    std::error_code ec;
    if (fs::file_size(raw, ec) == 0 || ec) {
        throw TransferError(ErrorClass::Transient, "HLS segments were empty for " + job.url);
    }

    Logger::log(LogLevel::Debug,
                "Assembled " + std::to_string(playlist.segments.size()) + " segments for " +
                    job.output_path.filename().string(),
                kTag);

    if (const auto detected = format_from_mime(MimeDetector::detect(raw));
        detected && is_storable(*detected) && *detected != MediaFormat::HlsPlaylist) {
        return *detected;
    }
    return playlist.init_segment.empty() ? MediaFormat::MpegTs : MediaFormat::Mp4;
}

std::uintmax_t JobExecutor::commit(const Job& job, const fs::path& source) {
    // the output may have appeared while this job was downloading
    ensure_output_free(job);

    std::error_code ec;
    fs::rename(source, job.output_path, ec);
    if (ec) {
        throw_io_error(ec, "Failed to commit " + job.output_path.string());
    }

    const auto size = fs::file_size(job.output_path, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Can't stat committed file " + job.output_path.string(), kTag);
        return 0;
    }
    Logger::log(LogLevel::Info, "Saved " + job.output_path.filename().string(), kTag);
    return size;
}

} // namespace trawl
