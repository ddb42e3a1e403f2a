//
// Created by Giuseppe Francione on 09/03/26.
//

#include "../../include/remuxer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
}
#include <new>
#include <string>
#include <system_error>
#include <vector>

namespace trawl {

namespace {

std::string av_err(const int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

int interrupt_cb(void* opaque) {
    return static_cast<const std::stop_token*>(opaque)->stop_requested() ? 1 : 0;
}

// owns every libav object of one remux, released in reverse order on any exit path
struct RemuxContext {
    AVFormatContext* in = nullptr;
    AVFormatContext* out = nullptr;
    AVPacket* pkt = nullptr;

    ~RemuxContext() {
        if (pkt) av_packet_free(&pkt);
        if (out) {
            if (out->pb && !(out->oformat->flags & AVFMT_NOFILE)) avio_closep(&out->pb);
            avformat_free_context(out);
        }
        if (in) avformat_close_input(&in);
    }
};

[[noreturn]] void fail(const std::stop_token& st, const std::string& what, const int err) {
    if (st.stop_requested() || err == AVERROR_EXIT) {
        throw OperationCancelled();
    }
    // libav reports OS failures as negated errno; out of space and the like stop the run
    if (err < 0) {
        const std::error_code ec(AVUNERROR(err), std::generic_category());
        if (const ErrorClass cls = classify_filesystem_error(ec); cls == ErrorClass::Fatal) {
            throw TransferError(cls, what + ": " + av_err(err));
        }
    }
    throw RemuxError(what + ": " + av_err(err));
}

} // namespace

void AvRemuxer::remux(const std::filesystem::path& input,
                      const std::filesystem::path& output,
                      const std::stop_token& st) {
    Logger::log(LogLevel::Debug, "Remuxing " + input.filename().string() + " to MP4", "AvRemuxer");

    RemuxContext ctx;
    const AVIOInterruptCB interrupt{interrupt_cb, const_cast<std::stop_token*>(&st)};

    ctx.in = avformat_alloc_context();
    if (!ctx.in) throw std::bad_alloc();
    ctx.in->interrupt_callback = interrupt;

    int ret = avformat_open_input(&ctx.in, input.string().c_str(), nullptr, nullptr);
    if (ret < 0) fail(st, "Failed to open input", ret);

    ret = avformat_find_stream_info(ctx.in, nullptr);
    if (ret < 0) fail(st, "Failed to read stream info", ret);

    ret = avformat_alloc_output_context2(&ctx.out, nullptr, "mp4", output.string().c_str());
    if (ret < 0 || !ctx.out) fail(st, "Failed to create MP4 muxer", ret < 0 ? ret : AVERROR(ENOMEM));
    ctx.out->interrupt_callback = interrupt;

    // input stream index -> output stream index, -1 when dropped
    std::vector<int> stream_map(ctx.in->nb_streams, -1);
    int out_streams = 0;
    for (unsigned i = 0; i < ctx.in->nb_streams; ++i) {
        const AVStream* in_stream = ctx.in->streams[i];
        const auto type = in_stream->codecpar->codec_type;
        if (type != AVMEDIA_TYPE_AUDIO && type != AVMEDIA_TYPE_VIDEO) {
            continue;
        }
        AVStream* out_stream = avformat_new_stream(ctx.out, nullptr);
        if (!out_stream) throw std::bad_alloc();
        ret = avcodec_parameters_copy(out_stream->codecpar, in_stream->codecpar);
        if (ret < 0) fail(st, "Failed to copy codec parameters", ret);
        // let the mp4 muxer choose its own tag, ts tags are not valid in mp4
        out_stream->codecpar->codec_tag = 0;
        out_stream->time_base = in_stream->time_base;
        stream_map[i] = out_streams++;
    }
    if (out_streams == 0) {
        throw RemuxError("No audio or video streams in " + input.filename().string());
    }

    if (!(ctx.out->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open2(&ctx.out->pb, output.string().c_str(), AVIO_FLAG_WRITE, &ctx.out->interrupt_callback, nullptr);
        if (ret < 0) fail(st, "Failed to open output", ret);
    }

    ret = avformat_write_header(ctx.out, nullptr);
    if (ret < 0) fail(st, "Failed to write MP4 header", ret);

    ctx.pkt = av_packet_alloc();
    if (!ctx.pkt) throw std::bad_alloc();

    while (true) {
        if (st.stop_requested()) throw OperationCancelled();

        ret = av_read_frame(ctx.in, ctx.pkt);
        if (ret == AVERROR_EOF) break;
        if (ret < 0) fail(st, "Failed to read packet", ret);

        const int mapped = ctx.pkt->stream_index >= 0 &&
                           static_cast<unsigned>(ctx.pkt->stream_index) < stream_map.size()
                               ? stream_map[ctx.pkt->stream_index]
                               : -1;
        if (mapped < 0) {
            av_packet_unref(ctx.pkt);
            continue;
        }

        const AVStream* in_stream = ctx.in->streams[ctx.pkt->stream_index];
        const AVStream* out_stream = ctx.out->streams[mapped];
        ctx.pkt->stream_index = mapped;
        av_packet_rescale_ts(ctx.pkt, in_stream->time_base, out_stream->time_base);
        ctx.pkt->pos = -1;

        ret = av_interleaved_write_frame(ctx.out, ctx.pkt);
        av_packet_unref(ctx.pkt);
        if (ret < 0) fail(st, "Failed to write packet", ret);
    }

    ret = av_write_trailer(ctx.out);
    if (ret < 0) fail(st, "Failed to write MP4 trailer", ret);

    Logger::log(LogLevel::Debug,
                "Remuxed " + std::to_string(out_streams) + " streams into " + output.filename().string(),
                "AvRemuxer");
}

} // namespace trawl
