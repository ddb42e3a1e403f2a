//
// Created by Giuseppe Francione on 20/03/26.
//

#include "../libtrawl/include/errors.hpp"
#include "../libtrawl/include/hls_playlist.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace trawl;
using ::testing::ElementsAre;

TEST(HlsPlaylist, ParsesMediaPlaylistWithRelativeSegments) {
    const std::string text =
        "#EXTM3U\n"
        "#EXT-X-VERSION:3\n"
        "#EXT-X-TARGETDURATION:6\n"
        "#EXTINF:6.0,\n"
        "seg0.ts\n"
        "#EXTINF:6.0,\n"
        "/abs/seg1.ts\n"
        "#EXTINF:4.2,\n"
        "https://other.test/seg2.ts?token=1\n"
        "#EXT-X-ENDLIST\n";

    const auto playlist = parse_hls_playlist(text, "https://cdn.test/videos/720p/index.m3u8");
    EXPECT_FALSE(playlist.is_master);
    EXPECT_FALSE(playlist.encrypted);
    EXPECT_TRUE(playlist.init_segment.empty());
    EXPECT_THAT(playlist.segments, ElementsAre(
        "https://cdn.test/videos/720p/seg0.ts",
        "https://cdn.test/abs/seg1.ts",
        "https://other.test/seg2.ts?token=1"));
}

TEST(HlsPlaylist, MasterPlaylistPicksHighestBandwidth) {
    const std::string text =
        "#EXTM3U\r\n"
        "#EXT-X-STREAM-INF:BANDWIDTH=800000,RESOLUTION=640x360\r\n"
        "low/index.m3u8\r\n"
        "#EXT-X-STREAM-INF:CODECS=\"avc1.4d401f,mp4a.40.2\",BANDWIDTH=2500000\r\n"
        "high/index.m3u8\r\n"
        "#EXT-X-STREAM-INF:BANDWIDTH=1200000\r\n"
        "mid/index.m3u8\r\n";

    const auto playlist = parse_hls_playlist(text, "https://cdn.test/master.m3u8");
    ASSERT_TRUE(playlist.is_master);
    ASSERT_EQ(playlist.variants.size(), 3u);
    EXPECT_TRUE(playlist.segments.empty());
    EXPECT_EQ(playlist.best_variant().uri, "https://cdn.test/high/index.m3u8");
    EXPECT_EQ(playlist.best_variant().bandwidth, 2500000u);
}

TEST(HlsPlaylist, DetectsEncryption) {
    const std::string text =
        "#EXTM3U\n"
        "#EXT-X-KEY:METHOD=AES-128,URI=\"key.bin\"\n"
        "#EXTINF:6,\n"
        "seg0.ts\n";
    const auto playlist = parse_hls_playlist(text, "https://cdn.test/v/index.m3u8");
    EXPECT_TRUE(playlist.encrypted);
    EXPECT_EQ(playlist.key_method, "AES-128");
}

TEST(HlsPlaylist, MethodNoneIsNotEncryption) {
    const std::string text =
        "#EXTM3U\n"
        "#EXT-X-KEY:METHOD=NONE\n"
        "#EXTINF:6,\n"
        "seg0.ts\n";
    EXPECT_FALSE(parse_hls_playlist(text, "https://cdn.test/v/index.m3u8").encrypted);
}

TEST(HlsPlaylist, ReadsInitSegment) {
    const std::string text =
        "#EXTM3U\n"
        "#EXT-X-MAP:URI=\"init.mp4\"\n"
        "#EXTINF:6,\n"
        "seg0.m4s\n";
    const auto playlist = parse_hls_playlist(text, "https://cdn.test/v/index.m3u8");
    EXPECT_EQ(playlist.init_segment, "https://cdn.test/v/init.mp4");
    EXPECT_THAT(playlist.segments, ElementsAre("https://cdn.test/v/seg0.m4s"));
}

TEST(HlsPlaylist, RejectsNonPlaylists) {
    EXPECT_THROW((void) parse_hls_playlist("<html></html>", "https://cdn.test/x"), TransferError);
    EXPECT_THROW((void) parse_hls_playlist("", "https://cdn.test/x"), TransferError);
    EXPECT_THROW((void) parse_hls_playlist("#EXTM3U\n#EXT-X-ENDLIST\n", "https://cdn.test/x"), TransferError);
}

TEST(HlsPlaylist, RejectionIsPermanent) {
    try {
        (void) parse_hls_playlist("not a playlist", "https://cdn.test/x");
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.error_class(), ErrorClass::Permanent);
    }
}

TEST(HlsPlaylist, ResolveUrl) {
    EXPECT_EQ(resolve_url("https://a.test/x/y/list.m3u8", "../z.ts"), "https://a.test/x/z.ts");
    EXPECT_EQ(resolve_url("https://a.test/x/list.m3u8", "https://b.test/s.ts"), "https://b.test/s.ts");
}
