//
// Created by Giuseppe Francione on 24/03/26.
//

#include "../libtrawl/include/media_type.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>

using namespace trawl;
using trawl::test::TempDir;
using trawl::test::write_file;

TEST(MediaType, UrlExtensionIgnoresQueryAndFragment) {
    EXPECT_EQ(url_extension("https://cdn.test/v/index.M3U8?token=a.b"), ".m3u8");
    EXPECT_EQ(url_extension("https://cdn.test/v/clip.mp4#t=10"), ".mp4");
    EXPECT_EQ(url_extension("https://cdn.test.example/"), "");
    EXPECT_EQ(url_extension("https://cdn.test/watch"), "");
}

TEST(MediaType, MimeLookupIgnoresParameters) {
    EXPECT_EQ(format_from_mime("video/MP2T"), MediaFormat::MpegTs);
    EXPECT_EQ(format_from_mime("text/html; charset=utf-8"), MediaFormat::Html);
    EXPECT_EQ(format_from_mime("application/x-mpegURL"), MediaFormat::HlsPlaylist);
    EXPECT_FALSE(format_from_mime("application/octet-stream").has_value());
}

TEST(MediaType, RemuxAndStorage) {
    EXPECT_TRUE(needs_remux(MediaFormat::MpegTs));
    EXPECT_FALSE(needs_remux(MediaFormat::Mp4));
    EXPECT_FALSE(needs_remux(MediaFormat::Matroska));
    EXPECT_FALSE(is_storable(MediaFormat::Html));
    EXPECT_FALSE(is_storable(MediaFormat::Unknown));
    EXPECT_EQ(output_extension(MediaFormat::MpegTs), ".mp4");
    EXPECT_EQ(output_extension(MediaFormat::WebM), ".webm");
}

TEST(MediaType, PlaylistHeaderWinsOverContentType) {
    const TempDir dir;
    write_file(dir / "raw", "#EXTM3U\n#EXTINF:4,\na.ts\n");
    EXPECT_EQ(sniff_media_format(dir / "raw", "application/octet-stream", "https://cdn.test/x"),
              MediaFormat::HlsPlaylist);
}

TEST(MediaType, FallsBackToContentTypeThenUrl) {
    const TempDir dir;
    write_file(dir / "raw", "opaque bytes");
    EXPECT_EQ(sniff_media_format(dir / "raw", "video/mp2t", "https://cdn.test/x"), MediaFormat::MpegTs);
    EXPECT_EQ(sniff_media_format(dir / "raw", "application/octet-stream", "https://cdn.test/x.webm"),
              MediaFormat::WebM);
    EXPECT_EQ(sniff_media_format(dir / "raw", "", "https://cdn.test/x"), MediaFormat::Unknown);
}
