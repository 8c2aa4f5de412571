#include <chrono>
#include <gtest/gtest.h>
#include "progress_parser.hpp"

using namespace std::chrono_literals;

namespace {

const auto kStart = std::chrono::steady_clock::time_point{} + 1h;

} // namespace

TEST(progress_parser_test, parses_rsync_meter_line) {
    ProgressParser parser(ParserGrammar::rsync(), 10, 0ms);
    EXPECT_FALSE(parser.feed("DCIM/100CANON/IMG_0001.JPG", kStart));

    auto update = parser.feed("    123,456,789  42%   12.34MB/s    0:01:23 (xfr#4, to-chk=6/10)", kStart);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->percent, 42);
    EXPECT_EQ(update->speed, "12.34MB/s");
    EXPECT_EQ(update->eta, "0:01:23");
    EXPECT_EQ(update->filesTotal, 10u);
    EXPECT_EQ(update->filesDone, 4u);
    EXPECT_EQ(update->currentFile, "DCIM/100CANON/IMG_0001.JPG");
}

TEST(progress_parser_test, rate_limits_emissions) {
    ProgressParser parser(ParserGrammar::rsync(), 100, 1000ms);
    EXPECT_TRUE(parser.feed("  10 10%  1.00MB/s 0:00:10", kStart));
    EXPECT_FALSE(parser.feed("  20 20%  1.00MB/s 0:00:09", kStart + 500ms));

    auto update = parser.feed("  30 30%  1.00MB/s 0:00:08", kStart + 1000ms);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->percent, 30);
}

TEST(progress_parser_test, percent_never_decreases) {
    ProgressParser parser(ParserGrammar::rsync(), 10, 0ms);
    ASSERT_TRUE(parser.feed("  500 50%  1.00MB/s 0:00:10", kStart));

    auto update = parser.feed("  300 30%  1.00MB/s 0:00:20", kStart + 1s);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->percent, 50);
}

TEST(progress_parser_test, clamps_percent_above_hundred) {
    ProgressParser parser(ParserGrammar::rsync(), 4, 0ms);
    auto update = parser.feed("  999 140%", kStart);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->percent, 100);
    EXPECT_EQ(update->filesDone, 4u);
}

TEST(progress_parser_test, banners_are_not_file_names) {
    ProgressParser parser(ParserGrammar::rsync(), 1, 0ms);
    parser.feed("photo.jpg", kStart);
    parser.feed("sending incremental file list", kStart);
    parser.feed("sent 1,024 bytes  received 35 bytes", kStart);
    parser.feed("total size is 1,024  speedup is 0.97", kStart);
    parser.feed("   indented continuation", kStart);
    parser.feed("", kStart);
    auto update = parser.feed("  1,024 100%  1.00MB/s 0:00:00", kStart);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->currentFile, "photo.jpg");
}

TEST(progress_parser_test, missing_fields_use_placeholder) {
    ProgressParser parser(ParserGrammar::rsync(), 2, 0ms);
    auto update = parser.feed("  50%", kStart);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->speed, "--");
    EXPECT_EQ(update->eta, "--");
    EXPECT_EQ(update->currentFile, "");
}

TEST(progress_parser_test, parses_rclone_stats_line) {
    ProgressParser parser(ParserGrammar::rclone(), 8, 0ms);
    parser.feed("INFO  : holiday/beach.mp4: Copied (new)", kStart);
    auto update = parser.feed("        3 / 8 files, 37%, 2.500 MiB/s, ETA 1m30s", kStart);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->percent, 37);
    EXPECT_EQ(update->speed, "2.500 MiB/s");
    EXPECT_EQ(update->eta, "1m30s");
    EXPECT_EQ(update->filesDone, 2u);
    EXPECT_EQ(update->currentFile, "INFO  : holiday/beach.mp4: Copied (new)");
}
