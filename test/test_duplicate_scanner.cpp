#include <algorithm>
#include <gtest/gtest.h>
#include "duplicate_scanner.hpp"
#include "test_utils.hpp"

TEST(duplicate_scanner_test, inventories_source) {
    TempDir dir;
    write_file(dir.path() / "usb/DCIM/a.jpg", "aaaa");
    write_file(dir.path() / "usb/DCIM/b.jpg", "bb");
    write_file(dir.path() / "usb/DCIM/c.JPG", "c");
    write_file(dir.path() / "usb/video/clip.mp4", "0123456789");
    write_file(dir.path() / "usb/notes/README", "r");
    write_file(dir.path() / "usb/notes/archive.verylongextension", "x");

    auto inventory = scanSource(dir.str("usb"));
    ASSERT_TRUE(inventory);
    EXPECT_EQ(inventory->fileCount, 6u);
    EXPECT_EQ(inventory->totalBytes, 19u);
    ASSERT_EQ(inventory->files.size(), 6u);
    EXPECT_TRUE(std::is_sorted(inventory->files.begin(), inventory->files.end()));
    EXPECT_EQ(inventory->files.front(), "DCIM/a.jpg");

    ASSERT_EQ(inventory->fileTypes.size(), 3u);
    EXPECT_EQ(inventory->fileTypes[0], (std::pair<std::string, std::size_t>{"jpg", 2}));
    // Count ties are ranked by name
    EXPECT_EQ(inventory->fileTypes[1].first, "JPG");
    EXPECT_EQ(inventory->fileTypes[2].first, "mp4");
}

TEST(duplicate_scanner_test, limits_histogram_to_top_n) {
    TempDir dir;
    for (const char* name : {"a.aa", "b.bb", "c.cc", "d.dd"}) {
        write_file(dir.path() / "usb" / name, "x");
    }
    auto inventory = scanSource(dir.str("usb"), 2);
    ASSERT_TRUE(inventory);
    ASSERT_EQ(inventory->fileTypes.size(), 2u);
    EXPECT_EQ(inventory->fileTypes[0].first, "aa");
    EXPECT_EQ(inventory->fileTypes[1].first, "bb");
}

TEST(duplicate_scanner_test, missing_source_is_an_error) {
    TempDir dir;
    EXPECT_FALSE(scanSource(dir.str("nowhere")));
    EXPECT_EQ(countFiles(dir.str("nowhere")), 0u);
}

TEST(duplicate_scanner_test, matches_by_file_name_anywhere_on_destination) {
    TempDir dir;
    write_file(dir.path() / "usb/DCIM/a.jpg", "1");
    write_file(dir.path() / "usb/DCIM/b.jpg", "2");
    write_file(dir.path() / "usb/c.txt", "3");
    write_file(dir.path() / "dest/OLD_20240101_120000/DCIM/a.jpg", "1");
    write_file(dir.path() / "dest/other/c.txt", "different content");

    auto inventory = scanSource(dir.str("usb"));
    ASSERT_TRUE(inventory);
    DuplicateScanner scanner(dir.str("dest"));
    DuplicateReport report = scanner.scan(*inventory);

    EXPECT_EQ(report.existingCount, 2u);
    EXPECT_EQ(report.duplicateFiles, (std::vector<std::string>{"DCIM/a.jpg", "c.txt"}));
    EXPECT_EQ(report.newFiles, (std::vector<std::string>{"DCIM/b.jpg"}));
}

TEST(duplicate_scanner_test, missing_destination_has_no_duplicates) {
    TempDir dir;
    write_file(dir.path() / "usb/a.jpg", "1");
    auto inventory = scanSource(dir.str("usb"));
    ASSERT_TRUE(inventory);

    DuplicateReport report = DuplicateScanner(dir.str("dest")).scan(*inventory);
    EXPECT_EQ(report.existingCount, 0u);
    EXPECT_EQ(report.newFiles.size(), 1u);
}
