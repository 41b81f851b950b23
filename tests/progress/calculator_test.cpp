#include <gtest/gtest.h>
#include "sendme/progress/calculator.hpp"

using namespace sendme::progress;

TEST(Calculator, BytesProgress) {
    EXPECT_DOUBLE_EQ(bytes_progress(1000000, 2000000), 50.0);
    EXPECT_DOUBLE_EQ(bytes_progress(0, 100), 0.0);
    EXPECT_DOUBLE_EQ(bytes_progress(100, 100), 100.0);
}

TEST(Calculator, BytesProgressWithZeroTotalIsZero) {
    EXPECT_DOUBLE_EQ(bytes_progress(500, 0), 0.0);
    EXPECT_DOUBLE_EQ(bytes_progress(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(bytes_progress(10, -1), 0.0);
}

TEST(Calculator, BytesProgressIsNotClamped) {
    EXPECT_DOUBLE_EQ(bytes_progress(150, 100), 150.0);
}

TEST(Calculator, SpeedDividesRawUnitsByThousand) {
    EXPECT_DOUBLE_EQ(speed_bps(500000), 500.0);
    EXPECT_DOUBLE_EQ(speed_bps(0), 0.0);
    EXPECT_DOUBLE_EQ(speed_bps(1500), 1.5);
}

TEST(Calculator, FileCountProgressPassesPercentageThrough) {
    EXPECT_DOUBLE_EQ(file_count_progress(3, 10, 30), 30.0);
    EXPECT_DOUBLE_EQ(file_count_progress(3, 10, 99), 99.0);
    EXPECT_DOUBLE_EQ(file_count_progress(0, 0, 0), 0.0);
}

TEST(Calculator, Elapsed) {
    const auto start = std::chrono::system_clock::time_point{} + std::chrono::seconds(100);
    const auto end = start + std::chrono::milliseconds(2500);

    EXPECT_EQ(elapsed(start, end), std::chrono::milliseconds(2500));
    EXPECT_EQ(elapsed(std::nullopt, end), std::chrono::milliseconds(0));
}

TEST(Calculator, DisplayNameForEmptyListIsFallback) {
    EXPECT_EQ(display_name({}), "Downloaded File");
}

TEST(Calculator, DisplayNameForSinglePathIsLeaf) {
    EXPECT_EQ(display_name({"a/b/file.txt"}), "file.txt");
    EXPECT_EQ(display_name({"file.txt"}), "file.txt");
}

TEST(Calculator, DisplayNameForSinglePathWithTrailingSlashIsWholePath) {
    EXPECT_EQ(display_name({"folder/"}), "folder/");
}

TEST(Calculator, DisplayNameForSharedTopLevelDirectory) {
    EXPECT_EQ(display_name({"shared/x.txt", "shared/y.txt"}), "shared");
    EXPECT_EQ(display_name({"photos/2023/a.jpg", "photos/2024/b.jpg", "photos/c.jpg"}), "photos");
}

TEST(Calculator, DisplayNameForUnrelatedPathsIsCount) {
    EXPECT_EQ(display_name({"x.txt", "y.txt"}), "2 files");
    EXPECT_EQ(display_name({"a/x.txt", "b/y.txt", "a/z.txt"}), "3 files");
}

TEST(Calculator, DisplayNameRequiresEveryPathUnderTheDirectory) {
    // "shared" as a bare file does not make it a common directory
    EXPECT_EQ(display_name({"shared/x.txt", "shared"}), "2 files");
}

TEST(Calculator, LeafName) {
    EXPECT_EQ(leaf_name("/home/user/video.mp4"), "video.mp4");
    EXPECT_EQ(leaf_name("video.mp4"), "video.mp4");
    EXPECT_EQ(leaf_name("/home/user/"), "Unknown");
    EXPECT_EQ(leaf_name(""), "Unknown");
}

TEST(Calculator, FormatBytes) {
    EXPECT_EQ(format_bytes(0), "0 Bytes");
    EXPECT_EQ(format_bytes(512), "512 Bytes");
    EXPECT_EQ(format_bytes(1024), "1 KB");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(500000), "488.28 KB");
    EXPECT_EQ(format_bytes(1048576), "1 MB");
    EXPECT_EQ(format_bytes(1073741824ull), "1 GB");
}

TEST(Calculator, ParseCount) {
    EXPECT_EQ(parse_count("42"), 42);
    EXPECT_EQ(parse_count(" 500000\n"), 500000);
    EXPECT_EQ(parse_count("0"), 0);
    EXPECT_EQ(parse_count("-1"), -1);
}

TEST(Calculator, ParseCountRejectsMalformed) {
    EXPECT_FALSE(parse_count(""));
    EXPECT_FALSE(parse_count("   "));
    EXPECT_FALSE(parse_count("12abc"));
    EXPECT_FALSE(parse_count("1.5"));
    EXPECT_FALSE(parse_count("ten"));
}

TEST(Calculator, ParseTriple) {
    auto triple = parse_triple("1000000:2000000:500000");
    ASSERT_TRUE(triple);
    EXPECT_EQ(triple->first, 1000000);
    EXPECT_EQ(triple->second, 2000000);
    EXPECT_EQ(triple->third, 500000);
}

TEST(Calculator, ParseTripleRejectsWrongFieldCount) {
    EXPECT_FALSE(parse_triple("12:34"));
    EXPECT_FALSE(parse_triple("1:2:3:4"));
    EXPECT_FALSE(parse_triple(""));
    EXPECT_FALSE(parse_triple("1::3"));
    EXPECT_FALSE(parse_triple("a:b:c"));
}

TEST(Calculator, TransferProgressFromTriple) {
    const auto progress = transfer_progress_from(*parse_triple("1000000:2000000:500000"));

    EXPECT_EQ(progress.bytes_transferred, 1000000);
    EXPECT_EQ(progress.total_bytes, 2000000);
    EXPECT_DOUBLE_EQ(progress.percentage, 50.0);
    EXPECT_DOUBLE_EQ(progress.speed_bps, 500.0);
}

TEST(Calculator, ImportAndExportProgressFromTriple) {
    const auto import = import_progress_from(*parse_triple("3:10:30"));
    EXPECT_EQ(import.processed, 3);
    EXPECT_EQ(import.total, 10);
    EXPECT_DOUBLE_EQ(import.percentage, 30.0);

    const auto exported = export_progress_from(*parse_triple("1:4:25"));
    EXPECT_EQ(exported.current, 1);
    EXPECT_EQ(exported.total, 4);
    EXPECT_DOUBLE_EQ(exported.percentage, 25.0);
}

TEST(Calculator, ParseFileNames) {
    auto names = parse_file_names(R"(["a.txt","dir/b.txt"])");
    ASSERT_TRUE(names);
    EXPECT_EQ(*names, (std::vector<std::string>{"a.txt", "dir/b.txt"}));

    auto empty = parse_file_names("[]");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());
}

TEST(Calculator, ParseFileNamesRejectsMalformed) {
    EXPECT_FALSE(parse_file_names("not json"));
    EXPECT_FALSE(parse_file_names(R"({"a":1})"));
    EXPECT_FALSE(parse_file_names(R"(["a.txt", 3])"));
    EXPECT_FALSE(parse_file_names(""));
}
