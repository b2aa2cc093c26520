#include <gtest/gtest.h>
#include <cstring>
#include <sstream>
#include <zlib.h>
#include "snplof_core.h"
#include "snplof_io.h"

namespace {

std::string gzipString(const std::string &text) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    // 15 + 16 writes a gzip wrapper instead of a zlib one
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        return "";
    strm.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(text.data()));
    strm.avail_in = static_cast<uInt>(text.size());

    std::string out;
    char buf[4096];
    int ret;
    do {
        strm.next_out = reinterpret_cast<Bytef *>(buf);
        strm.avail_out = sizeof(buf);
        ret = deflate(&strm, Z_FINISH);
        out.append(buf, sizeof(buf) - strm.avail_out);
    } while (ret == Z_OK);
    deflateEnd(&strm);
    return out;
}

std::vector<std::string> readAllLines(const std::string &data, bool *error = nullptr) {
    std::istringstream in(data);
    snplof::LineReader reader(in);
    std::vector<std::string> lines;
    std::string line;
    while (reader.getline(line))
        lines.push_back(line);
    if (error)
        *error = reader.error();
    return lines;
}

} // namespace

TEST(CoreTest, TrimsWhitespace) {
    EXPECT_EQ(snplof::trim("  study1.tsv \t\n"), "study1.tsv");
    EXPECT_EQ(snplof::trim(" \t "), "");
}

TEST(CoreTest, SplitKeepsEmptyFields) {
    auto parts = snplof::split("a,,b,", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
}

TEST(CoreTest, JoinUsesDelimiterBetweenParts) {
    EXPECT_EQ(snplof::join({"S1", "S2", "S3"}, '\t'), "S1\tS2\tS3");
    EXPECT_EQ(snplof::join({}, '\t'), "");
}

TEST(CoreTest, SplitTabsKeepsEmptyFields) {
    std::vector<std::string> fields;
    EXPECT_EQ(snplof::split_tabs("rs1\tA\t\t0", fields), 4u);
    EXPECT_EQ(fields[2], "");
    EXPECT_EQ(snplof::split_tabs("", fields), 1u);
}

TEST(CoreTest, PrintsPrefixedMessages) {
    std::ostringstream os;
    snplof::print_error("boom", os);
    snplof::print_warning("careful", os);
    EXPECT_EQ(os.str(), "Error: boom\nWarning: careful\n");
}

TEST(LineReaderTest, ReadsPlainLinesAndStripsCarriageReturns) {
    bool error = true;
    auto lines = readAllLines("header\r\nrow1\nrow2", &error);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "header");
    EXPECT_EQ(lines[1], "row1");
    EXPECT_EQ(lines[2], "row2");
    EXPECT_FALSE(error);
}

TEST(LineReaderTest, HandlesEmptyInput) {
    bool error = true;
    auto lines = readAllLines("", &error);
    EXPECT_TRUE(lines.empty());
    EXPECT_FALSE(error);
}

TEST(LineReaderTest, KeepsBlankLinesInTheMiddle) {
    auto lines = readAllLines("a\n\nb\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "");
}

TEST(LineReaderTest, ReadsLinesAcrossBufferBoundaries) {
    std::string text;
    for (int i = 0; i < 20000; ++i) {
        text += "rs" + std::to_string(i) + "\tA\tstop_gained\tENSG\tGENE\t0\t0\t0\t0\t0\t1\t2\n";
    }
    auto lines = readAllLines(text);
    ASSERT_EQ(lines.size(), 20000u);
    EXPECT_EQ(lines[12345], "rs12345\tA\tstop_gained\tENSG\tGENE\t0\t0\t0\t0\t0\t1\t2");
}

TEST(LineReaderTest, DecodesGzipTransparently) {
    std::string text = "header\nrow1\nrow2\n";
    std::string gz = gzipString(text);
    std::istringstream in(gz);
    snplof::LineReader reader(in);

    std::string line;
    std::vector<std::string> lines;
    while (reader.getline(line))
        lines.push_back(line);

    EXPECT_TRUE(reader.is_compressed());
    EXPECT_FALSE(reader.error());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "row2");
}

TEST(LineReaderTest, DecodesLargeCompressedInput) {
    std::string text;
    for (int i = 0; i < 50000; ++i) {
        text += "rs" + std::to_string(i) + "\tT\tframeshift_variant\tENSG0001\tGENE\t0\t0\t0\t0\t0\t0\t0\t1\n";
    }
    bool error = true;
    auto lines = readAllLines(gzipString(text), &error);
    EXPECT_FALSE(error);
    ASSERT_EQ(lines.size(), 50000u);
    EXPECT_EQ(lines.back(), "rs49999\tT\tframeshift_variant\tENSG0001\tGENE\t0\t0\t0\t0\t0\t0\t0\t1");
}

TEST(LineReaderTest, DecodesConcatenatedMembers) {
    std::string gz = gzipString("first\nsecond\n") + gzipString("third\n");
    bool error = true;
    auto lines = readAllLines(gz, &error);
    EXPECT_FALSE(error);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "third");
}

TEST(LineReaderTest, ReportsTruncatedGzip) {
    std::string text;
    for (int i = 0; i < 5000; ++i) {
        text += "line " + std::to_string(i * 7919) + "\n";
    }
    std::string gz = gzipString(text);
    bool error = false;
    readAllLines(gz.substr(0, gz.size() / 2), &error);
    EXPECT_TRUE(error);
}
