#include <gtest/gtest.h>
#include <transfer/output_parser.hpp>

TEST(OutputParser, EmptyOutput) {
    auto info = parse_copy_output("");
    EXPECT_FALSE(info.filesize.has_value());
    EXPECT_FALSE(info.checksum.has_value());
    EXPECT_FALSE(info.checksum_type.has_value());
}

TEST(OutputParser, NoKnownMarker) {
    auto info = parse_copy_output("Run: [ERROR] Server responded with an error\n");
    EXPECT_FALSE(info.filesize.has_value());
    EXPECT_FALSE(info.checksum.has_value());
    EXPECT_FALSE(info.checksum_type.has_value());
}

TEST(OutputParser, MarkerButNoMatch) {
    auto info = parse_copy_output("[xrootd] Total 1.00 MB |====| 100.00 % [1.0 MB/s]\n");
    EXPECT_FALSE(info.has_checksum());
    EXPECT_FALSE(info.filesize.has_value());
}

TEST(OutputParser, Adler32PaddedToEightDigits) {
    auto info = parse_copy_output("adler32: 1a2b3c 1a2b3c4d 1000000");
    ASSERT_TRUE(info.has_checksum());
    EXPECT_EQ(*info.checksum_type, "adler32");
    EXPECT_EQ(*info.checksum, "001a2b3c");
    ASSERT_TRUE(info.filesize.has_value());
    EXPECT_EQ(*info.filesize, 1000000);
}

TEST(OutputParser, FullLengthChecksumUntouched) {
    auto info = parse_copy_output("adler32: 8f3c21d0 root://eos.example.org//data/a.root 42");
    ASSERT_TRUE(info.has_checksum());
    EXPECT_EQ(*info.checksum, "8f3c21d0");
    EXPECT_EQ(*info.filesize, 42);
}

TEST(OutputParser, ChecksumLineAfterProgress) {
    std::string out =
        "[0B/0B][100%][==================================================][0B/s]\n"
        "adler32: 5f0d3 file:///scratch/job/a.root 2048\n";
    auto info = parse_copy_output(out);
    ASSERT_TRUE(info.has_checksum());
    EXPECT_EQ(*info.checksum, "0005f0d3");
    EXPECT_EQ(*info.filesize, 2048);
}

TEST(OutputParser, Md5Line) {
    auto info = parse_copy_output("md5: d41d8cd98f00b204e9800998ecf8427e /tmp/out.log 0");
    ASSERT_TRUE(info.has_checksum());
    EXPECT_EQ(*info.checksum_type, "md5");
    EXPECT_EQ(*info.checksum, "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(*info.filesize, 0);
}

TEST(OutputParser, OverflowingSizeKeepsChecksum) {
    auto info = parse_copy_output("adler32: abcd x 99999999999999999999999");
    ASSERT_TRUE(info.has_checksum());
    EXPECT_EQ(*info.checksum, "0000abcd");
    EXPECT_FALSE(info.filesize.has_value());
}

TEST(OutputParser, FormattedValuesParseBack) {
    const std::vector<std::string> sums = {"1", "ab", "fff", "1a2b", "9c8d7", "0e0e0e", "1234567", "89abcdef"};
    const std::vector<int64_t> sizes = {0, 7, 1048576, 5000000000LL};
    for (const auto& type : {std::string("adler32"), std::string("md5")}) {
        for (const auto& c : sums) {
            for (auto s : sizes) {
                auto info = parse_copy_output(type + ": " + c + " ignored " + std::to_string(s));
                ASSERT_TRUE(info.has_checksum()) << type << " " << c;
                EXPECT_EQ(*info.checksum_type, type);
                EXPECT_EQ(info.checksum->size(), 8u);
                EXPECT_EQ(*info.checksum, std::string(8 - c.size(), '0') + c);
                EXPECT_EQ(*info.filesize, s);
            }
        }
    }
}

TEST(OutputParser, AbbreviateKeepsChecksumRegion) {
    std::string noise(5000, '=');
    std::string out = noise + "adler32: 1234abcd file:///x 10" + noise;
    std::string shortened = abbreviate_output(out, 200);
    EXPECT_LT(shortened.size(), out.size());
    EXPECT_NE(shortened.find("adler32: 1234abcd"), std::string::npos);
}

TEST(OutputParser, AbbreviateShortOutputUnchanged) {
    EXPECT_EQ(abbreviate_output("short", 200), "short");
}
