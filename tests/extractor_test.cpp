#include "LogParser.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace s3logx_test;

class ExtractorTest : public ::testing::Test {
protected:
  ExtractConfig config = make_test_config();
  LogParser parser{config};
};

TEST_F(ExtractorTest, ScenarioAFields) {
  std::string line = LogLine().str();
  RawFields f;
  ASSERT_TRUE(parser.parse_one(line, f));

  EXPECT_EQ(f.raw_timestamp, "[10/Oct/2023:13:55:36");
  EXPECT_EQ(f.raw_timezone, "+0000]");
  EXPECT_EQ(f.client_ip, "1.2.3.4");
  EXPECT_EQ(f.operation, "REST.GET.OBJECT");
  EXPECT_EQ(f.object_key, "my/object/key");
  EXPECT_EQ(f.status, "200");
  EXPECT_EQ(f.bytes_sent, "4096");
}

TEST_F(ExtractorTest, SentinelBytesAreReturnedRaw) {
  LogLine l;
  l.bytes = "-";
  std::string line = l.str();
  RawFields f;
  ASSERT_TRUE(parser.parse_one(line, f));
  EXPECT_EQ(f.bytes_sent, "-");
}

TEST_F(ExtractorTest, MissingMarkerLeavesPostFieldsEmpty) {
  LogLine l;
  l.protocol = "HTTP/2.0";
  std::string line = l.str();
  RawFields f;
  ASSERT_TRUE(parser.parse_one(line, f));

  EXPECT_EQ(f.operation, "REST.GET.OBJECT");
  EXPECT_EQ(f.client_ip, "1.2.3.4");
  EXPECT_TRUE(f.status.empty());
  EXPECT_TRUE(f.bytes_sent.empty());
  EXPECT_EQ(parser.last_split().marker_count, 0u);
}

TEST_F(ExtractorTest, ShortLineYieldsEmptyFields) {
  RawFields f;
  ASSERT_TRUE(parser.parse_one("owner bucket [10/Oct/2023:13:55:36", f));
  EXPECT_EQ(f.raw_timestamp, "[10/Oct/2023:13:55:36");
  EXPECT_TRUE(f.client_ip.empty());
  EXPECT_TRUE(f.operation.empty());
  EXPECT_TRUE(f.object_key.empty());
}

TEST_F(ExtractorTest, OnlyFirstPostSegmentIsRead) {
  std::string line = "o b [ts +0000] 1.2.3.4 r id REST.GET.OBJECT k "
                     "\"GET /k HTTP/1.1\" 200 - 10 10 HTTP/1.1\" 500 - 99";
  const auto &split = parser.split(line);
  ASSERT_EQ(split.marker_count, 2u);
  RawFields f = parser.extract(split);
  EXPECT_EQ(f.status, "200");
  EXPECT_EQ(f.bytes_sent, "10");
}

TEST_F(ExtractorTest, BlankLineIsNotParsed) {
  RawFields f;
  EXPECT_FALSE(parser.parse_one("   ", f));
}

TEST(ExtractorPositionsTest, PositionsComeFromConfig) {
  ExtractConfig config = make_test_config();
  config.positions.status = 3;
  config.positions.bytes_sent = 1;
  LogParser parser(config);
  RawFields f;
  ASSERT_TRUE(parser.parse_one(LogLine().str(), f));
  EXPECT_EQ(f.status, "4096");
  EXPECT_EQ(f.bytes_sent, "200");
}
