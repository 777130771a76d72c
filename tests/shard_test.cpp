#include "OutputSink.hpp"
#include "processor.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace s3logx_test;

class ShardTest : public ::testing::Test {
protected:
  TempDir tmp;
  ExtractConfig config = make_test_config();

  fs::path write_shard(const std::string &name,
                       const std::vector<std::string> &lines) {
    fs::path path = tmp / name;
    write_file(path, lines);
    return path;
  }
};

TEST_F(ShardTest, ScenarioAEmitsOneAlignedEvent) {
  auto shard = write_shard("a.log", {LogLine().str()});
  auto out = tmp / "out";
  auto outcome = extract_shard(shard.string(), out.string(), config);
  ASSERT_TRUE(outcome.ok()) << outcome.failure->to_string();
  EXPECT_EQ(outcome.stats.emitted, 1u);
  EXPECT_EQ(outcome.stats.self_checked, 1u);

  EXPECT_EQ(read_file(out / kObjectKeysFile), "my/object/key\n");
  EXPECT_EQ(read_file(out / kTimestampsFile), "10/Oct/2023:13:55:36\n");
  EXPECT_EQ(read_file(out / kBytesSentFile), "4096\n");
  EXPECT_EQ(read_file(out / kIpsFile), "1.2.3.4\n");
}

TEST_F(ShardTest, StreamsStayAligned) {
  LogLine a, b, c, d, put, sentinel;
  b.status = "404";
  c.ip = "10.0.0.5";
  d.key = "zarr/storeA/0/0/1.chunk";
  d.ip = "5.6.7.8";
  put.operation = "REST.PUT.OBJECT";
  sentinel.bytes = "-";
  sentinel.ip = "9.9.9.9";
  auto shard = write_shard("mixed.log", {a.str(), b.str(), "", c.str(),
                                         d.str(), put.str(), sentinel.str()});
  auto out = tmp / "out";

  auto outcome = extract_shard(shard.string(), out.string(), config);
  ASSERT_TRUE(outcome.ok()) << outcome.failure->to_string();
  EXPECT_EQ(outcome.stats.lines, 6u);
  EXPECT_EQ(outcome.stats.blank_lines, 1u);
  EXPECT_EQ(outcome.stats.emitted, 3u);
  EXPECT_EQ(outcome.stats.dropped, 3u);

  auto keys = read_lines(out / kObjectKeysFile);
  auto times = read_lines(out / kTimestampsFile);
  auto bytes = read_lines(out / kBytesSentFile);
  auto ips = read_lines(out / kIpsFile);
  ASSERT_EQ(keys.size(), 3u);
  ASSERT_EQ(times.size(), 3u);
  ASSERT_EQ(bytes.size(), 3u);
  ASSERT_EQ(ips.size(), 3u);

  EXPECT_EQ(keys[1], "zarr/storeA/0/0/1.chunk");
  EXPECT_EQ(ips[1], "5.6.7.8");
  EXPECT_EQ(bytes[2], "0");
  EXPECT_EQ(ips[2], "9.9.9.9");
}

TEST_F(ShardTest, ScenarioDUnderDandiMode) {
  config.key_policy = dandi_key_policy();
  LogLine zarr, blob, other;
  zarr.key = "zarr/storeA/0/0/1.chunk";
  blob.key = "blobs/abc/def/0123";
  other.key = "dandisets/000001/draft";
  auto shard = write_shard("d.log", {zarr.str(), blob.str(), other.str()});
  auto out = tmp / "out";

  auto outcome = extract_shard(shard.string(), out.string(), config);
  ASSERT_TRUE(outcome.ok()) << outcome.failure->to_string();
  auto keys = read_lines(out / kObjectKeysFile);
  std::vector<std::string> expected = {"zarr/storeA", "blobs/abc/def/0123"};
  EXPECT_EQ(keys, expected);
}

TEST_F(ShardTest, ScenarioEAbortsWithDiagnostic) {
  LogLine bad;
  bad.key = "weird/HTTP/1.1/file";
  std::string bad_line = bad.str();
  auto shard = write_shard("e.log", {LogLine().str(), bad_line});

  config.self_check_lines = 0;
  std::ifstream in(shard);
  AlignedOutputSink sink((tmp / "out").string());
  auto outcome = extract_stream(in, shard.string(), sink, config);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.failure->kind, ErrorKind::kFormat);
  EXPECT_EQ(outcome.failure->verdict, Verdict::kAmbiguousDelimiter);
  EXPECT_EQ(outcome.failure->line_number, 2u);
  EXPECT_EQ(outcome.failure->line, bad_line);
  EXPECT_EQ(outcome.failure->source, shard.string());
  EXPECT_EQ(outcome.stats.emitted, 1u);
}

TEST_F(ShardTest, SelfCheckRunsBeforeAnyOutput) {
  LogLine bad;
  bad.key = "weird/HTTP/1.1/file";
  auto shard = write_shard("e.log", {LogLine().str(), bad.str()});
  auto out = tmp / "out";

  auto outcome = extract_shard(shard.string(), out.string(), config);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.failure->verdict, Verdict::kAmbiguousDelimiter);
  EXPECT_FALSE(fs::exists(out));
}

TEST_F(ShardTest, MarkerlessNonTargetLineDoesNotFailSelfCheck) {
  auto shard = write_shard("lc.log", {lifecycle_line(), LogLine().str()});
  auto out = tmp / "out";
  auto outcome = extract_shard(shard.string(), out.string(), config);
  ASSERT_TRUE(outcome.ok()) << outcome.failure->to_string();
  EXPECT_EQ(outcome.stats.self_checked, 2u);
  EXPECT_EQ(outcome.stats.emitted, 1u);
  EXPECT_EQ(outcome.stats.dropped, 1u);
  EXPECT_EQ(read_file(out / kObjectKeysFile), "my/object/key\n");

  // 校验模式下缺少锚点仍然致命
  auto checked = validate_shard(shard.string(), config);
  ASSERT_FALSE(checked.ok());
  EXPECT_EQ(checked.failure->verdict, Verdict::kMissingGroundTruth);
  EXPECT_EQ(checked.failure->line_number, 1u);
}

TEST_F(ShardTest, SelfCheckCatchesMisplacedPositions) {
  config.positions.status = 3;
  LogLine l;
  l.bytes = "304";
  auto shard = write_shard("p.log", {l.str()});
  auto outcome =
      extract_shard(shard.string(), (tmp / "out").string(), config);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.failure->kind, ErrorKind::kConsistency);
  EXPECT_EQ(outcome.failure->verdict, Verdict::kStatusMismatch);
}

TEST_F(ShardTest, MissingDelimiterOnTargetLineAborts) {
  LogLine l;
  l.protocol = "HTTP/2.0";
  config.self_check_lines = 0;
  std::istringstream in(LogLine().str() + "\n" + l.str() + "\n");
  AlignedOutputSink sink((tmp / "out").string());
  auto outcome = extract_stream(in, "mem.log", sink, config);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.failure->verdict, Verdict::kMissingDelimiter);
  EXPECT_EQ(outcome.failure->line_number, 2u);
}

TEST_F(ShardTest, NoEventsLeavesNoFiles) {
  LogLine l;
  l.status = "404";
  auto shard = write_shard("empty.log", {l.str(), ""});
  auto out = tmp / "out";
  auto outcome = extract_shard(shard.string(), out.string(), config);
  ASSERT_TRUE(outcome.ok()) << outcome.failure->to_string();
  EXPECT_EQ(outcome.stats.emitted, 0u);
  EXPECT_FALSE(fs::exists(out));
}

TEST_F(ShardTest, RerunIsIdempotent) {
  LogLine b;
  b.ip = "4.4.4.4";
  auto shard = write_shard("i.log", {LogLine().str(), b.str()});
  auto out = tmp / "out";

  ASSERT_TRUE(extract_shard(shard.string(), out.string(), config).ok());
  std::string first = read_file(out / kIpsFile);
  ASSERT_TRUE(extract_shard(shard.string(), out.string(), config).ok());
  EXPECT_EQ(read_file(out / kIpsFile), first);
  EXPECT_EQ(first, "1.2.3.4\n4.4.4.4\n");
}

TEST_F(ShardTest, DropPolicyDropsSentinel) {
  config.bytes_policy = BytesSentinelPolicy::kDrop;
  LogLine l;
  l.bytes = "-";
  auto shard = write_shard("s.log", {LogLine().str(), l.str()});
  auto out = tmp / "out";
  auto outcome = extract_shard(shard.string(), out.string(), config);
  ASSERT_TRUE(outcome.ok()) << outcome.failure->to_string();
  EXPECT_EQ(outcome.stats.emitted, 1u);
  EXPECT_EQ(outcome.stats.dropped, 1u);
}

TEST_F(ShardTest, MissingFileIsAnIoError) {
  auto outcome = extract_shard((tmp / "nope.log").string(),
                               (tmp / "out").string(), config);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.failure->kind, ErrorKind::kIo);
}

TEST_F(ShardTest, ValidateStreamHonoursLineLimit) {
  LogLine bad;
  bad.key = "weird/HTTP/1.1/file";
  std::istringstream in("\n" + LogLine().str() + "\n" + bad.str() + "\n");
  auto outcome = validate_stream(in, "mem.log", config, 1);
  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.stats.lines, 1u);

  std::istringstream all("\n" + LogLine().str() + "\n" + bad.str() + "\n");
  outcome = validate_stream(all, "mem.log", config);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.failure->line_number, 3u);
}

TEST_F(ShardTest, SinkRequiresOpen) {
  AlignedOutputSink sink((tmp / "out").string());
  NormalizedEvent event{"k", "10/Oct/2023:13:55:36", 1, "1.2.3.4"};
  EXPECT_EQ(sink.append(event).code(), absl::StatusCode::kFailedPrecondition);
  ASSERT_TRUE(sink.open().ok());
  EXPECT_TRUE(sink.append(event).ok());
  EXPECT_EQ(sink.size(), 1u);
  EXPECT_TRUE(sink.close().ok());
  EXPECT_EQ(read_file(tmp / "out" / kBytesSentFile), "1\n");
}
