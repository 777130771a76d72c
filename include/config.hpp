#ifndef S3LOGX_CONFIG_HPP
#define S3LOGX_CONFIG_HPP

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "arg.hpp"
#include "typedef.hpp"
#include "utils/pcre2regex.hpp"
#include <cstddef>
#include <string>
#include <string_view>

enum class BytesSentinelPolicy { kZero, kDrop };
enum class TimestampEncoding { kCanonical, kCompact };

// 固定的 token 下标 (从 0 开始), 每个部署固定一次, 不按行推断.
// pre 段: owner bucket [ts +zone] ip requester reqid operation key "GET /..
// post 段 (marker "HTTP/1." 之后): 1" status error bytes_sent ...
struct FieldPositions {
  size_t timestamp = 2;
  size_t timezone = 3;
  size_t client_ip = 4;
  size_t operation = 7;
  size_t object_key = 8;
  size_t status = 1;
  size_t bytes_sent = 3;
};

struct KeyPolicy {
  bool enabled = false;
  StrSet allowed_prefixes;
  // 该前缀下的 key 只保留前 chunked_segments 段
  std::string chunked_prefix;
  size_t chunked_segments = 2;
};

KeyPolicy dandi_key_policy();

inline constexpr char kBytesSentinel[] = "-";
inline constexpr char kExclusionEnvVar[] = "IPS_TO_SKIP_REGEX";
inline constexpr char kDefaultRecordsDir[] = "s3logx_records";

struct ExtractConfig {
  std::string marker = "HTTP/1.";
  std::string target_operation = "REST.GET.OBJECT";
  // 按优先级排列, 新版本在前
  VecS ground_truth_anchors = {"HTTP/2.0\" ", "HTTP/1.1\" ", "HTTP/1.0\" "};
  FieldPositions positions;
  Pcre2Regex exclusion;
  KeyPolicy key_policy;
  BytesSentinelPolicy bytes_policy = BytesSentinelPolicy::kZero;
  TimestampEncoding timestamp_encoding = TimestampEncoding::kCanonical;
  size_t self_check_lines = 100;
  std::string input_path;
  std::string output_dir;
  std::string records_dir;
  unsigned int num_threads = 1;
  size_t limit = 0;
};

absl::StatusOr<Pcre2Regex> load_exclusion_policy(std::string_view pattern);

// --records, 否则 <-o>/records, 都没有时为 ./s3logx_records.
// stop 和 extract 必须走同一个规则, 否则停止文件对不上
std::string resolve_records_dir(const Args &args);

// 在读取任何一行之前校验配置; env_regex 为 nullptr 表示环境变量未设置
absl::StatusOr<ExtractConfig> make_config(const Args &args,
                                          const char *env_regex);
absl::StatusOr<ExtractConfig> make_config(const Args &args);

// 运行前的最后一道检查, 库调用方自己构造配置时同样生效
absl::Status check_config(const ExtractConfig &config);

#endif // S3LOGX_CONFIG_HPP
