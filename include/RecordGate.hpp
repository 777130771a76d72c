#ifndef S3LOGX_RECORDGATE_HPP
#define S3LOGX_RECORDGATE_HPP

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "config.hpp"
#include "typedef.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class DropReason {
  kNone,
  kOperation,
  kExcludedIp,
  kStatusClass,
  kBytesSentinel,
  kKeyPrefix,
};

const char *drop_reason_name(DropReason reason);

struct GateVerdict {
  bool pass;
  DropReason reason;
  // 经过 KeyPolicy 截断后的 key (未启用时等于原 key)
  std::string_view object_key;
};

struct GatePredicate {
  DropReason reason;
  std::function<bool(const RawFields &)> keep;
};

// 单独可测的谓词
bool is_target_operation(std::string_view operation,
                         const ExtractConfig &config);
bool is_success_status(std::string_view status);
bool is_bytes_sentinel(std::string_view bytes_sent);
// 返回 nullopt 表示该 key 不在允许的前缀下
std::optional<std::string_view> apply_key_policy(std::string_view object_key,
                                                 const KeyPolicy &policy);

// [DD/Mon/YYYY:HH:MM:SS 和 +0000] 两个 token -> 规范化时间戳
absl::StatusOr<std::string> normalize_timestamp(std::string_view raw_timestamp,
                                                std::string_view raw_timezone,
                                                TimestampEncoding encoding);

// 有序短路的过滤链; 顺序本身是正确性的一部分:
// operation -> exclusion ip -> 2xx -> bytes sentinel -> key policy
class RecordGate {
private:
  const ExtractConfig &config;
  std::vector<GatePredicate> predicates;
  absl::Status match_error;

public:
  explicit RecordGate(const ExtractConfig &config);
  // 谓词捕获了 this
  RecordGate(const RecordGate &) = delete;
  RecordGate &operator=(const RecordGate &) = delete;

  GateVerdict evaluate(const RawFields &fields);
  // 只对通过的记录调用
  absl::StatusOr<NormalizedEvent>
  normalize(const RawFields &fields, const GateVerdict &verdict) const;

  const std::vector<GatePredicate> &chain() const { return predicates; }
  // 排除正则在匹配时出错 (不是不匹配) 时非 OK
  const absl::Status &error() const { return match_error; }
};

#endif // S3LOGX_RECORDGATE_HPP
