#ifndef S3LOGX_TYPEDEF_HPP
#define S3LOGX_TYPEDEF_HPP

#include "absl/container/flat_hash_set.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

typedef std::vector<std::string> VecS;
typedef std::vector<std::string_view> VecSV;
typedef absl::flat_hash_set<std::string> StrSet;

// 行级判定结果
enum class Verdict {
  kConsistent,
  kAmbiguousDelimiter,
  kMissingDelimiter,
  kMissingGroundTruth,
  kUnreliableGroundTruth,
  kSilentHeuristicDrop,
  kStatusMismatch,
};

enum class ErrorKind {
  kConfiguration,
  kFormat,
  kConsistency,
  kIo,
};

const char *verdict_name(Verdict verdict);
const char *error_kind_name(ErrorKind kind);

// 致命错误的诊断信息, 总是带行号, 来源文件和原始文本
struct Diagnostic {
  ErrorKind kind;
  Verdict verdict;
  size_t line_number;
  std::string source;
  std::string line;
  std::string message;

  std::string to_string() const;
};

// 快速路径从一行中取出的原始字段 (指向原行, 不持有内存)
struct RawFields {
  std::string_view operation;
  std::string_view client_ip;
  std::string_view object_key;
  std::string_view raw_timestamp;
  std::string_view raw_timezone;
  std::string_view status;
  std::string_view bytes_sent;
};

struct NormalizedEvent {
  std::string object_key;
  std::string timestamp;
  uint64_t bytes_sent;
  std::string client_ip;
};

struct ShardStats {
  size_t lines = 0;
  size_t blank_lines = 0;
  size_t emitted = 0;
  size_t dropped = 0;
  size_t self_checked = 0;
};

struct ShardOutcome {
  std::string source;
  ShardStats stats;
  bool skipped = false;
  std::optional<Diagnostic> failure;

  bool ok() const { return !failure.has_value(); }
};

#endif // S3LOGX_TYPEDEF_HPP
