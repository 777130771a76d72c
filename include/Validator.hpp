#ifndef S3LOGX_VALIDATOR_HPP
#define S3LOGX_VALIDATOR_HPP

#include "LogParser.hpp"
#include "absl/status/statusor.h"
#include "config.hpp"
#include "typedef.hpp"
#include "utils/pcre2regex.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// 恰好三位数字且首位在 1-5
bool is_valid_status(std::string_view status);

struct GroundTruth {
  bool anchor_found = false;
  std::string_view anchor;
  std::string_view status;
};

// 直接在原始行中查找协议版本锚点, 不依赖 Splitter 的切分结果
class GroundTruthResolver {
private:
  const VecS &anchors;

public:
  explicit GroundTruthResolver(const ExtractConfig &config);
  GroundTruth resolve(std::string_view line) const;
};

// 只有 2xx 上的分歧是致命的: 非 2xx 记录无论如何都会被过滤链丢弃
Verdict check_consistency(const GroundTruth &truth,
                          std::string_view fast_status);

class DelimiterCountAuditor {
private:
  const ExtractConfig &config;
  Pcre2Regex token_re;

public:
  DelimiterCountAuditor(const ExtractConfig &config, Pcre2Regex token_re);
  static absl::StatusOr<DelimiterCountAuditor>
  create(const ExtractConfig &config);

  // 独立的 token 扫描: 整行第 operation 个 token 是否为目标操作
  absl::StatusOr<bool> is_target_line(std::string_view line) const;
  // 0 次 (目标行) 或 >=2 次为致命; 1 次返回 kConsistent
  absl::StatusOr<Verdict> audit(std::string_view line,
                                size_t marker_count) const;
};

// 一行的完整校验: 分隔符计数 -> ground truth -> 与快速路径比对
class LineValidator {
private:
  const ExtractConfig &config;
  LogParser parser;
  GroundTruthResolver resolver;
  DelimiterCountAuditor delimiter_auditor;

public:
  LineValidator(const ExtractConfig &config,
                DelimiterCountAuditor delimiter_auditor);
  static absl::StatusOr<LineValidator> create(const ExtractConfig &config);

  // require_anchor = false 用于抽取前的自检: 没有锚点的非目标行
  // (生命周期规则, 无 URI 的操作) 在生产路径上是正常的, 不算失败
  std::optional<Diagnostic> validate(std::string_view line,
                                     size_t line_number,
                                     const std::string &source,
                                     bool require_anchor = true);
};

#endif // S3LOGX_VALIDATOR_HPP
