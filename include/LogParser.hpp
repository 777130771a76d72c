#ifndef S3LOGX_LOGPARSER_HPP
#define S3LOGX_LOGPARSER_HPP

#include "config.hpp"
#include "typedef.hpp"
#include <cstddef>
#include <string_view>

struct SplitResult {
  std::string_view pre;
  VecSV post;
  size_t marker_count = 0;

  bool has_post() const { return !post.empty(); }
};

// 按字面量 marker 切分 (marker 中的 '.' 不是通配符).
// 0 次或多次出现都只记录次数, 交给审计器处理
void split_on_marker(std::string_view line, std::string_view marker,
                     SplitResult &out);
size_t count_marker(std::string_view line, std::string_view marker);

// 快速路径: 对 pre/post 段按空白切分后按固定下标取字段
class LogParser {
private:
  const ExtractConfig &config;
  SplitResult split_result;
  VecSV pre_tokens;
  VecSV post_tokens;

public:
  explicit LogParser(const ExtractConfig &config);

  const SplitResult &split(std::string_view line);
  RawFields extract(const SplitResult &split);
  // 空行 (没有任何 token) 返回 false
  bool parse_one(std::string_view line, RawFields &fields);

  const SplitResult &last_split() const { return split_result; }
};

bool is_blank(std::string_view line);

#endif // S3LOGX_LOGPARSER_HPP
