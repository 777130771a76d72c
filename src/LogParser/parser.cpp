#include "internal/out.hpp"
#include "utils/util.hpp"
#include <LogParser.hpp>
#include <cstddef>
#include <string_view>

static inline std::string_view token_at(const VecSV &tokens, size_t index) {
  return index < tokens.size() ? tokens[index] : std::string_view();
}

bool is_blank(std::string_view line) {
  for (char c : line) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\v' &&
        c != '\f')
      return false;
  }
  return true;
}

LogParser::LogParser(const ExtractConfig &config) : config(config) {
  // 预分配, 一行的 token 数基本固定
  pre_tokens.reserve(16);
  post_tokens.reserve(32);
}

const SplitResult &LogParser::split(std::string_view line) {
  split_on_marker(line, config.marker, split_result);
  return split_result;
}

RawFields LogParser::extract(const SplitResult &split) {
  const auto &pos = config.positions;
  RawFields fields;

  split_whitespace(split.pre, pre_tokens);
  fields.raw_timestamp = token_at(pre_tokens, pos.timestamp);
  fields.raw_timezone = token_at(pre_tokens, pos.timezone);
  fields.client_ip = token_at(pre_tokens, pos.client_ip);
  fields.operation = token_at(pre_tokens, pos.operation);
  fields.object_key = token_at(pre_tokens, pos.object_key);

  // 只看第一个 post 段; 没有 marker 时 status/bytes 为空
  if (split.has_post()) {
    split_whitespace(split.post.front(), post_tokens);
    fields.status = token_at(post_tokens, pos.status);
    fields.bytes_sent = token_at(post_tokens, pos.bytes_sent);
  }
  return fields;
}

bool LogParser::parse_one(std::string_view line, RawFields &fields) {
  if (is_blank(line))
    return false;
  fields = extract(split(line));
  DEBUG("parse_one: op=%.*s status=%.*s markers=%zu",
        (int)fields.operation.size(), fields.operation.data(),
        (int)fields.status.size(), fields.status.data(),
        split_result.marker_count)
  return true;
}
