#include <Validator.hpp>
#include <string_view>

bool is_valid_status(std::string_view status) {
  return status.size() == 3 && status[0] >= '1' && status[0] <= '5' &&
         status[1] >= '0' && status[1] <= '9' && status[2] >= '0' &&
         status[2] <= '9';
}

GroundTruthResolver::GroundTruthResolver(const ExtractConfig &config)
    : anchors(config.ground_truth_anchors) {}

GroundTruth GroundTruthResolver::resolve(std::string_view line) const {
  GroundTruth truth;
  // 按优先级取第一个命中的锚点, 而不是行内最靠前的
  for (const auto &anchor : anchors) {
    size_t pos = line.find(anchor);
    if (pos == std::string_view::npos)
      continue;

    truth.anchor_found = true;
    truth.anchor = std::string_view(anchor);

    size_t start = pos + anchor.size();
    while (start < line.size() && (line[start] == ' ' || line[start] == '\t'))
      ++start;
    size_t end = start;
    while (end < line.size() && line[end] != ' ' && line[end] != '\t' &&
           line[end] != '\r' && line[end] != '\n')
      ++end;
    truth.status = line.substr(start, end - start);
    break;
  }
  return truth;
}

Verdict check_consistency(const GroundTruth &truth,
                          std::string_view fast_status) {
  if (!truth.anchor_found)
    return Verdict::kMissingGroundTruth;
  if (!is_valid_status(truth.status))
    return Verdict::kUnreliableGroundTruth;
  if (truth.status[0] != '2')
    return Verdict::kConsistent;
  if (!is_valid_status(fast_status))
    return Verdict::kSilentHeuristicDrop;
  // 都是三位数字, 字符串相等即数值相等
  if (fast_status != truth.status)
    return Verdict::kStatusMismatch;
  return Verdict::kConsistent;
}
