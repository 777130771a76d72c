#include "absl/strings/str_cat.h"
#include "internal/out.hpp"
#include <Validator.hpp>
#include <string>
#include <utility>

DelimiterCountAuditor::DelimiterCountAuditor(const ExtractConfig &config,
                                             Pcre2Regex token_re)
    : config(config), token_re(std::move(token_re)) {}

absl::StatusOr<DelimiterCountAuditor>
DelimiterCountAuditor::create(const ExtractConfig &config) {
  auto token_re = Pcre2Regex::compile(R"(\S+)");
  if (!token_re.ok())
    return token_re.status();
  return DelimiterCountAuditor(config, std::move(*token_re));
}

absl::StatusOr<bool>
DelimiterCountAuditor::is_target_line(std::string_view line) const {
  size_t index = 0;
  auto it = token_re.get_iter(line);
  for (; !it.end(); it.next(), ++index) {
    if (index == config.positions.operation) {
      auto [start, end] = it.cap();
      return line.substr(start, end - start) == config.target_operation;
    }
  }
  auto status = it.status();
  if (!status.ok())
    return status;
  return false;
}

absl::StatusOr<Verdict>
DelimiterCountAuditor::audit(std::string_view line,
                             size_t marker_count) const {
  if (marker_count == 1)
    return Verdict::kConsistent;
  if (marker_count > 1)
    return Verdict::kAmbiguousDelimiter;

  auto target = is_target_line(line);
  if (!target.ok())
    return target.status();
  return *target ? Verdict::kMissingDelimiter : Verdict::kConsistent;
}

LineValidator::LineValidator(const ExtractConfig &config,
                             DelimiterCountAuditor delimiter_auditor)
    : config(config), parser(config), resolver(config),
      delimiter_auditor(std::move(delimiter_auditor)) {}

absl::StatusOr<LineValidator>
LineValidator::create(const ExtractConfig &config) {
  auto auditor = DelimiterCountAuditor::create(config);
  if (!auditor.ok())
    return auditor.status();
  return LineValidator(config, std::move(*auditor));
}

std::optional<Diagnostic> LineValidator::validate(std::string_view line,
                                                  size_t line_number,
                                                  const std::string &source,
                                                  bool require_anchor) {
  if (is_blank(line))
    return std::nullopt;

  auto fail = [&](ErrorKind kind, Verdict verdict, std::string message) {
    return Diagnostic{kind,   verdict,          line_number,
                      source, std::string(line), std::move(message)};
  };

  const auto &split = parser.split(line);
  auto delimiter = delimiter_auditor.audit(line, split.marker_count);
  if (!delimiter.ok())
    return fail(ErrorKind::kConfiguration, Verdict::kConsistent,
                std::string(delimiter.status().message()));
  if (*delimiter == Verdict::kAmbiguousDelimiter)
    return fail(ErrorKind::kFormat, *delimiter,
                absl::StrCat("marker '", config.marker, "' occurs ",
                             split.marker_count, " times"));
  if (*delimiter == Verdict::kMissingDelimiter)
    return fail(ErrorKind::kFormat, *delimiter,
                absl::StrCat("marker '", config.marker,
                             "' not found on a ", config.target_operation,
                             " line"));

  GroundTruth truth = resolver.resolve(line);
  if (!truth.anchor_found && !require_anchor) {
    auto target = delimiter_auditor.is_target_line(line);
    if (!target.ok())
      return fail(ErrorKind::kConfiguration, Verdict::kConsistent,
                  std::string(target.status().message()));
    if (!*target)
      return std::nullopt;
  }
  RawFields fields = parser.extract(split);
  Verdict verdict = check_consistency(truth, fields.status);
  DEBUG("validate line %zu: truth=%.*s fast=%.*s verdict=%s", line_number,
        (int)truth.status.size(), truth.status.data(),
        (int)fields.status.size(), fields.status.data(), verdict_name(verdict))

  switch (verdict) {
  case Verdict::kConsistent:
    return std::nullopt;
  case Verdict::kMissingGroundTruth:
    return fail(ErrorKind::kFormat, verdict,
                "no protocol-version anchor found in line");
  case Verdict::kUnreliableGroundTruth:
    return fail(ErrorKind::kConsistency, verdict,
                absl::StrCat("ground-truth status '",
                             absl::string_view(truth.status.data(), truth.status.size()),
                             "' after anchor '",
                             absl::string_view(truth.anchor.data(), truth.anchor.size()),
                             "' is not a valid status code"));
  case Verdict::kSilentHeuristicDrop:
    return fail(ErrorKind::kConsistency, verdict,
                absl::StrCat("ground truth status is ",
                             absl::string_view(truth.status.data(), truth.status.size()),
                             " but the fast path found no valid status ('",
                             absl::string_view(fields.status.data(), fields.status.size()), "')"));
  case Verdict::kStatusMismatch:
    return fail(ErrorKind::kConsistency, verdict,
                absl::StrCat("ground truth status ",
                             absl::string_view(truth.status.data(), truth.status.size()),
                             " differs from fast path status ",
                             absl::string_view(fields.status.data(), fields.status.size())));
  default:
    break;
  }
  return fail(ErrorKind::kConsistency, verdict, "unexpected verdict");
}
