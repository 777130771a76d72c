#include "LogParser.hpp"
#include "RecordGate.hpp"
#include "Validator.hpp"
#include "absl/strings/str_cat.h"
#include "internal/out.hpp"
#include <fstream>
#include <processor.hpp>
#include <string>
#include <utility>

static Diagnostic make_diagnostic(ErrorKind kind, Verdict verdict,
                                  size_t line_number,
                                  const std::string &source,
                                  std::string_view line,
                                  std::string message) {
  return Diagnostic{kind,   verdict,          line_number,
                    source, std::string(line), std::move(message)};
}

static ShardOutcome fail_outcome(const std::string &source, ShardStats stats,
                                 Diagnostic diagnostic) {
  ShardOutcome outcome;
  outcome.source = source;
  outcome.stats = stats;
  outcome.failure = std::move(diagnostic);
  return outcome;
}

ShardOutcome validate_stream(std::istream &in, const std::string &source,
                             const ExtractConfig &config, size_t max_lines,
                             bool require_anchor) {
  ShardOutcome outcome;
  outcome.source = source;

  auto validator = LineValidator::create(config);
  if (!validator.ok()) {
    outcome.failure =
        make_diagnostic(ErrorKind::kConfiguration, Verdict::kConsistent, 0,
                        source, {}, std::string(validator.status().message()));
    return outcome;
  }

  std::string line;
  size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (is_blank(line)) {
      ++outcome.stats.blank_lines;
      continue;
    }
    ++outcome.stats.lines;
    auto diagnostic =
        validator->validate(line, line_number, source, require_anchor);
    if (diagnostic) {
      outcome.failure = std::move(diagnostic);
      return outcome;
    }
    if (max_lines != 0 && outcome.stats.lines >= max_lines)
      break;
  }
  if (in.bad())
    outcome.failure =
        make_diagnostic(ErrorKind::kIo, Verdict::kConsistent, line_number,
                        source, {}, "read error");
  return outcome;
}

ShardOutcome validate_shard(const std::string &shard_path,
                            const ExtractConfig &config) {
  std::ifstream in(shard_path);
  if (!in)
    return fail_outcome(
        shard_path, {},
        make_diagnostic(ErrorKind::kIo, Verdict::kConsistent, 0, shard_path,
                        {}, "Cannot open file: " + shard_path));
  return validate_stream(in, shard_path, config);
}

ShardOutcome extract_stream(std::istream &in, const std::string &source,
                            AlignedOutputSink &sink,
                            const ExtractConfig &config) {
  ShardStats stats;
  LogParser parser(config);
  RecordGate gate(config);
  auto auditor = DelimiterCountAuditor::create(config);
  if (!auditor.ok())
    return fail_outcome(
        source, stats,
        make_diagnostic(ErrorKind::kConfiguration, Verdict::kConsistent, 0,
                        source, {}, std::string(auditor.status().message())));

  auto status = sink.open();
  if (!status.ok())
    return fail_outcome(source, stats,
                        make_diagnostic(ErrorKind::kIo, Verdict::kConsistent,
                                        0, source, {},
                                        std::string(status.message())));

  std::string line;
  size_t line_number = 0;
  std::optional<Diagnostic> failure;
  while (!failure && std::getline(in, line)) {
    ++line_number;
    if (is_blank(line)) {
      ++stats.blank_lines;
      continue;
    }
    ++stats.lines;

    const auto &split = parser.split(line);
    // 分隔符计数已经由 Splitter 给出, 生产路径上同样审计
    if (split.marker_count != 1) {
      auto verdict = auditor->audit(line, split.marker_count);
      if (!verdict.ok()) {
        failure = make_diagnostic(ErrorKind::kConfiguration,
                                  Verdict::kConsistent, line_number, source,
                                  line,
                                  std::string(verdict.status().message()));
        break;
      }
      if (*verdict != Verdict::kConsistent) {
        failure = make_diagnostic(
            ErrorKind::kFormat, *verdict, line_number, source, line,
            absl::StrCat("marker '", config.marker, "' occurs ",
                         split.marker_count, " times"));
        break;
      }
    }

    RawFields fields = parser.extract(split);
    GateVerdict verdict = gate.evaluate(fields);
    if (!gate.error().ok()) {
      failure = make_diagnostic(ErrorKind::kConfiguration, Verdict::kConsistent,
                                line_number, source, line,
                                std::string(gate.error().message()));
      break;
    }
    if (!verdict.pass) {
      ++stats.dropped;
      continue;
    }

    auto event = gate.normalize(fields, verdict);
    if (!event.ok()) {
      failure = make_diagnostic(ErrorKind::kFormat, Verdict::kConsistent,
                                line_number, source, line,
                                std::string(event.status().message()));
      break;
    }
    status = sink.append(*event);
    if (!status.ok()) {
      failure = make_diagnostic(ErrorKind::kIo, Verdict::kConsistent,
                                line_number, source, line,
                                std::string(status.message()));
      break;
    }
    ++stats.emitted;
  }
  if (!failure && in.bad())
    failure = make_diagnostic(ErrorKind::kIo, Verdict::kConsistent,
                              line_number, source, {}, "read error");

  // 失败时已写入的行仍然有效, 照常关闭
  status = sink.close();
  if (!failure && !status.ok())
    failure = make_diagnostic(ErrorKind::kIo, Verdict::kConsistent,
                              line_number, source, {},
                              std::string(status.message()));

  DEBUG("extract_stream %s: %zu lines, %zu emitted", source.c_str(),
        stats.lines, stats.emitted)
  ShardOutcome outcome;
  outcome.source = source;
  outcome.stats = stats;
  outcome.failure = std::move(failure);
  return outcome;
}

ShardOutcome extract_shard(const std::string &shard_path,
                           const std::string &output_dir,
                           const ExtractConfig &config) {
  size_t self_checked = 0;
  // 新日志源上先用 ground truth 抽查开头若干行, 通过后才信任快速路径
  if (config.self_check_lines > 0) {
    std::ifstream check_in(shard_path);
    if (!check_in)
      return fail_outcome(
          shard_path, {},
          make_diagnostic(ErrorKind::kIo, Verdict::kConsistent, 0, shard_path,
                          {}, "Cannot open file: " + shard_path));
    auto check = validate_stream(check_in, shard_path, config,
                                 config.self_check_lines, false);
    if (!check.ok())
      return check;
    self_checked = check.stats.lines;
  }

  std::ifstream in(shard_path);
  if (!in)
    return fail_outcome(
        shard_path, {},
        make_diagnostic(ErrorKind::kIo, Verdict::kConsistent, 0, shard_path,
                        {}, "Cannot open file: " + shard_path));

  AlignedOutputSink sink(output_dir);
  auto outcome = extract_stream(in, shard_path, sink, config);
  outcome.stats.self_checked = self_checked;
  return outcome;
}
