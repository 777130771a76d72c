#include "absl/strings/str_cat.h"
#include "internal/out.hpp"
#include <config.hpp>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>

namespace fs = std::filesystem;

KeyPolicy dandi_key_policy() {
  KeyPolicy policy;
  policy.enabled = true;
  policy.allowed_prefixes = {"blobs", "zarr"};
  policy.chunked_prefix = "zarr";
  policy.chunked_segments = 2;
  return policy;
}

absl::StatusOr<Pcre2Regex> load_exclusion_policy(std::string_view pattern) {
  if (pattern.empty())
    return absl::FailedPreconditionError(
        absl::StrCat("IP exclusion regex is required; set ", kExclusionEnvVar,
                     " or pass --ips-to-skip"));
  return Pcre2Regex::compile(std::string(pattern));
}

std::string resolve_records_dir(const Args &args) {
  if (!args.records_dir.empty())
    return args.records_dir;
  if (!args.output_dir.empty())
    return (fs::path(args.output_dir) / "records").string();
  return kDefaultRecordsDir;
}

absl::StatusOr<ExtractConfig> make_config(const Args &args,
                                          const char *env_regex) {
  ExtractConfig config;

  std::string pattern = args.ips_to_skip;
  if (pattern.empty() && env_regex != nullptr)
    pattern = env_regex;
  auto exclusion = load_exclusion_policy(pattern);
  if (!exclusion.ok())
    return exclusion.status();
  config.exclusion = std::move(*exclusion);
  DEBUG("exclusion regex loaded, jit: %d", config.exclusion.jit() ? 1 : 0)

  if (args.mode == "dandi") {
    config.key_policy = dandi_key_policy();
  } else if (!args.mode.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("unknown mode: ", args.mode));
  }

  if (args.bytes_sentinel == "zero") {
    config.bytes_policy = BytesSentinelPolicy::kZero;
  } else if (args.bytes_sentinel == "drop") {
    config.bytes_policy = BytesSentinelPolicy::kDrop;
  } else {
    return absl::InvalidArgumentError(absl::StrCat(
        "bytes sentinel policy must be zero or drop, got: ",
        args.bytes_sentinel));
  }

  if (args.timestamp_format == "canonical") {
    config.timestamp_encoding = TimestampEncoding::kCanonical;
  } else if (args.timestamp_format == "compact") {
    config.timestamp_encoding = TimestampEncoding::kCompact;
  } else {
    return absl::InvalidArgumentError(absl::StrCat(
        "timestamp encoding must be canonical or compact, got: ",
        args.timestamp_format));
  }

  if (args.command == Command::kExtract && args.output_dir.empty())
    return absl::InvalidArgumentError("output directory not specified");

  config.self_check_lines = args.self_check_lines;
  config.input_path = args.input_path;
  config.output_dir = args.output_dir;
  config.num_threads = args.num_threads == 0 ? 1 : args.num_threads;
  config.limit = args.limit;

  config.records_dir = resolve_records_dir(args);

  auto status = check_config(config);
  if (!status.ok())
    return status;
  return config;
}

absl::StatusOr<ExtractConfig> make_config(const Args &args) {
  // 环境变量只在启动时读取一次
  return make_config(args, std::getenv(kExclusionEnvVar));
}

absl::Status check_config(const ExtractConfig &config) {
  if (!config.exclusion.valid())
    return absl::FailedPreconditionError(
        "IP exclusion policy is missing; refusing to read any log line");
  if (config.marker.empty())
    return absl::InvalidArgumentError("delimiter marker must not be empty");
  if (config.ground_truth_anchors.empty())
    return absl::InvalidArgumentError(
        "at least one ground-truth anchor is required");
  // HTTP/2.0 这类锚点不含 marker, 但至少要有一个能校验快速路径
  bool covers_marker = false;
  for (const auto &anchor : config.ground_truth_anchors) {
    if (anchor.find(config.marker) != std::string::npos)
      covers_marker = true;
  }
  if (!covers_marker)
    return absl::InvalidArgumentError(absl::StrCat(
        "no ground-truth anchor contains the marker '", config.marker, "'"));
  if (config.key_policy.enabled && config.key_policy.allowed_prefixes.empty())
    return absl::InvalidArgumentError("key policy has no allowed prefixes");
  return absl::OkStatus();
}
