#include "absl/strings/str_cat.h"
#include "internal/out.hpp"
#include "utils/util.hpp"
#include <RecordGate.hpp>
#include <cstdint>
#include <string>
#include <utility>

const char *drop_reason_name(DropReason reason) {
  switch (reason) {
  case DropReason::kNone:
    return "none";
  case DropReason::kOperation:
    return "operation";
  case DropReason::kExcludedIp:
    return "excluded-ip";
  case DropReason::kStatusClass:
    return "status-class";
  case DropReason::kBytesSentinel:
    return "bytes-sentinel";
  case DropReason::kKeyPrefix:
    return "key-prefix";
  }
  return "unknown";
}

bool is_target_operation(std::string_view operation,
                         const ExtractConfig &config) {
  return operation == config.target_operation;
}

bool is_success_status(std::string_view status) {
  // 只比较首位 (状态类别)
  return !status.empty() && status[0] == '2';
}

bool is_bytes_sentinel(std::string_view bytes_sent) {
  return bytes_sent == kBytesSentinel;
}

std::optional<std::string_view> apply_key_policy(std::string_view object_key,
                                                 const KeyPolicy &policy) {
  if (!policy.enabled)
    return object_key;

  size_t slash = object_key.find('/');
  std::string_view prefix = object_key.substr(0, slash);
  if (!policy.allowed_prefixes.contains(
          absl::string_view(prefix.data(), prefix.size())))
    return std::nullopt;
  if (prefix != policy.chunked_prefix)
    return object_key;

  // 截断到前 chunked_segments 段, 例如 zarr/<store>/0/0/1 -> zarr/<store>
  size_t end = std::string_view::npos, from = 0;
  for (size_t seg = 0; seg < policy.chunked_segments; ++seg) {
    end = object_key.find('/', from);
    if (end == std::string_view::npos)
      return object_key;
    from = end + 1;
  }
  return object_key.substr(0, end);
}

RecordGate::RecordGate(const ExtractConfig &config) : config(config) {
  predicates.push_back({DropReason::kOperation, [this](const RawFields &f) {
                          return is_target_operation(f.operation,
                                                     this->config);
                        }});
  // 命中排除正则即丢弃 (内部/监控流量)
  predicates.push_back({DropReason::kExcludedIp, [this](const RawFields &f) {
                          absl::Status error;
                          bool excluded =
                              this->config.exclusion.match(f.client_ip, &error);
                          if (!error.ok() && match_error.ok())
                            match_error = error;
                          return !excluded && error.ok();
                        }});
  predicates.push_back({DropReason::kStatusClass, [](const RawFields &f) {
                          return is_success_status(f.status);
                        }});
  predicates.push_back({DropReason::kBytesSentinel, [this](const RawFields &f) {
                          return this->config.bytes_policy !=
                                     BytesSentinelPolicy::kDrop ||
                                 !is_bytes_sentinel(f.bytes_sent);
                        }});
  predicates.push_back({DropReason::kKeyPrefix, [this](const RawFields &f) {
                          return apply_key_policy(f.object_key,
                                                  this->config.key_policy)
                              .has_value();
                        }});
}

GateVerdict RecordGate::evaluate(const RawFields &fields) {
  for (const auto &predicate : predicates) {
    if (!predicate.keep(fields))
      return {false, predicate.reason, {}};
  }
  // 通过了 kKeyPrefix 谓词, 这里一定有值
  auto key = apply_key_policy(fields.object_key, config.key_policy);
  return {true, DropReason::kNone, key.value_or(fields.object_key)};
}

absl::StatusOr<NormalizedEvent>
RecordGate::normalize(const RawFields &fields,
                      const GateVerdict &verdict) const {
  NormalizedEvent event;
  if (verdict.object_key.empty())
    return absl::InvalidArgumentError("object key is missing");

  uint64_t bytes = 0;
  if (is_bytes_sentinel(fields.bytes_sent)) {
    // kDrop 已经在过滤链中丢弃, 这里只剩 kZero
    bytes = 0;
  } else if (!try_stoull(fields.bytes_sent, bytes)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "bytes sent is not a non-negative integer: '",
        absl::string_view(fields.bytes_sent.data(), fields.bytes_sent.size()),
        "'"));
  }

  auto timestamp = normalize_timestamp(
      fields.raw_timestamp, fields.raw_timezone, config.timestamp_encoding);
  if (!timestamp.ok())
    return timestamp.status();

  event.object_key = std::string(verdict.object_key);
  event.timestamp = std::move(*timestamp);
  event.bytes_sent = bytes;
  event.client_ip = std::string(fields.client_ip);
  return event;
}
