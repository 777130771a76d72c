#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"
#include <RecordGate.hpp>
#include <string>
#include <string_view>

// 月份名 -> 两位数字
static const absl::flat_hash_map<std::string_view, std::string_view> &
month_table() {
  static const absl::flat_hash_map<std::string_view, std::string_view> table = {
      {"Jan", "01"}, {"Feb", "02"}, {"Mar", "03"}, {"Apr", "04"},
      {"May", "05"}, {"Jun", "06"}, {"Jul", "07"}, {"Aug", "08"},
      {"Sep", "09"}, {"Oct", "10"}, {"Nov", "11"}, {"Dec", "12"}};
  return table;
}

static bool digits_in_range(std::string_view s, int lo, int hi) {
  int value = 0;
  for (char c : s) {
    if (c < '0' || c > '9')
      return false;
    value = value * 10 + (c - '0');
  }
  return value >= lo && value <= hi;
}

absl::StatusOr<std::string> normalize_timestamp(std::string_view raw_timestamp,
                                                std::string_view raw_timezone,
                                                TimestampEncoding encoding) {
  // [DD/Mon/YYYY:HH:MM:SS  共 21 个字符
  //  0123456789012345678901
  auto malformed = [&](const char *what) {
    return absl::InvalidArgumentError(absl::StrCat(
        "malformed timestamp (", what, "): '",
        absl::string_view(raw_timestamp.data(), raw_timestamp.size()), " ",
        absl::string_view(raw_timezone.data(), raw_timezone.size()), "'"));
  };
  if (raw_timestamp.size() != 21 || raw_timestamp[0] != '[' ||
      raw_timestamp[3] != '/' || raw_timestamp[7] != '/' ||
      raw_timestamp[12] != ':' || raw_timestamp[15] != ':' ||
      raw_timestamp[18] != ':')
    return malformed("shape");

  std::string_view day = raw_timestamp.substr(1, 2);
  std::string_view month = raw_timestamp.substr(4, 3);
  std::string_view year = raw_timestamp.substr(8, 4);
  std::string_view hour = raw_timestamp.substr(13, 2);
  std::string_view minute = raw_timestamp.substr(16, 2);
  std::string_view second = raw_timestamp.substr(19, 2);

  if (!digits_in_range(day, 1, 31) || !digits_in_range(year, 0, 9999) ||
      !digits_in_range(hour, 0, 23) || !digits_in_range(minute, 0, 59) ||
      !digits_in_range(second, 0, 60))
    return malformed("field out of range");

  auto it = month_table().find(month);
  if (it == month_table().end())
    return malformed("unknown month");

  // S3 日志总是 UTC; 其它时区直接报错, 保证去掉时区后仍是单射
  if (raw_timezone != "+0000]")
    return malformed("timezone is not +0000");

  if (encoding == TimestampEncoding::kCanonical)
    return std::string(raw_timestamp.substr(1));

  // YYYYMMDDHHMMSS, 字典序即时间序
  return absl::StrCat(
      absl::string_view(year.data(), year.size()),
      absl::string_view(it->second.data(), it->second.size()),
      absl::string_view(day.data(), day.size()),
      absl::string_view(hour.data(), hour.size()),
      absl::string_view(minute.data(), minute.size()),
      absl::string_view(second.data(), second.size()));
}
