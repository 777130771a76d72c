#ifndef S3LOGX_PCRE2REGEX_HPP
#define S3LOGX_PCRE2REGEX_HPP
#define PCRE2_CODE_UNIT_WIDTH 8
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include <cstddef>
#include <cstdint>
#include <pcre2.h>
#include <string>
#include <string_view>
#include <utility>

inline std::string pcre2_error_message(int error_code) {
  char buffer[256];
  pcre2_get_error_message_8(error_code, (PCRE2_UCHAR8 *)buffer,
                            sizeof(buffer));
  return buffer;
}

// 逐个返回匹配区间, 持有自己的 match_data
class Pcre2RegexIterator {
  PCRE2_SPTR c_str;
  size_t length;
  size_t start_offset;
  const pcre2_code *code;
  pcre2_match_data *match_data;
  bool is_end;
  PCRE2_SIZE *ovector;
  int rc;

public:
  // 禁用拷贝
  Pcre2RegexIterator(const Pcre2RegexIterator &) = delete;
  Pcre2RegexIterator &operator=(const Pcre2RegexIterator &) = delete;
  Pcre2RegexIterator(std::string_view subject, const pcre2_code *code)
      : c_str(reinterpret_cast<PCRE2_SPTR>(subject.data())),
        length(subject.length()), start_offset(0), code(code),
        match_data(pcre2_match_data_create_from_pattern(code, nullptr)),
        is_end(match_data == nullptr), ovector(nullptr), rc(0) {
    next();
  }

  ~Pcre2RegexIterator() {
    if (match_data)
      pcre2_match_data_free(match_data);
  }

  void next() {
    if (is_end || start_offset >= length) {
      is_end = true;
      return;
    }
    rc = pcre2_match(code, c_str, length, start_offset, 0, match_data,
                     nullptr);
    if (rc < 0) {
      // NOMATCH 以外的错误也当作结束, 由 status() 暴露
      is_end = true;
    } else {
      ovector = pcre2_get_ovector_pointer(match_data);
      start_offset = ovector[1];
      if (ovector[0] == ovector[1])
        ++start_offset;
    }
  }

  std::pair<size_t, size_t> cap(int i = 0) const {
    return {ovector[2 * i], ovector[2 * i + 1]};
  }

  bool end() const { return is_end; }

  absl::Status status() const {
    if (match_data == nullptr)
      return absl::ResourceExhaustedError("Match data creation failed");
    if (rc < 0 && rc != PCRE2_ERROR_NOMATCH)
      return absl::InternalError(
          absl::StrCat("Matching error: ", pcre2_error_message(rc)));
    return absl::OkStatus();
  }
};

// 编译后的 pcre2_code 只读, 可以被多个线程同时使用;
// match_data 每次匹配单独创建, 不共享 JIT 栈
class Pcre2Regex {
public:
  static absl::StatusOr<Pcre2Regex> compile(const std::string &pattern,
                                            uint32_t options = 0) {
    int errorcode;
    PCRE2_SIZE erroroffset;

    Pcre2Regex re;
    re.pattern_ = pattern;
    re.code_ = pcre2_compile_8(reinterpret_cast<PCRE2_SPTR>(pattern.c_str()),
                               PCRE2_ZERO_TERMINATED, options, &errorcode,
                               &erroroffset, nullptr);
    if (!re.code_)
      return absl::InvalidArgumentError(
          absl::StrCat("Regex compilation failed: ",
                       pcre2_error_message(errorcode), " at offset ",
                       erroroffset, " in '", pattern, "'"));

    // JIT 失败时退回解释执行
    if (pcre2_jit_compile_8(re.code_, PCRE2_JIT_COMPLETE) == 0)
      re.jit_ = true;
    return re;
  }

  Pcre2Regex() = default;

  ~Pcre2Regex() {
    if (code_)
      pcre2_code_free(code_);
  }

  // 禁用拷贝
  Pcre2Regex(const Pcre2Regex &) = delete;
  Pcre2Regex &operator=(const Pcre2Regex &) = delete;

  Pcre2Regex(Pcre2Regex &&other) noexcept
      : code_(std::exchange(other.code_, nullptr)),
        pattern_(std::move(other.pattern_)), jit_(other.jit_) {}

  Pcre2Regex &operator=(Pcre2Regex &&other) noexcept {
    if (this != &other) {
      if (code_)
        pcre2_code_free(code_);
      code_ = std::exchange(other.code_, nullptr);
      pattern_ = std::move(other.pattern_);
      jit_ = other.jit_;
    }
    return *this;
  }

  bool valid() const { return code_ != nullptr; }
  bool jit() const { return jit_; }
  const std::string &pattern() const { return pattern_; }

  // 部分匹配 (与 awk 的 ~ 一致), 错误按不匹配处理并写入 error
  bool match(std::string_view subject, absl::Status *error = nullptr) const {
    if (!code_)
      return false;
    pcre2_match_data *match_data =
        pcre2_match_data_create_from_pattern(code_, nullptr);
    if (!match_data) {
      if (error)
        *error = absl::ResourceExhaustedError("Match data creation failed");
      return false;
    }

    // 空 string_view 的 data() 可能为 nullptr
    const char *data = subject.empty() ? "" : subject.data();
    int rc = pcre2_match(code_, reinterpret_cast<PCRE2_SPTR>(data),
                         subject.length(),
                         0, // start offset
                         0, match_data, nullptr);

    pcre2_match_data_free(match_data);

    if (rc < 0) {
      if (rc != PCRE2_ERROR_NOMATCH && error)
        *error = absl::InternalError(
            absl::StrCat("Matching error: ", pcre2_error_message(rc)));
      return false;
    }
    return true;
  }

  Pcre2RegexIterator get_iter(std::string_view subject) const {
    return Pcre2RegexIterator(subject, code_);
  }

private:
  pcre2_code *code_ = nullptr;
  std::string pattern_;
  bool jit_ = false;
};

#endif // S3LOGX_PCRE2REGEX_HPP
