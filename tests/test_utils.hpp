#ifndef S3LOGX_TESTS_TEST_UTILS_HPP
#define S3LOGX_TESTS_TEST_UTILS_HPP

#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace s3logx_test {

namespace fs = std::filesystem;

// 一条 S3 server access log 记录, 默认即 Scenario A
struct LogLine {
  std::string ip = "1.2.3.4";
  std::string operation = "REST.GET.OBJECT";
  std::string key = "my/object/key";
  std::string timestamp = "[10/Oct/2023:13:55:36";
  std::string timezone = "+0000]";
  std::string protocol = "HTTP/1.1";
  std::string status = "200";
  std::string bytes = "4096";

  std::string str() const {
    return "79a59df900b949e55d96a1e698fbaced mybucket " + timestamp + " " +
           timezone + " " + ip +
           " arn:aws:iam::123456789012:user/alice 3E57427F3EXAMPLE " +
           operation + " " + key + " \"GET /mybucket/" + key + " " +
           protocol + "\" " + status + " - " + bytes + " " + bytes +
           " 70 10 \"-\" \"curl/7.81.0\" - "
           "Ek5ZQ0UzpZCyZ7PzEXAMPLE= SigV4 ECDHE-RSA-AES128-GCM-SHA256 "
           "AuthHeader mybucket.s3.us-east-1.amazonaws.com TLSv1.2 - -";
  }
};

// 生命周期规则产生的记录: 没有请求 URI, 也就没有协议版本
inline std::string lifecycle_line() {
  return "79a59df900b949e55d96a1e698fbaced mybucket [10/Oct/2023:13:50:01 "
         "+0000] - AmazonS3 9B7A1C2D3EXAMPLE S3.EXPIRE.OBJECT my/old/key "
         "\"-\" - - - 1024 - - \"-\" \"-\" - - - - - - -";
}

inline ExtractConfig make_test_config(const std::string &exclusion = R"(^10\.)") {
  ExtractConfig config;
  auto re = Pcre2Regex::compile(exclusion);
  EXPECT_TRUE(re.ok()) << re.status();
  if (re.ok())
    config.exclusion = std::move(*re);
  return config;
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline std::vector<std::string> read_lines(const fs::path &path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line))
    lines.push_back(line);
  return lines;
}

inline void write_file(const fs::path &path,
                       const std::vector<std::string> &lines) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  for (const auto &line : lines)
    out << line << '\n';
}

// 每个测试一个独立的临时目录, 析构时删除
class TempDir {
  fs::path root;

public:
  TempDir() {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    root = fs::temp_directory_path() /
           (std::string("s3logx_") + info->test_suite_name() + "_" +
            info->name());
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return root; }
  fs::path operator/(const std::string &name) const { return root / name; }
};

} // namespace s3logx_test

#endif // S3LOGX_TESTS_TEST_UTILS_HPP
