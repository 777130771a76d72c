#ifndef S3LOGX_ARG_HPP
#define S3LOGX_ARG_HPP

#include <cstdlib>
#include <iostream>
#include <string>

enum class Command { kNone, kExtract, kValidate, kStop };

struct Args {
  Command command;
  std::string input_path;
  std::string output_dir;
  std::string records_dir;
  std::string ips_to_skip; // 为空时从环境变量 IPS_TO_SKIP_REGEX 读取
  std::string mode;
  std::string bytes_sentinel;
  std::string timestamp_format;
  unsigned int num_threads;
  unsigned int limit; // 0 表示不限制
  unsigned int self_check_lines;
  bool is_help;
};

Args parse_args(int argc, char **argv);
void print_usage(std::ostream &os, const char *prog);

#endif // S3LOGX_ARG_HPP
