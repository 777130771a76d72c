#ifndef S3LOGX_OUTPUTSINK_HPP
#define S3LOGX_OUTPUTSINK_HPP

#include "absl/status/status.h"
#include "typedef.hpp"
#include <array>
#include <cstddef>
#include <fstream>
#include <string>

inline constexpr char kObjectKeysFile[] = "object_keys.txt";
inline constexpr char kTimestampsFile[] = "timestamps.txt";
inline constexpr char kBytesSentFile[] = "bytes_sent.txt";
inline constexpr char kIpsFile[] = "full_ips.txt";

// 一个分片的四个输出流, 第 i 行共同描述第 i 个保留的事件.
// 只追加, 不做原地修改; 多个分片不能共享同一个目录
class AlignedOutputSink {
private:
  std::string output_dir;
  std::array<std::ofstream, 4> streams;
  size_t written = 0;
  bool is_open = false;

public:
  explicit AlignedOutputSink(std::string output_dir);
  ~AlignedOutputSink();

  AlignedOutputSink(const AlignedOutputSink &) = delete;
  AlignedOutputSink &operator=(const AlignedOutputSink &) = delete;

  // 创建目录并截断四个文件
  absl::Status open();
  absl::Status append(const NormalizedEvent &event);
  // 没有写入任何事件时删除空文件
  absl::Status close();

  size_t size() const { return written; }
  const std::string &dir() const { return output_dir; }

  static std::array<std::string, 4> file_names();
};

#endif // S3LOGX_OUTPUTSINK_HPP
