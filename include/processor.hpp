#ifndef S3LOGX_PROCESSOR_HPP
#define S3LOGX_PROCESSOR_HPP

#include "OutputSink.hpp"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "config.hpp"
#include "typedef.hpp"
#include "utils/IndexSet.hpp"
#include <cstddef>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

inline constexpr char kExtractionRecordFile[] = "extraction.txt";
inline constexpr char kValidationRecordFile[] = "validation.txt";
inline constexpr char kStopFile[] = "stop_extraction";

struct RunOptions {
  // 第一个失败后不再派发新的分片
  bool fail_fast = true;
};

struct RunReport {
  std::vector<ShardOutcome> shards;
  std::optional<Diagnostic> config_error;
  bool stopped = false;

  bool ok() const;
  size_t failed() const;
  size_t emitted() const;
};

// 已完成分片的记录文件, 每行一个绝对路径, 用于断点续跑
class RunRecord {
private:
  std::string path;
  IndexSet<std::string> done;
  std::mutex mu;

public:
  explicit RunRecord(std::string path);
  static absl::StatusOr<std::unique_ptr<RunRecord>>
  load(const std::string &records_dir, const std::string &file_name);

  bool contains(const std::string &shard) const;
  absl::Status append(const std::string &shard);
  size_t size() const;
};

absl::Status request_stop(const std::string &records_dir);
bool stop_requested(const std::string &records_dir);
absl::Status clear_stop(const std::string &records_dir);

// 单个文件或目录下递归的 *.log, 自然排序
absl::StatusOr<VecS> discover_shards(const std::string &input_path);
// <output>/<相对路径去掉 .log>/
std::string shard_output_dir(const std::string &input_path,
                             const std::string &shard_path,
                             const std::string &output_dir);

// 单个分片的生产路径, 严格单线程顺序扫描
ShardOutcome extract_stream(std::istream &in, const std::string &source,
                            AlignedOutputSink &sink,
                            const ExtractConfig &config);
ShardOutcome extract_shard(const std::string &shard_path,
                           const std::string &output_dir,
                           const ExtractConfig &config);

// 校验路径: 不产生输出, 第一个致命结果即停止.
// require_anchor = false 时只有目标行缺少锚点才致命 (抽取前的自检)
ShardOutcome validate_stream(std::istream &in, const std::string &source,
                             const ExtractConfig &config,
                             size_t max_lines = 0, bool require_anchor = true);
ShardOutcome validate_shard(const std::string &shard_path,
                            const ExtractConfig &config);

RunReport run_extraction(const ExtractConfig &config,
                         const RunOptions &options = {});
RunReport run_validation(const ExtractConfig &config,
                         const RunOptions &options = {});

void print_report(std::ostream &out, std::ostream &err,
                  const RunReport &report);

#endif // S3LOGX_PROCESSOR_HPP
