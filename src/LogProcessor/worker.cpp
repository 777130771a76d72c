#include "internal/out.hpp"
#include "utils/IndexManager.hpp"
#include "utils/util.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <mutex>
#include <processor.hpp>
#include <thread>
#include <utility>
#include <vector>

namespace chr = std::chrono;
using namespace std;

bool RunReport::ok() const {
  if (config_error)
    return false;
  return all_of(shards.begin(), shards.end(),
                [](const ShardOutcome &s) { return s.ok(); });
}

size_t RunReport::failed() const {
  return count_if(shards.begin(), shards.end(),
                  [](const ShardOutcome &s) { return !s.ok(); });
}

size_t RunReport::emitted() const {
  size_t total = 0;
  for (const auto &s : shards)
    total += s.stats.emitted;
  return total;
}

static Diagnostic setup_error(const ExtractConfig &config, ErrorKind kind,
                              const absl::Status &status) {
  return Diagnostic{kind, Verdict::kConsistent, 0, config.input_path, "",
                    string(status.message())};
}

using ShardFn = function<ShardOutcome(const string &shard)>;

// 分片之间没有共享的可变状态, 只共享只读的 config
static RunReport run_shards(const ExtractConfig &config,
                            const RunOptions &options, const char *record_file,
                            const char *label, const ShardFn &process) {
  auto start_time = chr::steady_clock::now();
  RunReport report;

  // 配置检查必须在读取任何一行之前
  auto status = check_config(config);
  if (!status.ok()) {
    report.config_error = setup_error(config, ErrorKind::kConfiguration, status);
    return report;
  }

  auto record = RunRecord::load(config.records_dir, record_file);
  if (!record.ok()) {
    report.config_error = setup_error(config, ErrorKind::kIo, record.status());
    return report;
  }
  status = clear_stop(config.records_dir);
  if (!status.ok()) {
    report.config_error = setup_error(config, ErrorKind::kIo, status);
    return report;
  }

  auto all_shards = discover_shards(config.input_path);
  if (!all_shards.ok()) {
    report.config_error =
        setup_error(config, ErrorKind::kIo, all_shards.status());
    return report;
  }

  VecS shards;
  for (auto &shard : *all_shards) {
    if ((*record)->contains(shard))
      continue;
    if (config.limit != 0 && shards.size() >= config.limit)
      break;
    shards.emplace_back(move(shard));
  }
  cout << label << ": " << all_shards->size() << " log files found, "
       << shards.size() << " to process" << endl;
  if (shards.empty())
    return report;

  // num_threads * shards_per_thread >= shards.size()
  size_t num_threads = min<size_t>(config.num_threads, shards.size());
  size_t shards_per_thread = (shards.size() + num_threads - 1) / num_threads;
  vector<IndexManager> ranges;
  for (size_t start = 0; start < shards.size(); start += shards_per_thread) {
    size_t len = min(shards_per_thread, shards.size() - start);
    ranges.emplace_back(start, len);
    DEBUG("Thread %zu: shards %zu - %zu", ranges.size() - 1, start,
          start + len)
  }

  report.shards.resize(shards.size());
  atomic<bool> abort_run{false};
  atomic<bool> stopped{false};
  mutex out_mu;
  RunRecord &done = **record;

  vector<thread> workers;
  for (size_t i = 0; i < ranges.size(); ++i) {
    workers.emplace_back([&, i] {
      const auto &im = ranges[i];
      for (size_t k = 0; k < im.len(); ++k) {
        const size_t j = im[k];
        auto &slot = report.shards[j];
        slot.source = shards[j];
        if (abort_run.load()) {
          slot.skipped = true;
          continue;
        }
        // 只在分片之间检查停止文件, 已完成的分片输出保持有效
        if (stop_requested(config.records_dir)) {
          stopped = true;
          slot.skipped = true;
          continue;
        }

        auto shard_start = chr::steady_clock::now();
        {
          lock_guard<mutex> lock(out_mu);
          cout << "Processing " << shards[j] << " ..." << endl;
        }
        slot = process(shards[j]);
        if (slot.ok()) {
          auto s = done.append(shards[j]);
          if (!s.ok())
            slot.failure = Diagnostic{ErrorKind::kIo, Verdict::kConsistent, 0,
                                      shards[j], "", string(s.message())};
        }
        if (!slot.ok() && options.fail_fast)
          abort_run = true;

        auto elapsed = chr::duration_cast<chr::milliseconds>(
            chr::steady_clock::now() - shard_start);
        lock_guard<mutex> lock(out_mu);
        cout << (slot.ok() ? "Processed " : "Failed ") << shards[j] << " in "
             << elapsed.count() << "ms (" << slot.stats.lines << " lines, "
             << slot.stats.emitted << " emitted, " << slot.stats.dropped
             << " dropped)" << endl;
      }
    });
  }

  // 等待所有工作线程完成
  for (auto &worker : workers) {
    if (worker.joinable())
      worker.join();
  }
  report.stopped = stopped.load();

  auto elapsed = chr::duration_cast<chr::milliseconds>(
      chr::steady_clock::now() - start_time);
  cout << "Total Processing time taken: " << elapsed.count() << "ms\n";
  return report;
}

RunReport run_extraction(const ExtractConfig &config,
                         const RunOptions &options) {
  return run_shards(config, options, kExtractionRecordFile, "extract",
                    [&config](const string &shard) {
                      return extract_shard(
                          shard,
                          shard_output_dir(config.input_path, shard,
                                           config.output_dir),
                          config);
                    });
}

RunReport run_validation(const ExtractConfig &config,
                         const RunOptions &options) {
  return run_shards(config, options, kValidationRecordFile, "validate",
                    [&config](const string &shard) {
                      return validate_shard(shard, config);
                    });
}

void print_report(ostream &out, ostream &err, const RunReport &report) {
  if (report.config_error) {
    err << report.config_error->to_string() << endl;
    return;
  }
  size_t skipped = 0;
  for (const auto &s : report.shards) {
    if (s.skipped)
      ++skipped;
    else if (s.failure)
      err << s.failure->to_string() << endl;
  }
  out << report.shards.size() - skipped << " files processed, "
      << report.failed() << " failed, " << skipped << " skipped, "
      << report.emitted() << " events emitted" << endl;
  if (report.stopped)
    out << "Stopped by request; rerun to resume." << endl;
}
