#include "absl/strings/str_cat.h"
#include "utils/util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <processor.hpp>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

RunRecord::RunRecord(std::string path) : path(std::move(path)) {}

absl::StatusOr<std::unique_ptr<RunRecord>>
RunRecord::load(const std::string &records_dir, const std::string &file_name) {
  std::error_code ec;
  fs::create_directories(records_dir, ec);
  if (ec)
    return absl::InternalError(absl::StrCat(
        "Failed to create records directory: ", records_dir, ": ",
        ec.message()));

  auto record =
      std::make_unique<RunRecord>((fs::path(records_dir) / file_name).string());
  std::ifstream in(record->path);
  if (!in)
    return record; // 第一次运行, 还没有记录

  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty())
      record->done.insert(line);
  }
  if (in.bad())
    return absl::DataLossError(
        absl::StrCat("Failed to read record file: ", record->path));
  return record;
}

bool RunRecord::contains(const std::string &shard) const {
  return done.contains(shard);
}

size_t RunRecord::size() const { return done.size(); }

absl::Status RunRecord::append(const std::string &shard) {
  std::lock_guard<std::mutex> lock(mu);
  if (!done.insert(shard))
    return absl::OkStatus();
  std::ofstream out(path, std::ios::out | std::ios::app);
  out << shard << '\n';
  out.flush();
  if (!out)
    return absl::DataLossError(
        absl::StrCat("Failed to append to record file: ", path));
  return absl::OkStatus();
}

absl::Status request_stop(const std::string &records_dir) {
  std::error_code ec;
  fs::create_directories(records_dir, ec);
  if (ec)
    return absl::InternalError(absl::StrCat(
        "Failed to create records directory: ", records_dir, ": ",
        ec.message()));
  auto stop_path = (fs::path(records_dir) / kStopFile).string();
  std::ofstream out(stop_path, std::ios::out | std::ios::app);
  if (!out)
    return absl::InternalError(
        absl::StrCat("Failed to create stop file: ", stop_path));
  return absl::OkStatus();
}

bool stop_requested(const std::string &records_dir) {
  std::error_code ec;
  return fs::exists(fs::path(records_dir) / kStopFile, ec);
}

absl::Status clear_stop(const std::string &records_dir) {
  std::error_code ec;
  fs::remove(fs::path(records_dir) / kStopFile, ec);
  if (ec)
    return absl::InternalError(
        absl::StrCat("Failed to remove stop file: ", ec.message()));
  return absl::OkStatus();
}

absl::StatusOr<VecS> discover_shards(const std::string &input_path) {
  std::error_code ec;
  fs::path root(input_path);
  VecS shards;

  if (fs::is_regular_file(root, ec)) {
    shards.push_back(fs::absolute(root).lexically_normal().string());
    return shards;
  }
  if (!fs::is_directory(root, ec))
    return absl::NotFoundError(
        absl::StrCat("input is neither a file nor a directory: ", input_path));

  fs::recursive_directory_iterator it(root, ec), end;
  if (ec)
    return absl::InternalError(absl::StrCat("Cannot read directory ",
                                            input_path, ": ", ec.message()));
  for (; it != end; it.increment(ec)) {
    if (ec)
      return absl::InternalError(absl::StrCat(
          "Cannot read directory ", input_path, ": ", ec.message()));
    if (it->is_regular_file(ec) && it->path().extension() == ".log")
      shards.push_back(fs::absolute(it->path()).lexically_normal().string());
  }
  std::sort(shards.begin(), shards.end(), natural_less);
  return shards;
}

std::string shard_output_dir(const std::string &input_path,
                             const std::string &shard_path,
                             const std::string &output_dir) {
  fs::path root = fs::absolute(input_path).lexically_normal();
  if (root.filename().empty()) // "logs/" 这类结尾带分隔符的路径
    root = root.parent_path();
  fs::path shard = fs::path(shard_path);
  fs::path relative;

  std::error_code ec;
  if (fs::is_directory(root, ec))
    relative = shard.lexically_relative(root);
  if (relative.empty() || *relative.begin() == "..")
    relative = shard.filename();
  // 去掉 .log 后缀, 保留目录层级
  relative.replace_extension();
  return (fs::path(output_dir) / relative).string();
}
