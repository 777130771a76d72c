#include "absl/strings/str_cat.h"
#include "internal/out.hpp"
#include <OutputSink.hpp>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

std::array<std::string, 4> AlignedOutputSink::file_names() {
  return {kObjectKeysFile, kTimestampsFile, kBytesSentFile, kIpsFile};
}

AlignedOutputSink::AlignedOutputSink(std::string output_dir)
    : output_dir(std::move(output_dir)) {}

AlignedOutputSink::~AlignedOutputSink() {
  for (auto &stream : streams) {
    if (stream.is_open())
      stream.close();
  }
}

absl::Status AlignedOutputSink::open() {
  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec)
    return absl::InternalError(absl::StrCat(
        "Failed to create output directory: ", output_dir, ": ", ec.message()));

  auto names = file_names();
  for (size_t i = 0; i < streams.size(); ++i) {
    auto path = (fs::path(output_dir) / names[i]).string();
    streams[i].open(path, std::ios::out | std::ios::trunc);
    if (!streams[i].is_open())
      return absl::InternalError(
          absl::StrCat("Failed to create output file: ", path));
  }
  written = 0;
  is_open = true;
  DEBUG("sink opened: %s", output_dir.c_str())
  return absl::OkStatus();
}

absl::Status AlignedOutputSink::append(const NormalizedEvent &event) {
  if (!is_open)
    return absl::FailedPreconditionError("output sink is not open");

  // 四个流同步写入同一行
  streams[0] << event.object_key << '\n';
  streams[1] << event.timestamp << '\n';
  streams[2] << event.bytes_sent << '\n';
  streams[3] << event.client_ip << '\n';
  for (const auto &stream : streams) {
    if (!stream)
      return absl::DataLossError(absl::StrCat(
          "Failed to append event ", written + 1, " to ", output_dir));
  }
  ++written;
  return absl::OkStatus();
}

absl::Status AlignedOutputSink::close() {
  if (!is_open)
    return absl::OkStatus();
  is_open = false;

  bool failed = false;
  for (auto &stream : streams) {
    stream.flush();
    failed = failed || !stream;
    stream.close();
  }
  if (failed)
    return absl::DataLossError(
        absl::StrCat("Failed to flush output streams in ", output_dir));

  if (written == 0) {
    std::error_code ec;
    for (const auto &name : file_names()) {
      fs::remove(fs::path(output_dir) / name, ec);
      if (ec)
        return absl::InternalError(absl::StrCat(
            "Failed to remove empty output file ", name, ": ", ec.message()));
    }
    // 目录为空时一并删除
    if (fs::is_empty(output_dir, ec) && !ec) {
      fs::remove(output_dir, ec);
      if (ec)
        return absl::InternalError(absl::StrCat(
            "Failed to remove empty output directory ", output_dir, ": ",
            ec.message()));
    }
  }
  return absl::OkStatus();
}
