#include "arg.hpp"
#include "utils/util.hpp"
#include <cstdint>
#include <string>

void print_usage(std::ostream &os, const char *prog) {
  os << "Usage:\n"
     << "  " << prog << " extract <file|dir> -o <dir> [options]\n"
     << "  " << prog << " validate <file|dir> [options]\n"
     << "  " << prog << " stop [-o <dir>] [--records <dir>]\n"
     << "Options:\n"
     << "  -o <dir>                  Output directory for aligned streams\n"
     << "  -t <integer>              num of worker threads (default 1)\n"
     << "  -l <integer>              max number of log files (default all)\n"
     << "  --records <dir>           Records directory (default <out>/records,"
        " ./s3logx_records without -o)\n"
     << "  --ips-to-skip <regex>     IP exclusion regex (default "
        "$IPS_TO_SKIP_REGEX)\n"
     << "  --mode dandi              Only keep blobs/ and zarr/ object keys\n"
     << "  --bytes-sentinel zero|drop  Policy for '-' bytes sent (default "
        "zero)\n"
     << "  --timestamp canonical|compact  Timestamp encoding (default "
        "canonical)\n"
     << "  --self-check <integer>    Lines validated before extracting each "
        "file (default 100)\n";
}

static unsigned int parse_uint(const std::string &opt, const char *value) {
  uint32_t v;
  if (!try_stoul(value, v))
    handle_error("invalid value for " + opt + ": " + value);
  return v;
}

Args parse_args(int argc, char *argv[]) {
  Args args = {
      .command = Command::kNone,
      .input_path = "",
      .output_dir = "",
      .records_dir = "",
      .ips_to_skip = "",
      .mode = "",
      .bytes_sentinel = "zero",
      .timestamp_format = "canonical",
      .num_threads = 1,
      .limit = 0,
      .self_check_lines = 100,
      .is_help = false,
  };

  int i = 1;
  if (argc > 1) {
    std::string cmd = argv[1];
    if (cmd == "extract") {
      args.command = Command::kExtract;
      ++i;
    } else if (cmd == "validate") {
      args.command = Command::kValidate;
      ++i;
    } else if (cmd == "stop") {
      args.command = Command::kStop;
      ++i;
    }
  }

  for (; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(std::cout, argv[0]);
      args.is_help = true;
    } else if (arg == "-o" && i + 1 < argc) {
      args.output_dir = argv[++i];
    } else if (arg == "-t" && i + 1 < argc) {
      args.num_threads = parse_uint(arg, argv[++i]);
    } else if (arg == "-l" && i + 1 < argc) {
      args.limit = parse_uint(arg, argv[++i]);
    } else if (arg == "--records" && i + 1 < argc) {
      args.records_dir = argv[++i];
    } else if (arg == "--ips-to-skip" && i + 1 < argc) {
      args.ips_to_skip = argv[++i];
    } else if (arg == "--mode" && i + 1 < argc) {
      args.mode = argv[++i];
    } else if (arg == "--bytes-sentinel" && i + 1 < argc) {
      args.bytes_sentinel = argv[++i];
    } else if (arg == "--timestamp" && i + 1 < argc) {
      args.timestamp_format = argv[++i];
    } else if (arg == "--self-check" && i + 1 < argc) {
      args.self_check_lines = parse_uint(arg, argv[++i]);
    } else if (!arg.empty() && arg[0] == '-') {
      handle_error("unknown option: " + arg);
    } else if (args.input_path.empty()) {
      args.input_path = arg;
    } else {
      handle_error("unexpected argument: " + arg);
    }
  }
  if (args.is_help) {
    exit(0);
  } else if (args.command == Command::kNone) {
    print_usage(std::cerr, argv[0]);
    handle_error("command not specified (extract, validate or stop)");
  } else if (args.command != Command::kStop && args.input_path.empty()) {
    handle_error("input file or directory not specified");
  } else if (args.command == Command::kExtract && args.output_dir.empty()) {
    handle_error("output directory not specified (-o <dir>)");
  } else if (!args.output_dir.empty() && args.output_dir[0] == '-') {
    handle_error("invalid output directory: " + args.output_dir);
  } else if (args.num_threads == 0) {
    handle_error("num of threads must be positive");
  }
  return args;
}
