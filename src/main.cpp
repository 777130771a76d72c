#include "arg.hpp"
#include "config.hpp"
#include "processor.hpp"
#include "utils/util.hpp"
#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  Args args = parse_args(argc, argv);

  if (args.command == Command::kStop) {
    std::string records_dir = resolve_records_dir(args);
    auto status = request_stop(records_dir);
    if (!status.ok())
      handle_error(std::string(status.message()));
    std::cout << "Stop requested; running jobs exit after their current file."
              << std::endl;
    return 0;
  }

  auto config = make_config(args);
  if (!config.ok())
    handle_error(std::string(config.status().message()));

  RunReport report = args.command == Command::kExtract
                         ? run_extraction(*config)
                         : run_validation(*config);
  print_report(std::cout, std::cerr, report);
  return report.ok() ? 0 : 1;
}
