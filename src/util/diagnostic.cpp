#include "absl/strings/str_cat.h"
#include <string>
#include <typedef.hpp>

const char *verdict_name(Verdict verdict) {
  switch (verdict) {
  case Verdict::kConsistent:
    return "Consistent";
  case Verdict::kAmbiguousDelimiter:
    return "AmbiguousDelimiter";
  case Verdict::kMissingDelimiter:
    return "MissingDelimiter";
  case Verdict::kMissingGroundTruth:
    return "MissingGroundTruth";
  case Verdict::kUnreliableGroundTruth:
    return "UnreliableGroundTruth";
  case Verdict::kSilentHeuristicDrop:
    return "SilentHeuristicDrop";
  case Verdict::kStatusMismatch:
    return "StatusMismatch";
  }
  return "Unknown";
}

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kConfiguration:
    return "Configuration";
  case ErrorKind::kFormat:
    return "Format";
  case ErrorKind::kConsistency:
    return "Consistency";
  case ErrorKind::kIo:
    return "Io";
  }
  return "Unknown";
}

std::string Diagnostic::to_string() const {
  std::string out =
      absl::StrCat("[ERROR]: ", error_kind_name(kind), " error (",
                   verdict_name(verdict), ") in ", source, " at line ",
                   line_number, ": ", message);
  if (!line.empty())
    absl::StrAppend(&out, "\n[ERROR]: line: ", line);
  return out;
}
