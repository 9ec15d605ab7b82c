#pragma once

#include <string>
#include <string_view>

namespace transloom::pipeline {

enum class ErrorKind {
  Configuration,
  Decode,
  Chunking,
  Generation,
  Validation,
  ReassemblyEncode,
  Storage,
  Cancelled,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

/// Kinds that stop the run. Validation and ReassemblyEncode are recovered.
[[nodiscard]] bool is_fatal(ErrorKind kind);

struct PipelineError {
  ErrorKind kind = ErrorKind::Configuration;
  std::string stage;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

} // namespace transloom::pipeline
