#include "transloom/pipeline/errors.hpp"

namespace transloom::pipeline {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Configuration:
    return "configuration";
  case ErrorKind::Decode:
    return "decode";
  case ErrorKind::Chunking:
    return "chunking";
  case ErrorKind::Generation:
    return "generation";
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::ReassemblyEncode:
    return "reassembly_encode";
  case ErrorKind::Storage:
    return "storage";
  case ErrorKind::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

bool is_fatal(const ErrorKind kind) {
  return kind != ErrorKind::Validation && kind != ErrorKind::ReassemblyEncode;
}

std::string PipelineError::to_string() const {
  return std::string(error_kind_name(kind)) + " error at " + stage + ": " + message;
}

} // namespace transloom::pipeline
