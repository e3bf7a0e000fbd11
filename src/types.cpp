#include "h5gate/types.hpp"

namespace h5gate {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::fixture_malformed: return "fixture_malformed";
    case ErrorCode::unsupported_state: return "unsupported_state";
    case ErrorCode::allowlist_invalid: return "allowlist_invalid";
    case ErrorCode::range_invalid: return "range_invalid";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::runner_exit_nonzero: return "runner_exit_nonzero";
    case ErrorCode::runner_output_invalid: return "runner_output_invalid";
    case ErrorCode::runner_output_length: return "runner_output_length";
    case ErrorCode::runner_missing: return "runner_missing";
    case ErrorCode::build_failed: return "build_failed";
    case ErrorCode::history_unavailable: return "history_unavailable";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string to_string(SuiteKind kind) {
  switch (kind) {
    case SuiteKind::tokenizer: return "tokenizer";
    case SuiteKind::tree_doc: return "tree-doc";
    case SuiteKind::tree_frag: return "tree-frag";
  }
  return "";
}

std::optional<SuiteKind> parse_suite_kind(std::string_view name) {
  if (name == "tokenizer") return SuiteKind::tokenizer;
  if (name == "tree-doc") return SuiteKind::tree_doc;
  if (name == "tree-frag") return SuiteKind::tree_frag;
  return std::nullopt;
}

}  // namespace h5gate
