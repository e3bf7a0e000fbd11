#include "h5gate/engine.hpp"

#include <filesystem>

#include "h5gate/base64.hpp"
#include "h5gate/process.hpp"
#include "h5gate/version.hpp"

namespace fs = std::filesystem;

namespace h5gate {

namespace {

// Runner builds are slow (whole-program optimizing compiler).
constexpr std::uint64_t kBuildTimeoutMs = 30ull * 60ull * 1000ull;

std::string field_or_dash(const std::optional<std::string>& v) {
  return (v && !v->empty()) ? *v : std::string("-");
}

// Last few lines of a child's stderr, for one-line diagnostics.
std::string stderr_tail(const std::string& text) {
  constexpr std::size_t kMax = 400;
  std::string t = text;
  while (!t.empty() && (t.back() == '\n' || t.back() == '\r')) t.pop_back();
  if (t.size() > kMax) t = "..." + t.substr(t.size() - kMax);
  return t;
}

}  // namespace

std::string to_string(BatchMode mode) {
  switch (mode) {
    case BatchMode::tokenizer: return "tokenizer-batch";
    case BatchMode::tokenizer_xml: return "tokenizer-batch-xml";
    case BatchMode::tree: return "tree-batch";
    case BatchMode::encoding: return "encoding-batch";
  }
  return "tokenizer-batch";
}

BatchItem make_tokenizer_item(const std::string& state,
                              const std::optional<std::string>& last_start_tag,
                              const std::string& input) {
  BatchItem item;
  item.fields = {state, field_or_dash(last_start_tag)};
  item.payload = input;
  return item;
}

BatchItem make_tree_item(const std::optional<std::string>& fragment_context,
                         const std::optional<std::string>& scripting,
                         const std::string& input) {
  BatchItem item;
  item.fields = {fragment_context ? "frag" : "doc", field_or_dash(fragment_context),
                 field_or_dash(scripting)};
  item.payload = input;
  return item;
}

BatchItem make_encoding_item(const std::optional<std::string>& transport,
                             const std::string& bytes) {
  BatchItem item;
  item.fields = {field_or_dash(transport)};
  item.payload = bytes;
  return item;
}

std::string encode_request(const Batch& batch) {
  std::string out = std::to_string(batch.items.size());
  out.push_back('\n');
  for (const auto& item : batch.items) {
    const std::string payload = base64_encode(item.payload);
    for (const auto& f : item.fields) {
      out += f;
      out.push_back('\t');
    }
    out += std::to_string(payload.size());
    out.push_back('\n');
    for (std::size_t i = 0; i < payload.size(); i += version::PAYLOAD_LINE_WIDTH) {
      out.append(payload, i, version::PAYLOAD_LINE_WIDTH);
      out.push_back('\n');
    }
  }
  return out;
}

Outcome<jsonlite::Array> decode_response(const std::string& stdout_text,
                                         std::size_t expected_len) {
  using R = Outcome<jsonlite::Array>;
  std::optional<jsonlite::JsonError> err;
  auto parsed = jsonlite::parse_value(stdout_text, &err);
  if (!parsed) {
    return R::failure(ErrorCode::runner_output_invalid,
                      "runner stdout is not JSON: " + (err ? err->message : std::string("empty")));
  }
  if (!parsed->is_array()) {
    return R::failure(ErrorCode::runner_output_invalid, "runner stdout is not a JSON array");
  }
  const auto& arr = parsed->as_array();
  if (arr.size() != expected_len) {
    return R::failure(ErrorCode::runner_output_length,
                      "runner returned " + std::to_string(arr.size()) + " results for " +
                          std::to_string(expected_len) + " cases");
  }
  return R::success(arr);
}

Outcome<jsonlite::Array> SubprocessEngine::submit(const Batch& batch) {
  using R = Outcome<jsonlite::Array>;
  last_request_bytes_ = 0;
  last_response_bytes_ = 0;
  if (batch.items.empty()) return R::success({});

  std::error_code ec;
  if (!fs::exists(config_.runner_path, ec)) {
    return R::failure(ErrorCode::runner_missing, "runner not found: " + config_.runner_path);
  }

  ProcessSpec spec;
  spec.command = config_.runner_path;
  spec.argv = {to_string(batch.mode)};
  spec.cwd = config_.repo_root;
  spec.stdin_text = encode_request(batch);
  spec.timeout_ms = config_.timeout_ms;
  last_request_bytes_ = spec.stdin_text.size();

  const ProcessResult pr = run_process(spec);
  last_response_bytes_ = pr.stdout_text.size();
  if (!pr.error_message.empty()) {
    return R::failure(ErrorCode::spawn_failed, pr.error_message);
  }
  if (pr.timed_out) {
    return R::failure(ErrorCode::timeout, "runner exceeded " +
                                              std::to_string(config_.timeout_ms) + " ms");
  }
  if (pr.exit_code != 0) {
    std::string msg = "runner exited with status " + std::to_string(pr.exit_code);
    const std::string tail = stderr_tail(pr.stderr_text);
    if (!tail.empty()) msg += ": " + tail;
    return R::failure(ErrorCode::runner_exit_nonzero, msg);
  }
  return decode_response(pr.stdout_text, batch.items.size());
}

Outcome<jsonlite::Array> FakeEngine::submit(const Batch& batch) {
  last_request_bytes_ = 0;
  last_response_bytes_ = 0;
  if (batch.items.empty()) return Outcome<jsonlite::Array>::success({});
  submitted_.push_back(batch);
  last_request_bytes_ = encode_request(batch).size();
  auto out = responder_(batch);
  if (out.ok()) last_response_bytes_ = jsonlite::to_json(jsonlite::Value(out.value)).size();
  if (out.ok() && out.value.size() != batch.items.size()) {
    return Outcome<jsonlite::Array>::failure(
        ErrorCode::runner_output_length,
        "runner returned " + std::to_string(out.value.size()) + " results for " +
            std::to_string(batch.items.size()) + " cases");
  }
  return out;
}

Outcome<bool> ensure_runner_built(const HarnessConfig& config, bool force) {
  using R = Outcome<bool>;
  std::error_code ec;
  const fs::path exe(config.runner_path);

  if (!force && fs::exists(exe, ec)) {
    bool stale = false;
    const auto exe_time = fs::last_write_time(exe, ec);
    if (ec) {
      stale = true;
    } else if (fs::is_directory(config.build_source_dir, ec)) {
      for (fs::recursive_directory_iterator it(config.build_source_dir, ec), end;
           !ec && it != end; it.increment(ec)) {
        if (it->path().extension().string() != config.build_source_ext) continue;
        std::error_code tec;
        const auto t = fs::last_write_time(it->path(), tec);
        if (tec || t > exe_time) {
          stale = true;
          break;
        }
      }
      if (ec) stale = true;
    }
    if (!stale) return R::success(false);
  }

  if (config.build_command.empty()) {
    return R::failure(ErrorCode::build_failed, "no runner build command configured");
  }
  if (exe.has_parent_path()) {
    fs::create_directories(exe.parent_path(), ec);
    if (ec) {
      return R::failure(ErrorCode::build_failed,
                        "cannot create " + exe.parent_path().string() + ": " + ec.message());
    }
  }

  ProcessSpec spec;
  spec.command = config.build_command.front();
  spec.argv.assign(config.build_command.begin() + 1, config.build_command.end());
  spec.cwd = config.repo_root;
  spec.timeout_ms = kBuildTimeoutMs;
  const ProcessResult pr = run_process(spec);
  if (!pr.ok()) {
    std::string msg = pr.error_message;
    if (msg.empty()) {
      msg = pr.timed_out ? std::string("build timed out")
                         : "build exited with status " + std::to_string(pr.exit_code);
    }
    const std::string tail = stderr_tail(pr.stderr_text);
    if (!tail.empty()) msg += ": " + tail;
    return R::failure(ErrorCode::build_failed, msg);
  }

  fs::permissions(exe,
                  fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                      fs::perms::others_read | fs::perms::others_exec,
                  fs::perm_options::replace, ec);
  if (ec) {
    return R::failure(ErrorCode::build_failed,
                      "build did not produce " + exe.string() + ": " + ec.message());
  }
  return R::success(true);
}

}  // namespace h5gate
