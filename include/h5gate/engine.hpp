#pragma once

// h5gate/engine.hpp — Batch protocol client for the external HTML engine.
//
// REQUEST (engine stdin, one write per batch):
//   <case count>\n
//   per case:
//     <header fields joined by TAB>\t<payload length>\n
//     <payload, base64, split into PAYLOAD_LINE_WIDTH-character lines>\n...
//   Header fields by mode:
//     tokenizer-batch[-xml]  state, last-start-tag or "-"
//     tree-batch             "doc" | "frag", context or "-", "on" | "off" | "-"
//     encoding-batch         transport hint or "-"
//   The payload is the case input as generalized UTF-8 (unpaired surrogates
//   passed through), base64 encoded. An empty payload contributes no lines.
//
// RESPONSE (engine stdout after exit status 0):
//   One JSON array with exactly one element per case, in request order.
//
// FAILURE POLICY:
//   Non-zero exit, timeout, unparsable stdout and wrong array length all fail
//   the whole batch (fatal). No element of a failed batch is trusted.
//
// EXTENSION_POINT: engine backends
//   IEngine is the seam. SubprocessEngine talks to the real runner; FakeEngine
//   answers from a callback and records what it was sent, for tests.

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "h5gate/config.hpp"
#include "h5gate/jsonlite.hpp"
#include "h5gate/types.hpp"

namespace h5gate {

enum class BatchMode {
  tokenizer,
  tokenizer_xml,
  tree,
  encoding,
};

// Runner argument: "tokenizer-batch", "tokenizer-batch-xml", "tree-batch",
// "encoding-batch".
std::string to_string(BatchMode mode);

struct BatchItem {
  std::vector<std::string> fields;
  // Raw bytes; base64 is applied by encode_request.
  std::string payload;
};

BatchItem make_tokenizer_item(const std::string& state,
                              const std::optional<std::string>& last_start_tag,
                              const std::string& input);
BatchItem make_tree_item(const std::optional<std::string>& fragment_context,
                         const std::optional<std::string>& scripting,
                         const std::string& input);
BatchItem make_encoding_item(const std::optional<std::string>& transport,
                             const std::string& bytes);

struct Batch {
  BatchMode mode{BatchMode::tokenizer};
  // Label for diagnostics and events only; never sent.
  std::string fixture;
  std::vector<BatchItem> items;
};

std::string encode_request(const Batch& batch);

Outcome<jsonlite::Array> decode_response(const std::string& stdout_text,
                                         std::size_t expected_len);

class IEngine {
 public:
  virtual ~IEngine() = default;

  // One engine invocation for the whole batch. An empty batch is not sent and
  // yields an empty array.
  virtual Outcome<jsonlite::Array> submit(const Batch& batch) = 0;

  virtual std::string engine_id() const = 0;

  // Sizes of the last submission's request and response; 0 when nothing was
  // sent or nothing came back.
  std::size_t last_request_bytes() const { return last_request_bytes_; }
  std::size_t last_response_bytes() const { return last_response_bytes_; }

 protected:
  std::size_t last_request_bytes_{0};
  std::size_t last_response_bytes_{0};
};

class SubprocessEngine : public IEngine {
 public:
  explicit SubprocessEngine(const HarnessConfig& config) : config_(config) {}

  Outcome<jsonlite::Array> submit(const Batch& batch) override;
  std::string engine_id() const override { return "subprocess:" + config_.runner_path; }

 private:
  const HarnessConfig& config_;
};

class FakeEngine : public IEngine {
 public:
  using Responder = std::function<Outcome<jsonlite::Array>(const Batch&)>;

  explicit FakeEngine(Responder responder) : responder_(std::move(responder)) {}

  Outcome<jsonlite::Array> submit(const Batch& batch) override;
  std::string engine_id() const override { return "fake"; }

  const std::vector<Batch>& submitted() const { return submitted_; }

 private:
  Responder responder_;
  std::vector<Batch> submitted_;
};

// Builds the runner when it is missing, when force is set, or when any
// build_source_ext file under build_source_dir is newer than it. value is true
// when a build ran.
Outcome<bool> ensure_runner_built(const HarnessConfig& config, bool force);

}  // namespace h5gate
