#pragma once

// h5gate/runner.hpp — Orchestration: regression runs, allowlist regeneration,
// failure reports and the encoding-sniffing run.
//
// DESIGN:
//   Every operation takes a RunContext: the configuration, the engine to talk
//   to, an optional event log and the two output streams. Nothing here touches
//   std::cout/std::cerr or the environment directly, so the whole layer is
//   testable against a FakeEngine.
//
//   One engine batch per fixture. A failed batch (timeout, bad exit, bad
//   output) is reported once for the fixture and none of its cases count as
//   passing.
//
// TOKENIZER CASES:
//   A case is submitted once per initial state and passes only if every state
//   matches. A case with an unsupported initial state is never submitted and
//   never passes.
//
// TREE CASES:
//   Document and fragment cases of one fixture share a batch. A case passes
//   when the engine returns [tree_dump, error_count] with both matching.

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "h5gate/allowlist.hpp"
#include "h5gate/config.hpp"
#include "h5gate/corpus.hpp"
#include "h5gate/engine.hpp"
#include "h5gate/observability.hpp"

namespace h5gate {

struct RunContext {
  const HarnessConfig& config;
  IEngine& engine;
  EventLog* events{nullptr};
  std::ostream& out;
  std::ostream& err;
};

// Submits one batch and records a BatchEvent for it.
Outcome<jsonlite::Array> submit_batch(RunContext& ctx, const Batch& batch);

// ---------------------------------------------------------------------------
// Tokenizer expansion
// ---------------------------------------------------------------------------

struct TokenizerSlot {
  CaseIndex index{0};
  std::string state;
};

struct TokenizerSubmission {
  Batch batch;
  // Parallel to batch.items.
  std::vector<TokenizerSlot> slots;
  // Cases left out because an initial state is unsupported.
  std::vector<CaseIndex> unsupported;
};

// selection == nullptr submits every case; otherwise only the listed indices,
// which must be in range.
TokenizerSubmission build_tokenizer_submission(const TokenizerFixture& fixture,
                                               const IndexList* selection);

// Per-case verdicts for a tokenizer fixture: passing[i] is true when every
// submitted state of case i matched. mismatches lists (index, state) pairs.
struct TokenizerVerdicts {
  std::vector<bool> passing;
  std::vector<TokenizerSlot> mismatches;
};

TokenizerVerdicts judge_tokenizer(const TokenizerFixture& fixture,
                                  const TokenizerSubmission& submission,
                                  const jsonlite::Array& results);

// ---------------------------------------------------------------------------
// Tree comparison
// ---------------------------------------------------------------------------

enum class TreeVerdict {
  pass,
  tree_mismatch,
  error_count_mismatch,
  both_mismatch,
  invalid_shape,
};

TreeVerdict judge_tree_case(const TreeCase& expected, const jsonlite::Value& got);

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

struct RunSummary {
  std::vector<std::string> failures;
  std::size_t cases_checked{0};
};

// Re-checks every allowlisted case. Fixtures are read from the top level of
// the tokenizer and tree-construction directories.
RunSummary run_allowlisted(RunContext& ctx, const AllowlistDocument& doc);

// Replaces each fixture's entry with the set of currently passing cases and
// prints "<fixture>: Δ<+d> (now <n>)". Returns false when any fixture could
// not be evaluated; such fixtures keep their previous entries.
bool auto_allowlist_tokenizer(RunContext& ctx, AllowlistDocument& doc);
bool auto_allowlist_tree(RunContext& ctx, AllowlistDocument& doc);

struct TokenizerShowRequest {
  std::string fixture;
  CaseIndex index{0};
  std::string state;
};

// "fixture#index#State", e.g. "test3.test#12#RCDATA".
Outcome<TokenizerShowRequest> parse_tokenizer_show(const std::string& text);

struct TokenizerReportOptions {
  std::optional<std::string> fixture;
  std::size_t limit{50};
  std::optional<TokenizerShowRequest> show;
};

// Exit status: 0 when nothing fails, 1 otherwise (including a shown case).
int report_tokenizer_failures(RunContext& ctx, const TokenizerReportOptions& options);

struct TreeReportOptions {
  std::string fixture;
  bool fragment{false};
  std::size_t limit{20};
  std::optional<CaseIndex> show;
};

int report_tree_failures(RunContext& ctx, const TreeReportOptions& options);

// Default fixtures when none are named.
std::vector<std::string> default_encoding_fixtures();

// Runs encoding fixtures (one batch each) and prints up to
// config.encoding_preview_limit mismatches. Exit status 0 or 1.
int run_encoding(RunContext& ctx, const std::vector<std::string>& fixtures);

}  // namespace h5gate
