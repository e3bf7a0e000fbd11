#pragma once

// h5gate/corpus.hpp — Fixture discovery and parsing for the three suite
// families of html5lib-tests.
//
// FORMATS:
//   tokenizer/*.test          one JSON document; cases under "tests" or
//                             "xmlViolationTests".
//   tree-construction/*.dat   text blocks introduced by a "#data" line.
//   encoding/*.dat            text blocks of "#data" + "#encoding".
//
// CASE NUMBERING:
//   Allowlists address cases by zero-based position. Tokenizer cases are
//   numbered in array order. Tree-construction document and fragment cases
//   are numbered independently, each in file order. Encoding cases are
//   numbered in file order.
//
// FAILURE POLICY:
//   A block missing a required directive fails the whole fixture (fatal).
//   Dropping only that block would shift the index of every later case and
//   silently re-target the allowlist. The one skip-recoverable condition is
//   an unsupported tokenizer initial state: that case is simply never
//   submitted and counts as not passing.

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "h5gate/jsonlite.hpp"
#include "h5gate/types.hpp"

namespace h5gate {

// ---------------------------------------------------------------------------
// Tokenizer fixtures
// ---------------------------------------------------------------------------

constexpr const char* kDefaultInitialState = "Data state";

struct TokenizerCase {
  CaseIndex index{0};
  // Normalized: escape-decoded when double_escaped, then forgiving
  // round-tripped (see utf8.hpp).
  std::string input;
  jsonlite::Value expected;
  std::optional<std::string> last_start_tag;
  // html5lib state names as written in the fixture; never empty.
  std::vector<std::string> initial_states;
  bool double_escaped{false};
};

struct TokenizerFixture {
  std::string name;
  std::string path;
  bool xml_violation{false};
  std::vector<TokenizerCase> cases;
};

// Engine state argument for an html5lib initial state name. Unknown names are
// skip-recoverable (ErrorCode::unsupported_state).
Outcome<std::string> map_initial_state(const std::string& html5lib_name);

Outcome<TokenizerCase> normalize_tokenizer_case(const jsonlite::Value& raw, CaseIndex index);
Outcome<TokenizerFixture> parse_tokenizer_fixture(const std::string& json_text,
                                                  const std::string& name);
Outcome<TokenizerFixture> load_tokenizer_fixture(const std::string& path);
Outcome<std::size_t> count_tokenizer_cases(const std::string& path);

// ---------------------------------------------------------------------------
// Tree-construction fixtures
// ---------------------------------------------------------------------------

struct TreeCase {
  // Position among cases of the same kind (document or fragment).
  CaseIndex index{0};
  std::string input;
  std::string expected;
  std::size_t error_count{0};
  std::optional<std::string> fragment_context;
  // "on" / "off"; nullopt leaves the engine default.
  std::optional<std::string> scripting;

  bool is_fragment() const { return fragment_context.has_value(); }
};

struct TreeFixture {
  std::string name;
  std::string path;
  std::vector<TreeCase> doc_cases;
  std::vector<TreeCase> frag_cases;
};

struct TreeTotals {
  std::size_t doc{0};
  std::size_t frag{0};
};

// Splits on lines equal to "#data". Each block runs up to the next "#data"
// line with trailing empty lines removed. CRLF is normalized to LF first.
std::vector<std::string> split_tree_blocks(std::string_view raw);

// Parses one block; the returned case has index 0 (the caller numbers it).
Outcome<TreeCase> parse_tree_block(const std::string& block);

Outcome<TreeFixture> parse_tree_fixture(std::string_view raw, const std::string& name);
Outcome<TreeFixture> load_tree_fixture(const std::string& path);
Outcome<TreeTotals> count_tree_cases(const std::string& path);

// ---------------------------------------------------------------------------
// Encoding fixtures
// ---------------------------------------------------------------------------

struct EncodingCase {
  CaseIndex index{0};
  std::string input;
  std::string expected_label;
};

struct EncodingFixture {
  std::string name;
  std::string path;
  std::vector<EncodingCase> cases;
};

std::vector<std::string> split_encoding_blocks(std::string_view raw);
Outcome<EncodingCase> parse_encoding_block(const std::string& block);
Outcome<EncodingFixture> parse_encoding_fixture(std::string_view raw, const std::string& name);
Outcome<EncodingFixture> load_encoding_fixture(const std::string& path);

// Case-folds and maps aliases: utf8 -> utf-8; Latin-1 family -> windows-1252.
std::string normalize_encoding_label(std::string_view label);

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

// Regular files under dir (recursive) whose name ends with extension, sorted
// by path. A missing directory yields an empty list.
std::vector<std::string> discover_fixtures(const std::string& dir, const std::string& extension);

// Reads a fixture file as UTF-8, replacing invalid sequences with U+FFFD.
Outcome<std::string> read_fixture_text(const std::string& path);

std::string basename_of(const std::string& path);

}  // namespace h5gate
