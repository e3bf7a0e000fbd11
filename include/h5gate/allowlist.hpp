#pragma once

// h5gate/allowlist.hpp — The versioned record of which conformance cases the
// engine passes.
//
// DOCUMENT (data/html5lib_allowlists.json):
//   {
//     "tokenizer": {"<fixture>.test": [0, 1, ...]},
//     "tree": {"doc": {"<fixture>.dat": [...]}, "frag": {"<fixture>.dat": [...]}},
//     "version": 1
//   }
//
// INVARIANTS:
//   - In memory, every index list is sorted and unique. Loading normalizes;
//     set_indices/add_indices normalize.
//   - The document is validated on load and again on save. Invalid documents
//     are never repaired.
//   - Saving rewrites the whole document: 2-space indent, keys sorted at every
//     level, trailing newline. The write is atomic (temp file + rename).
//   - enabled <= corpus total is NOT enforced here; coverage.hpp checks it at
//     reporting time against the real corpus.
//
// HISTORY:
//   Snapshots are read with `git rev-parse --verify` + `git show rev:path` in
//   the repository root. The working tree is never touched.

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "h5gate/config.hpp"
#include "h5gate/jsonlite.hpp"
#include "h5gate/types.hpp"

namespace h5gate {

using IndexList = std::vector<CaseIndex>;
using FixtureIndexMap = std::map<std::string, IndexList>;

struct AllowlistDocument {
  std::uint64_t version{1};
  FixtureIndexMap tree_doc;
  FixtureIndexMap tree_frag;
  FixtureIndexMap tokenizer;

  FixtureIndexMap& section(SuiteKind kind);
  const FixtureIndexMap& section(SuiteKind kind) const;
};

Outcome<AllowlistDocument> allowlist_from_json(const jsonlite::Value& root);
Outcome<AllowlistDocument> parse_allowlist(const std::string& json_text);
Outcome<AllowlistDocument> load_allowlist(const std::string& path);

// Structural checks that typed construction cannot rule out (version).
Outcome<bool> validate_allowlist(const AllowlistDocument& doc);

jsonlite::Value allowlist_to_json(const AllowlistDocument& doc);
// On-disk form, trailing newline included.
std::string serialize_allowlist(const AllowlistDocument& doc);
// Compact form, input to the allowlist fingerprint.
std::string canonical_allowlist_json(const AllowlistDocument& doc);
Outcome<bool> save_allowlist(const AllowlistDocument& doc, const std::string& path);

IndexList normalize_indices(IndexList indices);
IndexList get_indices(const AllowlistDocument& doc, SuiteKind kind, const std::string& fixture);
void set_indices(AllowlistDocument& doc, SuiteKind kind, const std::string& fixture,
                 IndexList indices);

struct AddResult {
  std::size_t before{0};
  std::size_t after{0};
};

AddResult add_indices(AllowlistDocument& doc, SuiteKind kind, const std::string& fixture,
                      const IndexList& indices);

// Sum of unique indices over every fixture of a kind.
std::size_t enabled_total(const AllowlistDocument& doc, SuiteKind kind);

// "1,2,5-7" -> [1,2,5,6,7]. Empty parts and surrounding whitespace are
// ignored. Inverted ranges and non-numeric parts fail with range_invalid.
// The result is in input order and may contain duplicates.
Outcome<IndexList> parse_ranges(std::string_view expr);

// Sorted unique indices with runs of three or more collapsed to "lo-hi".
std::string format_ranges(const IndexList& indices);

// Full commit id for rev, or history_unavailable.
Outcome<std::string> resolve_revision(const HarnessConfig& config, const std::string& rev);
Outcome<AllowlistDocument> load_allowlist_from_git(const HarnessConfig& config,
                                                   const std::string& rev);

struct AllowlistBaseline {
  AllowlistDocument doc;
  // Resolved commit id, or rev itself when it could not be resolved.
  std::string label;
  bool from_history{false};
  std::vector<std::string> warnings;
};

// Historical snapshot for diffing. When history is unavailable the current
// document becomes its own baseline and warnings explain why.
AllowlistBaseline load_baseline(const HarnessConfig& config, const std::string& rev,
                                const AllowlistDocument& current);

}  // namespace h5gate
