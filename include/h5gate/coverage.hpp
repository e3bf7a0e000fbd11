#pragma once

// h5gate/coverage.hpp — Coverage statistics and historical diffs.
//
// Totals always come from the corpus on disk, parsed with the same readers the
// runner uses. Tree-construction totals are aggregated by basename across
// subdirectories, because allowlists are keyed by basename.
//
// OUTPUT FORMATS:
//   percentage   "12.5%", or "n/a" when the total is 0
//   diff line    "<b>/<t> (<pct>) -> <a>/<t> (<pct>)  Δ<+d>  <+x.x>pp"
//
// A diff is a regression when any enabled count or percentage decreases,
// in the totals or in any listed fixture.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "h5gate/allowlist.hpp"
#include "h5gate/config.hpp"
#include "h5gate/corpus.hpp"
#include "h5gate/types.hpp"

namespace h5gate {

struct CorpusTotals {
  std::map<std::string, TreeTotals> tree;
  std::map<std::string, std::size_t> tokenizer;
  std::vector<std::string> tree_paths;
  std::vector<std::string> tokenizer_paths;

  std::size_t total(SuiteKind kind) const;
  // Fixtures listed for a kind: every tree basename for tree-doc, only those
  // with fragment cases for tree-frag, every tokenizer basename.
  std::map<std::string, std::size_t> per_fixture(SuiteKind kind) const;
};

Outcome<CorpusTotals> compute_corpus_totals(const HarnessConfig& config);

std::optional<double> percentage(std::size_t enabled, std::size_t total);
std::string format_pct(std::size_t enabled, std::size_t total);

struct CoverageRow {
  std::string fixture;
  std::size_t enabled{0};
  std::size_t total{0};
};

std::vector<CoverageRow> coverage_rows(const AllowlistDocument& doc, const CorpusTotals& totals,
                                       SuiteKind kind);

struct BoundViolation {
  SuiteKind kind{SuiteKind::tokenizer};
  std::string fixture;
  std::size_t enabled{0};
  // nullopt: the fixture is allowlisted but not in the corpus.
  std::optional<std::size_t> total;
};

std::vector<BoundViolation> check_coverage_bounds(const AllowlistDocument& doc,
                                                  const CorpusTotals& totals);
std::string describe(const BoundViolation& v);

struct Fingerprints {
  std::string allowlist;
  std::string corpus;
};

Fingerprints compute_fingerprints(const AllowlistDocument& doc, const CorpusTotals& totals,
                                  const HarnessConfig& config);

// Complete `stats` report. Fingerprints are appended when given.
std::string render_stats(const AllowlistDocument& doc, const CorpusTotals& totals,
                         const std::optional<Fingerprints>& fingerprints);

struct DiffLine {
  std::string label;
  std::size_t before{0};
  std::size_t after{0};
  std::size_t total{0};

  long long delta() const;
  std::optional<double> pp() const;
  bool decreased() const;
};

std::string format_diff_line(const DiffLine& line);

struct DiffReport {
  std::vector<DiffLine> totals;
  std::map<SuiteKind, std::vector<DiffLine>> per_fixture;
  bool regression{false};
};

// show_all: list unchanged fixtures too.
DiffReport compute_diff(const AllowlistDocument& before, const AllowlistDocument& after,
                        const CorpusTotals& totals, bool show_all);

std::string render_diff(const DiffReport& report, const std::string& before_label,
                        const std::string& after_label);

}  // namespace h5gate
