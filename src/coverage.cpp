#include "h5gate/coverage.hpp"

#include <cstdio>
#include <sstream>

#include "h5gate/hash.hpp"

namespace h5gate {

std::size_t CorpusTotals::total(SuiteKind kind) const {
  std::size_t n = 0;
  switch (kind) {
    case SuiteKind::tree_doc:
      for (const auto& [fx, t] : tree) n += t.doc;
      break;
    case SuiteKind::tree_frag:
      for (const auto& [fx, t] : tree) n += t.frag;
      break;
    case SuiteKind::tokenizer:
      for (const auto& [fx, c] : tokenizer) n += c;
      break;
  }
  return n;
}

std::map<std::string, std::size_t> CorpusTotals::per_fixture(SuiteKind kind) const {
  std::map<std::string, std::size_t> out;
  switch (kind) {
    case SuiteKind::tree_doc:
      for (const auto& [fx, t] : tree) out[fx] = t.doc;
      break;
    case SuiteKind::tree_frag:
      for (const auto& [fx, t] : tree) {
        if (t.frag > 0) out[fx] = t.frag;
      }
      break;
    case SuiteKind::tokenizer:
      out = tokenizer;
      break;
  }
  return out;
}

Outcome<CorpusTotals> compute_corpus_totals(const HarnessConfig& config) {
  CorpusTotals totals;
  totals.tree_paths = discover_fixtures(config.tree_dir(), ".dat");
  totals.tokenizer_paths = discover_fixtures(config.tokenizer_dir(), ".test");

  for (const auto& p : totals.tree_paths) {
    auto counted = count_tree_cases(p);
    if (!counted.ok()) return counted.forward<CorpusTotals>();
    auto& agg = totals.tree[basename_of(p)];
    agg.doc += counted.value.doc;
    agg.frag += counted.value.frag;
  }
  for (const auto& p : totals.tokenizer_paths) {
    auto counted = count_tokenizer_cases(p);
    if (!counted.ok()) return counted.forward<CorpusTotals>();
    totals.tokenizer[basename_of(p)] += counted.value;
  }
  return Outcome<CorpusTotals>::success(std::move(totals));
}

std::optional<double> percentage(std::size_t enabled, std::size_t total) {
  if (total == 0) return std::nullopt;
  return static_cast<double>(enabled) * 100.0 / static_cast<double>(total);
}

namespace {

std::string format_pct_value(const std::optional<double>& p) {
  if (!p) return "n/a";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", *p);
  return buf;
}

std::string fraction(std::size_t enabled, std::size_t total) {
  return std::to_string(enabled) + "/" + std::to_string(total) + " (" +
         format_pct(enabled, total) + ")";
}

}  // namespace

std::string format_pct(std::size_t enabled, std::size_t total) {
  return format_pct_value(percentage(enabled, total));
}

std::vector<CoverageRow> coverage_rows(const AllowlistDocument& doc, const CorpusTotals& totals,
                                       SuiteKind kind) {
  std::vector<CoverageRow> rows;
  for (const auto& [fx, total] : totals.per_fixture(kind)) {
    CoverageRow r;
    r.fixture = fx;
    r.total = total;
    r.enabled = get_indices(doc, kind, fx).size();
    rows.push_back(std::move(r));
  }
  return rows;
}

std::vector<BoundViolation> check_coverage_bounds(const AllowlistDocument& doc,
                                                  const CorpusTotals& totals) {
  std::vector<BoundViolation> out;
  for (SuiteKind kind : kAllSuiteKinds) {
    std::map<std::string, std::size_t> known;
    // tree-frag bounds apply to every tree fixture, including those with no
    // fragment cases at all.
    if (kind == SuiteKind::tree_frag) {
      for (const auto& [fx, t] : totals.tree) known[fx] = t.frag;
    } else {
      known = totals.per_fixture(kind);
    }
    for (const auto& [fx, xs] : doc.section(kind)) {
      const std::size_t enabled = normalize_indices(xs).size();
      const auto it = known.find(fx);
      if (it == known.end()) {
        if (enabled > 0) out.push_back(BoundViolation{kind, fx, enabled, std::nullopt});
        continue;
      }
      if (enabled > it->second) out.push_back(BoundViolation{kind, fx, enabled, it->second});
    }
  }
  return out;
}

std::string describe(const BoundViolation& v) {
  if (!v.total) {
    return to_string(v.kind) + " " + v.fixture + ": " + std::to_string(v.enabled) +
           " indices allowlisted but fixture not found in corpus";
  }
  return to_string(v.kind) + " " + v.fixture + ": enabled " + std::to_string(v.enabled) +
         " exceeds corpus total " + std::to_string(*v.total);
}

Fingerprints compute_fingerprints(const AllowlistDocument& doc, const CorpusTotals& totals,
                                  const HarnessConfig& config) {
  Fingerprints fp;
  fp.allowlist = allowlist_fingerprint(canonical_allowlist_json(doc));
  std::vector<std::string> paths = totals.tree_paths;
  paths.insert(paths.end(), totals.tokenizer_paths.begin(), totals.tokenizer_paths.end());
  fp.corpus = corpus_fingerprint(config.corpus_root, std::move(paths));
  return fp;
}

std::string render_stats(const AllowlistDocument& doc, const CorpusTotals& totals,
                         const std::optional<Fingerprints>& fingerprints) {
  std::ostringstream o;
  o << "Enabled totals:\n";
  for (SuiteKind kind : kAllSuiteKinds) {
    o << "  " << to_string(kind) << ": " << enabled_total(doc, kind) << "\n";
  }

  o << "\nCoverage totals:\n";
  for (SuiteKind kind : kAllSuiteKinds) {
    o << "  " << to_string(kind) << ": " << fraction(enabled_total(doc, kind), totals.total(kind))
      << "\n";
  }

  o << "\nPer fixture:\n";
  for (SuiteKind kind : kAllSuiteKinds) {
    o << to_string(kind) << ":\n";
    for (const auto& row : coverage_rows(doc, totals, kind)) {
      o << "  " << row.fixture << ": " << fraction(row.enabled, row.total) << "\n";
    }
  }

  if (fingerprints) {
    o << "\nFingerprints:\n";
    o << "  allowlist: blake3:" << fingerprints->allowlist << "\n";
    o << "  corpus: blake3:" << fingerprints->corpus << "\n";
  }
  return o.str();
}

long long DiffLine::delta() const {
  return static_cast<long long>(after) - static_cast<long long>(before);
}

std::optional<double> DiffLine::pp() const {
  const auto b = percentage(before, total);
  const auto a = percentage(after, total);
  if (!b || !a) return std::nullopt;
  return *a - *b;
}

bool DiffLine::decreased() const {
  const auto p = pp();
  return delta() < 0 || (p && *p < 0.0);
}

std::string format_diff_line(const DiffLine& line) {
  char delta[32];
  std::snprintf(delta, sizeof(delta), "%+lld", line.delta());
  std::string pp_s = "n/a";
  if (const auto p = line.pp()) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%+.1fpp", *p);
    pp_s = buf;
  }
  return fraction(line.before, line.total) + " -> " + fraction(line.after, line.total) +
         "  Δ" + delta + "  " + pp_s;
}

DiffReport compute_diff(const AllowlistDocument& before, const AllowlistDocument& after,
                        const CorpusTotals& totals, bool show_all) {
  DiffReport report;
  for (SuiteKind kind : kAllSuiteKinds) {
    DiffLine t;
    t.label = to_string(kind);
    t.before = enabled_total(before, kind);
    t.after = enabled_total(after, kind);
    t.total = totals.total(kind);
    report.regression = report.regression || t.decreased();
    report.totals.push_back(std::move(t));
  }

  for (SuiteKind kind : kAllSuiteKinds) {
    auto& rows = report.per_fixture[kind];
    for (const auto& [fx, total] : totals.per_fixture(kind)) {
      DiffLine line;
      line.label = fx;
      line.total = total;
      line.before = get_indices(before, kind, fx).size();
      line.after = get_indices(after, kind, fx).size();
      if (!show_all && line.before == line.after) continue;
      report.regression = report.regression || line.decreased();
      rows.push_back(std::move(line));
    }
  }
  return report;
}

std::string render_diff(const DiffReport& report, const std::string& before_label,
                        const std::string& after_label) {
  std::ostringstream o;
  o << "Comparing allowlists: " << before_label << " -> working tree (" << after_label << ")\n";
  o << "\nTotals:\n";
  for (const auto& line : report.totals) {
    o << line.label << ": " << format_diff_line(line) << "\n";
  }
  for (SuiteKind kind : kAllSuiteKinds) {
    o << "\nPer fixture (" << to_string(kind) << "):\n";
    const auto it = report.per_fixture.find(kind);
    if (it == report.per_fixture.end()) continue;
    for (const auto& line : it->second) {
      o << "  " << line.label << ": " << format_diff_line(line) << "\n";
    }
  }
  return o.str();
}

}  // namespace h5gate
