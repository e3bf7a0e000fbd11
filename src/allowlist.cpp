#include "h5gate/allowlist.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "h5gate/process.hpp"
#include "h5gate/version.hpp"

namespace fs = std::filesystem;

namespace h5gate {

namespace {

constexpr std::uint64_t kGitTimeoutMs = 60000;

Outcome<FixtureIndexMap> section_from_json(const jsonlite::Value& v, const std::string& where) {
  using R = Outcome<FixtureIndexMap>;
  if (!v.is_object()) return R::failure(ErrorCode::allowlist_invalid, where + " must be an object");
  FixtureIndexMap out;
  for (const auto& [fixture, list] : v.as_object()) {
    if (!list.is_array()) {
      return R::failure(ErrorCode::allowlist_invalid, where + "." + fixture + " must be a list of ints");
    }
    IndexList xs;
    xs.reserve(list.as_array().size());
    for (const auto& item : list.as_array()) {
      // Booleans, negatives and fractions are not case indices.
      if (!item.is_uint()) {
        return R::failure(ErrorCode::allowlist_invalid,
                          where + "." + fixture + " must be a list of ints");
      }
      xs.push_back(static_cast<CaseIndex>(item.as_uint()));
    }
    out[fixture] = normalize_indices(std::move(xs));
  }
  return R::success(std::move(out));
}

jsonlite::Value section_to_json(const FixtureIndexMap& section) {
  jsonlite::Object o;
  for (const auto& [fixture, xs] : section) {
    jsonlite::Array arr;
    arr.reserve(xs.size());
    for (CaseIndex i : normalize_indices(xs)) arr.emplace_back(static_cast<std::uint64_t>(i));
    o[fixture] = jsonlite::Value(std::move(arr));
  }
  return jsonlite::Value(std::move(o));
}

std::string trim(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

bool parse_index(std::string_view text, CaseIndex& out) {
  const std::string t = trim(text);
  if (t.empty()) return false;
  CaseIndex v = 0;
  for (char c : t) {
    if (c < '0' || c > '9') return false;
    const CaseIndex next = v * 10 + static_cast<CaseIndex>(c - '0');
    if (next / 10 != v) return false;
    v = next;
  }
  out = v;
  return true;
}

std::string trim_output(const std::string& s) {
  return trim(s);
}

ProcessResult run_git(const HarnessConfig& config, std::vector<std::string> args) {
  ProcessSpec spec;
  spec.command = config.git_command;
  spec.argv = std::move(args);
  spec.cwd = config.repo_root;
  spec.timeout_ms = kGitTimeoutMs;
  return run_process(spec);
}

std::string git_failure(const std::string& what, const ProcessResult& pr) {
  std::string msg = what;
  std::string detail = trim_output(pr.stderr_text);
  if (detail.empty()) detail = pr.error_message;
  if (detail.empty() && pr.timed_out) detail = "timed out";
  if (!detail.empty()) msg += ": " + detail;
  return msg;
}

}  // namespace

FixtureIndexMap& AllowlistDocument::section(SuiteKind kind) {
  switch (kind) {
    case SuiteKind::tree_doc: return tree_doc;
    case SuiteKind::tree_frag: return tree_frag;
    case SuiteKind::tokenizer: return tokenizer;
  }
  return tokenizer;
}

const FixtureIndexMap& AllowlistDocument::section(SuiteKind kind) const {
  switch (kind) {
    case SuiteKind::tree_doc: return tree_doc;
    case SuiteKind::tree_frag: return tree_frag;
    case SuiteKind::tokenizer: return tokenizer;
  }
  return tokenizer;
}

Outcome<AllowlistDocument> allowlist_from_json(const jsonlite::Value& root) {
  using R = Outcome<AllowlistDocument>;
  if (!root.is_object()) return R::failure(ErrorCode::allowlist_invalid, "top-level JSON must be an object");
  const auto& obj = root.as_object();

  const jsonlite::Value* ver = jsonlite::find(obj, "version");
  if (!ver || !ver->is_uint()) {
    return R::failure(ErrorCode::allowlist_invalid, "unsupported allowlists version: missing or not an integer");
  }
  const auto compat = version::check_allowlist_version(ver->as_uint());
  if (!compat.ok) return R::failure(ErrorCode::allowlist_invalid, compat.description);

  const jsonlite::Value* tree = jsonlite::find(obj, "tree");
  const jsonlite::Value* tok = jsonlite::find(obj, "tokenizer");
  if (!tree || !tok) return R::failure(ErrorCode::allowlist_invalid, "missing required keys: tree/tokenizer");
  if (!tree->is_object() || !jsonlite::find(tree->as_object(), "doc") ||
      !jsonlite::find(tree->as_object(), "frag")) {
    return R::failure(ErrorCode::allowlist_invalid, "tree must be an object with doc/frag keys");
  }

  AllowlistDocument doc;
  doc.version = ver->as_uint();
  auto d = section_from_json(*jsonlite::find(tree->as_object(), "doc"), "tree.doc");
  if (!d.ok()) return d.forward<AllowlistDocument>();
  auto f = section_from_json(*jsonlite::find(tree->as_object(), "frag"), "tree.frag");
  if (!f.ok()) return f.forward<AllowlistDocument>();
  auto t = section_from_json(*tok, "tokenizer");
  if (!t.ok()) return t.forward<AllowlistDocument>();
  doc.tree_doc = std::move(d.value);
  doc.tree_frag = std::move(f.value);
  doc.tokenizer = std::move(t.value);
  return R::success(std::move(doc));
}

Outcome<AllowlistDocument> parse_allowlist(const std::string& json_text) {
  std::optional<jsonlite::JsonError> err;
  const auto root = jsonlite::parse_value(json_text, &err);
  if (!root) {
    const ErrorCode code = (err && err->code == "json_duplicate_key") ? ErrorCode::json_duplicate_key
                                                                      : ErrorCode::json_parse_error;
    return Outcome<AllowlistDocument>::failure(code, err ? err->message : "invalid JSON");
  }
  return allowlist_from_json(*root);
}

Outcome<AllowlistDocument> load_allowlist(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return Outcome<AllowlistDocument>::failure(ErrorCode::io_error, "cannot open " + path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  auto doc = parse_allowlist(oss.str());
  if (!doc.ok()) doc.detail = path + ": " + doc.detail;
  return doc;
}

Outcome<bool> validate_allowlist(const AllowlistDocument& doc) {
  const auto compat = version::check_allowlist_version(doc.version);
  if (!compat.ok) return Outcome<bool>::failure(ErrorCode::allowlist_invalid, compat.description);
  return Outcome<bool>::success(true);
}

jsonlite::Value allowlist_to_json(const AllowlistDocument& doc) {
  jsonlite::Object tree;
  tree["doc"] = section_to_json(doc.tree_doc);
  tree["frag"] = section_to_json(doc.tree_frag);
  jsonlite::Object root;
  root["version"] = jsonlite::Value(doc.version);
  root["tree"] = jsonlite::Value(std::move(tree));
  root["tokenizer"] = section_to_json(doc.tokenizer);
  return jsonlite::Value(std::move(root));
}

std::string serialize_allowlist(const AllowlistDocument& doc) {
  return jsonlite::to_json_pretty(allowlist_to_json(doc), 2) + "\n";
}

std::string canonical_allowlist_json(const AllowlistDocument& doc) {
  return jsonlite::to_json(allowlist_to_json(doc));
}

Outcome<bool> save_allowlist(const AllowlistDocument& doc, const std::string& path) {
  using R = Outcome<bool>;
  const auto valid = validate_allowlist(doc);
  if (!valid.ok()) return valid;

  std::error_code ec;
  const fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) return R::failure(ErrorCode::io_error, "cannot create " + target.parent_path().string());
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return R::failure(ErrorCode::io_error, "cannot write " + tmp);
    ofs << serialize_allowlist(doc);
    ofs.flush();
    if (!ofs) {
      fs::remove(tmp, ec);
      return R::failure(ErrorCode::io_error, "short write to " + tmp);
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return R::failure(ErrorCode::io_error, "cannot replace " + path + ": " + ec.message());
  }
  return R::success(true);
}

IndexList normalize_indices(IndexList indices) {
  std::sort(indices.begin(), indices.end());
  indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
  return indices;
}

IndexList get_indices(const AllowlistDocument& doc, SuiteKind kind, const std::string& fixture) {
  const auto& sec = doc.section(kind);
  const auto it = sec.find(fixture);
  if (it == sec.end()) return {};
  return normalize_indices(it->second);
}

void set_indices(AllowlistDocument& doc, SuiteKind kind, const std::string& fixture,
                 IndexList indices) {
  doc.section(kind)[fixture] = normalize_indices(std::move(indices));
}

AddResult add_indices(AllowlistDocument& doc, SuiteKind kind, const std::string& fixture,
                      const IndexList& indices) {
  IndexList merged = get_indices(doc, kind, fixture);
  AddResult r;
  r.before = merged.size();
  merged.insert(merged.end(), indices.begin(), indices.end());
  set_indices(doc, kind, fixture, std::move(merged));
  r.after = doc.section(kind)[fixture].size();
  return r;
}

std::size_t enabled_total(const AllowlistDocument& doc, SuiteKind kind) {
  std::size_t n = 0;
  for (const auto& [fixture, xs] : doc.section(kind)) n += normalize_indices(xs).size();
  return n;
}

Outcome<IndexList> parse_ranges(std::string_view expr) {
  using R = Outcome<IndexList>;
  IndexList out;
  std::size_t start = 0;
  while (start <= expr.size()) {
    std::size_t comma = expr.find(',', start);
    if (comma == std::string_view::npos) comma = expr.size();
    const std::string part = trim(expr.substr(start, comma - start));
    start = comma + 1;
    if (part.empty()) continue;

    const std::size_t dash = part.find('-');
    if (dash == std::string::npos) {
      CaseIndex v = 0;
      if (!parse_index(part, v)) return R::failure(ErrorCode::range_invalid, "bad index '" + part + "'");
      out.push_back(v);
      continue;
    }
    CaseIndex lo = 0;
    CaseIndex hi = 0;
    if (!parse_index(std::string_view(part).substr(0, dash), lo) ||
        !parse_index(std::string_view(part).substr(dash + 1), hi)) {
      return R::failure(ErrorCode::range_invalid, "bad range '" + part + "'");
    }
    if (hi < lo) return R::failure(ErrorCode::range_invalid, "bad range '" + part + "' (hi < lo)");
    for (CaseIndex i = lo; i <= hi; ++i) {
      out.push_back(i);
      if (i == hi) break;
    }
  }
  return R::success(std::move(out));
}

std::string format_ranges(const IndexList& indices) {
  const IndexList xs = normalize_indices(indices);
  std::string out;
  auto append = [&out](const std::string& part) {
    if (!out.empty()) out.push_back(',');
    out += part;
  };
  std::size_t i = 0;
  while (i < xs.size()) {
    std::size_t j = i;
    while (j + 1 < xs.size() && xs[j + 1] == xs[j] + 1) ++j;
    const CaseIndex lo = xs[i];
    const CaseIndex hi = xs[j];
    if (hi - lo >= 2) {
      append(std::to_string(lo) + "-" + std::to_string(hi));
    } else {
      append(std::to_string(lo));
      if (hi != lo) append(std::to_string(hi));
    }
    i = j + 1;
  }
  return out;
}

Outcome<std::string> resolve_revision(const HarnessConfig& config, const std::string& rev) {
  using R = Outcome<std::string>;
  const ProcessResult pr = run_git(config, {"rev-parse", "--verify", rev});
  if (!pr.ok()) {
    return R::failure(ErrorCode::history_unavailable,
                      git_failure("git rev-parse failed for '" + rev + "'", pr));
  }
  const std::string resolved = trim_output(pr.stdout_text);
  if (resolved.empty()) {
    return R::failure(ErrorCode::history_unavailable,
                      "git rev-parse returned empty output for '" + rev + "'");
  }
  return R::success(resolved);
}

Outcome<AllowlistDocument> load_allowlist_from_git(const HarnessConfig& config,
                                                   const std::string& rev) {
  using R = Outcome<AllowlistDocument>;
  auto resolved = resolve_revision(config, rev);
  if (!resolved.ok()) return resolved.forward<AllowlistDocument>();

  const std::string object = resolved.value + ":" + config.allowlist_relpath();
  const ProcessResult pr = run_git(config, {"show", object});
  if (!pr.ok()) {
    return R::failure(ErrorCode::history_unavailable, git_failure("git show failed for " + object, pr));
  }
  auto doc = parse_allowlist(pr.stdout_text);
  if (!doc.ok()) doc.detail = object + ": " + doc.detail;
  return doc;
}

AllowlistBaseline load_baseline(const HarnessConfig& config, const std::string& rev,
                                const AllowlistDocument& current) {
  AllowlistBaseline b;
  b.label = rev;
  auto prev = load_allowlist_from_git(config, rev);
  if (prev.ok()) {
    b.doc = std::move(prev.value);
    b.from_history = true;
    auto resolved = resolve_revision(config, rev);
    if (resolved.ok()) b.label = resolved.value;
    return b;
  }
  b.doc = current;
  b.warnings.push_back(prev.detail);
  b.warnings.push_back("treating previous allowlists as current (no diff baseline available)");
  return b;
}

}  // namespace h5gate
