#include "h5gate/runner.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <ostream>
#include <set>

namespace fs = std::filesystem;

namespace h5gate {

namespace {

std::string signed_delta(long long d) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%+lld", d);
  return buf;
}

long long delta_of(std::size_t before, std::size_t after) {
  return static_cast<long long>(after) - static_cast<long long>(before);
}

std::string join_path(const std::string& dir, const std::string& name) {
  return (fs::path(dir) / name).string();
}

// *.dat directly inside dir, sorted.
std::vector<std::string> top_level_fixtures(const std::string& dir, const std::string& ext) {
  std::vector<std::string> out;
  for (const auto& p : discover_fixtures(dir, ext)) {
    if (fs::path(p).parent_path() == fs::path(dir)) out.push_back(p);
  }
  return out;
}

std::string value_text(const jsonlite::Value& v) {
  return v.is_string() ? v.as_string() : jsonlite::to_json(v);
}

struct TreeSlot {
  bool fragment{false};
  const TreeCase* c{nullptr};
};

const char* kind_tag(bool fragment) { return fragment ? "frag" : "doc"; }

void add_tree_item(Batch& batch, std::vector<TreeSlot>& slots, const TreeCase& c) {
  batch.items.push_back(make_tree_item(c.fragment_context, c.scripting, c.input));
  slots.push_back(TreeSlot{c.is_fragment(), &c});
}

}  // namespace

Outcome<jsonlite::Array> submit_batch(RunContext& ctx, const Batch& batch) {
  BatchEvent ev;
  ev.fixture = batch.fixture;
  ev.mode = to_string(batch.mode);
  ev.engine = ctx.engine.engine_id();
  ev.case_count = batch.items.size();
  Outcome<jsonlite::Array> result;
  {
    ScopeTimer timer(ev.duration_ns);
    result = ctx.engine.submit(batch);
  }
  ev.ok = result.ok();
  ev.error_code = result.error_code;
  ev.bytes_in = ctx.engine.last_request_bytes();
  ev.bytes_out = ctx.engine.last_response_bytes();
  if (ctx.events) ctx.events->emit(ev);
  return result;
}

// ---------------------------------------------------------------------------
// Tokenizer
// ---------------------------------------------------------------------------

TokenizerSubmission build_tokenizer_submission(const TokenizerFixture& fixture,
                                               const IndexList* selection) {
  TokenizerSubmission sub;
  sub.batch.mode = fixture.xml_violation ? BatchMode::tokenizer_xml : BatchMode::tokenizer;
  sub.batch.fixture = fixture.name;

  IndexList all;
  if (!selection) {
    all.reserve(fixture.cases.size());
    for (CaseIndex i = 0; i < fixture.cases.size(); ++i) all.push_back(i);
    selection = &all;
  }

  for (CaseIndex idx : *selection) {
    const TokenizerCase& c = fixture.cases.at(idx);
    std::vector<std::string> states;
    bool supported = true;
    for (const auto& name : c.initial_states) {
      auto mapped = map_initial_state(name);
      if (!mapped.ok()) {
        supported = false;
        break;
      }
      states.push_back(mapped.value);
    }
    if (!supported) {
      sub.unsupported.push_back(idx);
      continue;
    }
    for (const auto& st : states) {
      sub.batch.items.push_back(make_tokenizer_item(st, c.last_start_tag, c.input));
      sub.slots.push_back(TokenizerSlot{idx, st});
    }
  }
  return sub;
}

TokenizerVerdicts judge_tokenizer(const TokenizerFixture& fixture,
                                  const TokenizerSubmission& submission,
                                  const jsonlite::Array& results) {
  TokenizerVerdicts v;
  v.passing.assign(fixture.cases.size(), false);
  // A case passes only when every one of its submitted states got a result and
  // that result matched.
  std::vector<std::size_t> outstanding(fixture.cases.size(), 0);
  for (const auto& slot : submission.slots) ++outstanding[slot.index];
  std::vector<bool> mismatched(fixture.cases.size(), false);
  const std::size_t n = std::min(results.size(), submission.slots.size());
  for (std::size_t i = 0; i < n; ++i) {
    const auto& slot = submission.slots[i];
    if (results[i] == fixture.cases[slot.index].expected) {
      --outstanding[slot.index];
    } else {
      mismatched[slot.index] = true;
      v.mismatches.push_back(slot);
    }
  }
  for (const auto& slot : submission.slots) {
    v.passing[slot.index] = outstanding[slot.index] == 0 && !mismatched[slot.index];
  }
  return v;
}

// ---------------------------------------------------------------------------
// Tree
// ---------------------------------------------------------------------------

TreeVerdict judge_tree_case(const TreeCase& expected, const jsonlite::Value& got) {
  if (!got.is_array() || got.as_array().size() != 2) return TreeVerdict::invalid_shape;
  const auto& pair = got.as_array();
  if (!pair[0].is_string() || !pair[1].is_number()) return TreeVerdict::invalid_shape;
  if (!pair[1].is_uint() && pair[1].as_double() < 0.0) return TreeVerdict::invalid_shape;

  const bool tree_ok = pair[0].as_string() == expected.expected;
  const auto got_errors = pair[1].is_uint() ? pair[1].as_uint()
                                            : static_cast<std::uint64_t>(pair[1].as_double());
  const bool errors_ok = got_errors == expected.error_count;
  if (tree_ok && errors_ok) return TreeVerdict::pass;
  if (!tree_ok && !errors_ok) return TreeVerdict::both_mismatch;
  return tree_ok ? TreeVerdict::error_count_mismatch : TreeVerdict::tree_mismatch;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

RunSummary run_allowlisted(RunContext& ctx, const AllowlistDocument& doc) {
  RunSummary summary;
  auto& failures = summary.failures;

  for (const auto& [fx, raw] : doc.tokenizer) {
    const IndexList enabled = normalize_indices(raw);
    if (enabled.empty()) continue;

    auto fixture = load_tokenizer_fixture(join_path(ctx.config.tokenizer_dir(), fx));
    if (!fixture.ok()) {
      failures.push_back("tokenizer " + fx + ": " + fixture.message());
      continue;
    }
    IndexList selected;
    for (CaseIndex idx : enabled) {
      if (idx < fixture.value.cases.size()) {
        selected.push_back(idx);
      } else {
        failures.push_back("tokenizer " + fx + " #" + std::to_string(idx) + ": index out of range (" +
                           std::to_string(fixture.value.cases.size()) + " cases)");
      }
    }
    summary.cases_checked += selected.size();

    const TokenizerSubmission sub = build_tokenizer_submission(fixture.value, &selected);
    for (CaseIndex idx : sub.unsupported) {
      failures.push_back("tokenizer " + fx + " #" + std::to_string(idx) + ": unsupported initial state");
    }
    auto results = submit_batch(ctx, sub.batch);
    if (!results.ok()) {
      failures.push_back("tokenizer " + fx + ": runner failed: " + results.message());
      continue;
    }
    const TokenizerVerdicts verdicts = judge_tokenizer(fixture.value, sub, results.value);
    for (const auto& slot : verdicts.mismatches) {
      failures.push_back("tokenizer " + fx + " #" + std::to_string(slot.index) + " (" + slot.state +
                         "): mismatch");
    }
  }

  std::set<std::string> tree_fixtures;
  for (const auto& [fx, xs] : doc.tree_doc) tree_fixtures.insert(fx);
  for (const auto& [fx, xs] : doc.tree_frag) tree_fixtures.insert(fx);

  for (const auto& fx : tree_fixtures) {
    const IndexList enabled_doc = get_indices(doc, SuiteKind::tree_doc, fx);
    const IndexList enabled_frag = get_indices(doc, SuiteKind::tree_frag, fx);
    if (enabled_doc.empty() && enabled_frag.empty()) continue;

    auto fixture = load_tree_fixture(join_path(ctx.config.tree_dir(), fx));
    if (!fixture.ok()) {
      failures.push_back("tree " + fx + ": " + fixture.message());
      continue;
    }

    Batch batch;
    batch.mode = BatchMode::tree;
    batch.fixture = fx;
    std::vector<TreeSlot> slots;
    auto select = [&](const IndexList& enabled, const std::vector<TreeCase>& cases, bool frag) {
      for (CaseIndex idx : enabled) {
        if (idx < cases.size()) {
          add_tree_item(batch, slots, cases[idx]);
        } else {
          failures.push_back("tree " + fx + " " + kind_tag(frag) + " #" + std::to_string(idx) +
                             ": index out of range (" + std::to_string(cases.size()) + " cases)");
        }
      }
    };
    select(enabled_doc, fixture.value.doc_cases, false);
    select(enabled_frag, fixture.value.frag_cases, true);
    summary.cases_checked += slots.size();

    auto results = submit_batch(ctx, batch);
    if (!results.ok()) {
      failures.push_back("tree " + fx + ": runner failed: " + results.message());
      continue;
    }
    for (std::size_t i = 0; i < slots.size(); ++i) {
      const std::string where = "tree " + fx + " " + kind_tag(slots[i].fragment) + " #" +
                                std::to_string(slots[i].c->index);
      switch (judge_tree_case(*slots[i].c, results.value[i])) {
        case TreeVerdict::pass:
          break;
        case TreeVerdict::tree_mismatch:
          failures.push_back(where + ": tree mismatch");
          break;
        case TreeVerdict::error_count_mismatch:
          failures.push_back(where + ": error-count mismatch");
          break;
        case TreeVerdict::both_mismatch:
          failures.push_back(where + ": tree mismatch");
          failures.push_back(where + ": error-count mismatch");
          break;
        case TreeVerdict::invalid_shape:
          failures.push_back(where + ": invalid runner output shape");
          break;
      }
    }
  }
  return summary;
}

// ---------------------------------------------------------------------------
// auto-allowlist
// ---------------------------------------------------------------------------

bool auto_allowlist_tokenizer(RunContext& ctx, AllowlistDocument& doc) {
  bool all_ok = true;
  for (const auto& path : discover_fixtures(ctx.config.tokenizer_dir(), ".test")) {
    auto fixture = load_tokenizer_fixture(path);
    if (!fixture.ok()) {
      ctx.err << "error: " << fixture.message() << "\n";
      all_ok = false;
      continue;
    }
    const std::string& fx = fixture.value.name;
    const TokenizerSubmission sub = build_tokenizer_submission(fixture.value, nullptr);
    auto results = submit_batch(ctx, sub.batch);
    if (!results.ok()) {
      ctx.err << "error: tokenizer " << fx << ": runner failed: " << results.message() << "\n";
      all_ok = false;
      continue;
    }
    const TokenizerVerdicts verdicts = judge_tokenizer(fixture.value, sub, results.value);
    IndexList passing;
    for (CaseIndex i = 0; i < verdicts.passing.size(); ++i) {
      if (verdicts.passing[i]) passing.push_back(i);
    }
    const std::size_t before = doc.tokenizer.count(fx) ? doc.tokenizer[fx].size() : 0;
    const std::size_t after = passing.size();
    set_indices(doc, SuiteKind::tokenizer, fx, std::move(passing));
    ctx.out << fx << ": Δ" << signed_delta(delta_of(before, after)) << " (now " << after << ")\n";
  }
  return all_ok;
}

bool auto_allowlist_tree(RunContext& ctx, AllowlistDocument& doc) {
  bool all_ok = true;
  for (const auto& path : top_level_fixtures(ctx.config.tree_dir(), ".dat")) {
    auto fixture = load_tree_fixture(path);
    if (!fixture.ok()) {
      ctx.err << "error: " << fixture.message() << "\n";
      all_ok = false;
      continue;
    }
    const std::string& fx = fixture.value.name;
    Batch batch;
    batch.mode = BatchMode::tree;
    batch.fixture = fx;
    std::vector<TreeSlot> slots;
    for (const auto& c : fixture.value.doc_cases) add_tree_item(batch, slots, c);
    for (const auto& c : fixture.value.frag_cases) add_tree_item(batch, slots, c);

    auto results = submit_batch(ctx, batch);
    if (!results.ok()) {
      ctx.err << "error: tree " << fx << ": runner failed: " << results.message() << "\n";
      all_ok = false;
      continue;
    }
    IndexList doc_passing;
    IndexList frag_passing;
    for (std::size_t i = 0; i < slots.size(); ++i) {
      if (judge_tree_case(*slots[i].c, results.value[i]) != TreeVerdict::pass) continue;
      (slots[i].fragment ? frag_passing : doc_passing).push_back(slots[i].c->index);
    }

    const std::size_t before_doc = doc.tree_doc.count(fx) ? doc.tree_doc[fx].size() : 0;
    const std::size_t before_frag = doc.tree_frag.count(fx) ? doc.tree_frag[fx].size() : 0;
    const std::size_t after_doc = doc_passing.size();
    const std::size_t after_frag = frag_passing.size();
    set_indices(doc, SuiteKind::tree_doc, fx, std::move(doc_passing));
    set_indices(doc, SuiteKind::tree_frag, fx, std::move(frag_passing));
    ctx.out << fx << ": doc Δ" << signed_delta(delta_of(before_doc, after_doc)) << " (now "
            << after_doc << ")  frag Δ" << signed_delta(delta_of(before_frag, after_frag))
            << " (now " << after_frag << ")\n";
  }
  return all_ok;
}

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

Outcome<TokenizerShowRequest> parse_tokenizer_show(const std::string& text) {
  using R = Outcome<TokenizerShowRequest>;
  const std::size_t a = text.find('#');
  const std::size_t b = a == std::string::npos ? std::string::npos : text.find('#', a + 1);
  if (b == std::string::npos) {
    return R::failure(ErrorCode::config_invalid, "invalid --show value '" + text +
                                                     "' (expected fixture#index#State)");
  }
  const std::string digits = text.substr(a + 1, b - a - 1);
  if (digits.empty() || digits.size() > 18 ||
      digits.find_first_not_of("0123456789") != std::string::npos) {
    return R::failure(ErrorCode::config_invalid, "invalid --show value '" + text + "' (bad index)");
  }
  TokenizerShowRequest req;
  req.fixture = text.substr(0, a);
  req.index = static_cast<CaseIndex>(std::stoull(digits));
  req.state = text.substr(b + 1);
  return R::success(std::move(req));
}

int report_tokenizer_failures(RunContext& ctx, const TokenizerReportOptions& options) {
  std::vector<std::string> mismatches;

  for (const auto& path : discover_fixtures(ctx.config.tokenizer_dir(), ".test")) {
    const std::string fx = basename_of(path);
    if (options.fixture && fx != *options.fixture) continue;

    auto fixture = load_tokenizer_fixture(path);
    if (!fixture.ok()) {
      ctx.err << "error: " << fixture.message() << "\n";
      return 1;
    }
    const TokenizerSubmission sub = build_tokenizer_submission(fixture.value, nullptr);
    if (sub.slots.empty() && sub.unsupported.empty()) continue;

    auto results = submit_batch(ctx, sub.batch);
    if (!results.ok()) {
      ctx.err << "error: tokenizer " << fx << ": runner failed: " << results.message() << "\n";
      return 1;
    }
    const TokenizerVerdicts verdicts = judge_tokenizer(fixture.value, sub, results.value);
    for (const auto& slot : verdicts.mismatches) {
      if (mismatches.size() < options.limit) {
        mismatches.push_back(fx + " #" + std::to_string(slot.index) + " (" + slot.state + "): mismatch");
      }
    }

    if (options.show && options.show->fixture == fx) {
      for (std::size_t i = 0; i < sub.slots.size(); ++i) {
        if (sub.slots[i].index != options.show->index || sub.slots[i].state != options.show->state) {
          continue;
        }
        const TokenizerCase& c = fixture.value.cases[sub.slots[i].index];
        ctx.out << "fixture: " << fx << "\n";
        ctx.out << "index: " << c.index << "\n";
        ctx.out << "state: " << sub.slots[i].state << "\n";
        ctx.out << "lastStartTag: " << (c.last_start_tag ? "'" + *c.last_start_tag + "'" : "None") << "\n";
        ctx.out << "input:\n" << c.input << "\n";
        ctx.out << "\nexpected:\n" << jsonlite::to_json(c.expected) << "\n";
        ctx.out << "\ngot:\n" << jsonlite::to_json(results.value[i]) << "\n";
        return 1;
      }
    }

    std::size_t failing = 0;
    for (bool ok : verdicts.passing) failing += ok ? 0 : 1;
    const std::size_t total = fixture.value.cases.size();
    ctx.out << fx << ": " << (total - failing) << "/" << total << " passing  (" << failing
            << " failing)\n";
  }

  // A shown case returns from inside the loop.
  if (options.show) {
    ctx.err << "warning: case " << options.show->fixture << "#" << options.show->index << "#"
            << options.show->state << " was not submitted\n";
  }
  if (!mismatches.empty()) {
    ctx.out << "\nFirst mismatches:\n";
    for (const auto& line : mismatches) ctx.out << "  " << line << "\n";
    return 1;
  }
  return 0;
}

int report_tree_failures(RunContext& ctx, const TreeReportOptions& options) {
  auto fixture = load_tree_fixture(join_path(ctx.config.tree_dir(), options.fixture));
  if (!fixture.ok()) {
    ctx.err << "error: " << fixture.message() << "\n";
    return 1;
  }
  const auto& cases = options.fragment ? fixture.value.frag_cases : fixture.value.doc_cases;
  const std::string tag = kind_tag(options.fragment);

  Batch batch;
  batch.mode = BatchMode::tree;
  batch.fixture = options.fixture;
  std::vector<TreeSlot> slots;
  if (options.show) {
    if (*options.show >= cases.size()) {
      ctx.err << "error: " << options.fixture << " has no " << tag << " case #" << *options.show
              << " (" << cases.size() << " cases)\n";
      return 1;
    }
    add_tree_item(batch, slots, cases[*options.show]);
  } else {
    for (const auto& c : cases) add_tree_item(batch, slots, c);
  }

  auto results = submit_batch(ctx, batch);
  if (!results.ok()) {
    ctx.err << "error: tree " << options.fixture << ": runner failed: " << results.message() << "\n";
    return 1;
  }

  std::vector<std::string> mismatches;
  for (std::size_t i = 0; i < slots.size(); ++i) {
    const TreeCase& c = *slots[i].c;
    const std::string where = options.fixture + " " + tag + " #" + std::to_string(c.index);
    const TreeVerdict verdict = judge_tree_case(c, results.value[i]);
    if (verdict == TreeVerdict::invalid_shape) {
      mismatches.push_back(where + ": invalid runner output shape");
      continue;
    }
    if (options.show) {
      const auto& pair = results.value[i].as_array();
      ctx.out << "fixture: " << options.fixture << "\n";
      ctx.out << "kind: " << tag << "\n";
      ctx.out << "index: " << c.index << "\n";
      ctx.out << "\ninput:\n" << c.input << "\n";
      ctx.out << "\nexpected tree:\n" << c.expected << "\n";
      ctx.out << "\ngot tree:\n" << value_text(pair[0]) << "\n";
      ctx.out << "\nexpected errors: " << c.error_count << "\n";
      ctx.out << "got errors: " << jsonlite::to_json(pair[1]) << "\n";
      return 1;
    }
    if (verdict != TreeVerdict::pass && mismatches.size() < options.limit) {
      mismatches.push_back(where + ": mismatch");
    }
  }

  if (!mismatches.empty()) {
    for (const auto& line : mismatches) ctx.out << line << "\n";
    return 1;
  }
  return 0;
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

std::vector<std::string> default_encoding_fixtures() {
  return {"tests1.dat", "tests2.dat", "test-yahoo-jp.dat"};
}

int run_encoding(RunContext& ctx, const std::vector<std::string>& fixtures) {
  std::vector<std::string> mismatches;
  std::size_t mismatch_count = 0;
  for (const auto& fx : fixtures) {
    auto fixture = load_encoding_fixture(join_path(ctx.config.encoding_dir(), fx));
    if (!fixture.ok()) {
      ctx.err << "error: " << fixture.message() << "\n";
      return 1;
    }
    Batch batch;
    batch.mode = BatchMode::encoding;
    batch.fixture = fx;
    for (const auto& c : fixture.value.cases) {
      batch.items.push_back(make_encoding_item(std::nullopt, c.input));
    }
    auto results = submit_batch(ctx, batch);
    if (!results.ok()) {
      ctx.err << "error: encoding " << fx << ": runner failed: " << results.message() << "\n";
      return 1;
    }
    for (std::size_t i = 0; i < fixture.value.cases.size(); ++i) {
      const auto& c = fixture.value.cases[i];
      const std::string got = value_text(results.value[i]);
      if (normalize_encoding_label(c.expected_label) == normalize_encoding_label(got)) continue;
      ++mismatch_count;
      if (mismatches.size() < ctx.config.encoding_preview_limit) {
        mismatches.push_back(fx + " case #" + std::to_string(c.index) + ": expected='" +
                             c.expected_label + "' got='" + got + "'");
      }
    }
  }
  if (mismatch_count == 0) return 0;
  for (const auto& line : mismatches) ctx.out << line << "\n";
  if (mismatch_count > mismatches.size()) {
    ctx.out << "... " << (mismatch_count - mismatches.size()) << " more\n";
  }
  return 1;
}

}  // namespace h5gate
