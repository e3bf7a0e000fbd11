#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "h5gate/allowlist.hpp"
#include "h5gate/config.hpp"
#include "h5gate/coverage.hpp"
#include "h5gate/engine.hpp"
#include "h5gate/observability.hpp"
#include "h5gate/runner.hpp"
#include "h5gate/version.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFail = 1;
constexpr int kExitUsage = 2;

const char *kUsage =
    "usage: h5gate [--file PATH] [--root PATH] [--runner PATH] [--timeout-s N]\n"
    "              <command> [options]\n"
    "\n"
    "commands:\n"
    "  show              [--kind K] [--fixture F] [--ranges]\n"
    "  stats\n"
    "  add               --kind K --fixture F --add RANGES... [--write]\n"
    "  diff-prev         [--rev REV] [--all] [--fail-on-decrease]\n"
    "  run               [--build]\n"
    "  auto-allowlist    --suite tokenizer|tree [--write]\n"
    "  report-tokenizer  [--fixture F] [--limit N] [--show fixture#index#State]\n"
    "  report-tree       --fixture F [--kind doc|frag] [--limit N] [--show IDX]\n"
    "  encoding          [--fixture F]... [--build]\n"
    "  version\n"
    "\n"
    "K is one of tree-doc, tree-frag, tokenizer.\n";

int usage_error(const std::string &message) {
  std::cerr << "error: " << message << "\n" << kUsage;
  return kExitUsage;
}

// Option cursor over the arguments that follow the command name.
class Options {
public:
  explicit Options(std::vector<std::string> args) : args_(std::move(args)) {}

  bool done() const { return pos_ >= args_.size(); }
  const std::string &peek() const { return args_[pos_]; }
  void next() { ++pos_; }

  std::optional<std::string> value() {
    if (pos_ + 1 >= args_.size())
      return std::nullopt;
    ++pos_;
    return args_[pos_];
  }

private:
  std::vector<std::string> args_;
  std::size_t pos_{0};
};

std::optional<std::size_t> parse_count(const std::string &text) {
  if (text.empty() || text.size() > 18 ||
      text.find_first_not_of("0123456789") != std::string::npos)
    return std::nullopt;
  return static_cast<std::size_t>(std::stoull(text));
}

std::string absolute_path(const std::string &p) {
  std::error_code ec;
  const fs::path abs = fs::absolute(fs::path(p), ec);
  return ec ? p : abs.lexically_normal().string();
}

h5gate::Outcome<h5gate::AllowlistDocument>
load_or_report(const h5gate::HarnessConfig &config) {
  auto doc = h5gate::load_allowlist(config.allowlist_path);
  if (!doc.ok())
    std::cerr << "error: " << doc.message() << "\n";
  return doc;
}

bool build_runner(const h5gate::HarnessConfig &config) {
  auto built = h5gate::ensure_runner_built(config, false);
  if (!built.ok()) {
    std::cerr << "error: " << built.message() << "\n";
    return false;
  }
  return true;
}

void warn_config(const h5gate::ConfigValidationResult &validation) {
  for (const auto &w : validation.warnings)
    std::cerr << "warning: " << w << "\n";
}

bool runner_exists(const h5gate::HarnessConfig &config) {
  std::error_code ec;
  return fs::exists(config.runner_path, ec);
}

// ---------------------------------------------------------------------------
// Allowlist commands
// ---------------------------------------------------------------------------

int cmd_show(const h5gate::HarnessConfig &config, Options opts) {
  std::optional<h5gate::SuiteKind> kind;
  std::optional<std::string> fixture;
  bool ranges = false;
  for (; !opts.done(); opts.next()) {
    const std::string a = opts.peek();
    if (a == "--kind") {
      auto v = opts.value();
      kind = v ? h5gate::parse_suite_kind(*v) : std::nullopt;
      if (!kind)
        return usage_error("--kind expects tree-doc, tree-frag or tokenizer");
    } else if (a == "--fixture") {
      fixture = opts.value();
      if (!fixture)
        return usage_error("--fixture expects a value");
    } else if (a == "--ranges") {
      ranges = true;
    } else {
      return usage_error("unknown option for show: " + a);
    }
  }

  auto doc = load_or_report(config);
  if (!doc.ok())
    return kExitUsage;

  std::vector<h5gate::SuiteKind> kinds;
  if (kind)
    kinds.push_back(*kind);
  else
    kinds.assign(h5gate::kAllSuiteKinds.begin(), h5gate::kAllSuiteKinds.end());

  for (h5gate::SuiteKind k : kinds) {
    std::vector<std::string> fixtures;
    if (fixture) {
      fixtures.push_back(*fixture);
    } else {
      for (const auto &[fx, xs] : doc.value.section(k))
        fixtures.push_back(fx);
    }
    for (const auto &fx : fixtures) {
      const auto xs = h5gate::get_indices(doc.value, k, fx);
      std::string shown;
      if (ranges) {
        shown = h5gate::format_ranges(xs);
      } else {
        for (std::size_t i = 0; i < xs.size(); ++i) {
          if (i > 0)
            shown += " ";
          shown += std::to_string(xs[i]);
        }
      }
      std::cout << h5gate::to_string(k) << " " << fx << "  count=" << xs.size()
                << "\n";
      std::cout << "  " << shown << "\n";
    }
  }
  return kExitOk;
}

int cmd_stats(const h5gate::HarnessConfig &config, Options opts) {
  if (!opts.done())
    return usage_error("unknown option for stats: " + opts.peek());

  auto doc = load_or_report(config);
  if (!doc.ok())
    return kExitUsage;
  auto totals = h5gate::compute_corpus_totals(config);
  if (!totals.ok()) {
    std::cerr << "error: " << totals.message() << "\n";
    return kExitFail;
  }

  const auto fingerprints =
      h5gate::compute_fingerprints(doc.value, totals.value, config);
  std::cout << h5gate::render_stats(doc.value, totals.value, fingerprints);

  const auto violations = h5gate::check_coverage_bounds(doc.value, totals.value);
  for (const auto &v : violations)
    std::cerr << "error: coverage bound violated: " << h5gate::describe(v)
              << "\n";
  return violations.empty() ? kExitOk : kExitFail;
}

int cmd_add(const h5gate::HarnessConfig &config, Options opts) {
  std::optional<h5gate::SuiteKind> kind;
  std::optional<std::string> fixture;
  std::vector<std::string> adds;
  bool write = false;
  for (; !opts.done(); opts.next()) {
    const std::string a = opts.peek();
    if (a == "--kind") {
      auto v = opts.value();
      kind = v ? h5gate::parse_suite_kind(*v) : std::nullopt;
      if (!kind)
        return usage_error("--kind expects tree-doc, tree-frag or tokenizer");
    } else if (a == "--fixture") {
      fixture = opts.value();
      if (!fixture)
        return usage_error("--fixture expects a value");
    } else if (a == "--add") {
      auto v = opts.value();
      if (!v)
        return usage_error("--add expects a value");
      adds.push_back(*v);
    } else if (a == "--write") {
      write = true;
    } else {
      return usage_error("unknown option for add: " + a);
    }
  }
  if (!kind || !fixture)
    return usage_error("add requires --kind and --fixture");

  auto doc = load_or_report(config);
  if (!doc.ok())
    return kExitUsage;

  h5gate::IndexList to_add;
  for (const auto &item : adds) {
    auto parsed = h5gate::parse_ranges(item);
    if (!parsed.ok())
      return usage_error(parsed.detail);
    to_add.insert(to_add.end(), parsed.value.begin(), parsed.value.end());
  }
  if (to_add.empty())
    return usage_error("nothing to add: provide --add ...");

  const auto r = h5gate::add_indices(doc.value, *kind, *fixture, to_add);
  std::cout << h5gate::to_string(*kind) << " " << *fixture << ": " << r.before
            << " -> " << r.after << " (+" << (r.after - r.before) << ")\n";

  if (!write) {
    std::cout << "Dry-run (pass --write to persist).\n";
    return kExitOk;
  }
  auto saved = h5gate::save_allowlist(doc.value, config.allowlist_path);
  if (!saved.ok()) {
    std::cerr << "error: " << saved.message() << "\n";
    return kExitFail;
  }
  std::cout << "Wrote " << config.allowlist_path << "\n";
  return kExitOk;
}

int cmd_diff_prev(const h5gate::HarnessConfig &config, Options opts) {
  std::string rev = "HEAD~1";
  bool show_all = false;
  bool fail_on_decrease = false;
  for (; !opts.done(); opts.next()) {
    const std::string a = opts.peek();
    if (a == "--rev") {
      auto v = opts.value();
      if (!v)
        return usage_error("--rev expects a value");
      rev = *v;
    } else if (a == "--all") {
      show_all = true;
    } else if (a == "--fail-on-decrease") {
      fail_on_decrease = true;
    } else {
      return usage_error("unknown option for diff-prev: " + a);
    }
  }

  auto cur = load_or_report(config);
  if (!cur.ok())
    return kExitUsage;
  const auto baseline = h5gate::load_baseline(config, rev, cur.value);
  for (const auto &w : baseline.warnings)
    std::cerr << "warning: " << w << "\n";

  auto totals = h5gate::compute_corpus_totals(config);
  if (!totals.ok()) {
    std::cerr << "error: " << totals.message() << "\n";
    return kExitFail;
  }
  const auto report =
      h5gate::compute_diff(baseline.doc, cur.value, totals.value, show_all);
  std::cout << h5gate::render_diff(report, baseline.label,
                                   config.allowlist_relpath());
  return (fail_on_decrease && report.regression) ? kExitFail : kExitOk;
}

// ---------------------------------------------------------------------------
// Engine commands
// ---------------------------------------------------------------------------

int cmd_run(const h5gate::HarnessConfig &config, Options opts) {
  bool build = false;
  for (; !opts.done(); opts.next()) {
    if (opts.peek() == "--build")
      build = true;
    else
      return usage_error("unknown option for run: " + opts.peek());
  }

  auto doc = load_or_report(config);
  if (!doc.ok())
    return kExitUsage;
  if ((build || !runner_exists(config)) && !build_runner(config))
    return kExitFail;

  h5gate::SubprocessEngine engine(config);
  h5gate::EventLog events(config.event_log_path);
  h5gate::RunContext ctx{config, engine, &events, std::cout, std::cerr};
  const auto summary = h5gate::run_allowlisted(ctx, doc.value);

  std::cerr << "run: " << events.stats().summary_line()
            << " checked=" << summary.cases_checked << "\n";
  if (summary.failures.empty())
    return kExitOk;
  const std::size_t shown =
      std::min(summary.failures.size(), config.failure_preview_limit);
  for (std::size_t i = 0; i < shown; ++i)
    std::cerr << summary.failures[i] << "\n";
  std::cerr << summary.failures.size() << " failing cases\n";
  return kExitFail;
}

int cmd_auto_allowlist(const h5gate::HarnessConfig &config, Options opts) {
  std::string suite;
  bool write = false;
  for (; !opts.done(); opts.next()) {
    const std::string a = opts.peek();
    if (a == "--suite") {
      auto v = opts.value();
      if (!v || (*v != "tokenizer" && *v != "tree"))
        return usage_error("--suite expects tokenizer or tree");
      suite = *v;
    } else if (a == "--write") {
      write = true;
    } else {
      return usage_error("unknown option for auto-allowlist: " + a);
    }
  }
  if (suite.empty())
    return usage_error("auto-allowlist requires --suite");

  auto doc = load_or_report(config);
  if (!doc.ok())
    return kExitUsage;
  if (!build_runner(config))
    return kExitFail;

  h5gate::SubprocessEngine engine(config);
  h5gate::EventLog events(config.event_log_path);
  h5gate::RunContext ctx{config, engine, &events, std::cout, std::cerr};
  const bool ok = suite == "tokenizer"
                      ? h5gate::auto_allowlist_tokenizer(ctx, doc.value)
                      : h5gate::auto_allowlist_tree(ctx, doc.value);
  if (!ok) {
    std::cerr << "error: some fixtures could not be evaluated; allowlist "
                 "left unchanged\n";
    return kExitFail;
  }

  if (!write) {
    std::cout << "Dry-run (pass --write to persist).\n";
    return kExitOk;
  }
  auto saved = h5gate::save_allowlist(doc.value, config.allowlist_path);
  if (!saved.ok()) {
    std::cerr << "error: " << saved.message() << "\n";
    return kExitFail;
  }
  std::cout << "Wrote " << config.allowlist_path << "\n";
  return kExitOk;
}

int cmd_report_tokenizer(const h5gate::HarnessConfig &config, Options opts) {
  h5gate::TokenizerReportOptions options;
  for (; !opts.done(); opts.next()) {
    const std::string a = opts.peek();
    if (a == "--fixture") {
      options.fixture = opts.value();
      if (!options.fixture)
        return usage_error("--fixture expects a value");
    } else if (a == "--limit") {
      auto v = opts.value();
      auto n = v ? parse_count(*v) : std::nullopt;
      if (!n)
        return usage_error("--limit expects a non-negative integer");
      options.limit = *n;
    } else if (a == "--show") {
      auto v = opts.value();
      if (!v)
        return usage_error("--show expects fixture#index#State");
      auto req = h5gate::parse_tokenizer_show(*v);
      if (!req.ok())
        return usage_error(req.detail);
      options.show = req.value;
    } else {
      return usage_error("unknown option for report-tokenizer: " + a);
    }
  }

  if (!build_runner(config))
    return kExitFail;
  h5gate::SubprocessEngine engine(config);
  h5gate::EventLog events(config.event_log_path);
  h5gate::RunContext ctx{config, engine, &events, std::cout, std::cerr};
  return h5gate::report_tokenizer_failures(ctx, options);
}

int cmd_report_tree(const h5gate::HarnessConfig &config, Options opts) {
  h5gate::TreeReportOptions options;
  for (; !opts.done(); opts.next()) {
    const std::string a = opts.peek();
    if (a == "--fixture") {
      auto v = opts.value();
      if (!v)
        return usage_error("--fixture expects a value");
      options.fixture = *v;
    } else if (a == "--kind") {
      auto v = opts.value();
      if (!v || (*v != "doc" && *v != "frag"))
        return usage_error("--kind expects doc or frag");
      options.fragment = *v == "frag";
    } else if (a == "--limit") {
      auto v = opts.value();
      auto n = v ? parse_count(*v) : std::nullopt;
      if (!n)
        return usage_error("--limit expects a non-negative integer");
      options.limit = *n;
    } else if (a == "--show") {
      auto v = opts.value();
      auto n = v ? parse_count(*v) : std::nullopt;
      if (!n)
        return usage_error("--show expects a case index");
      options.show = *n;
    } else {
      return usage_error("unknown option for report-tree: " + a);
    }
  }
  if (options.fixture.empty())
    return usage_error("report-tree requires --fixture");

  if (!build_runner(config))
    return kExitFail;
  h5gate::SubprocessEngine engine(config);
  h5gate::EventLog events(config.event_log_path);
  h5gate::RunContext ctx{config, engine, &events, std::cout, std::cerr};
  return h5gate::report_tree_failures(ctx, options);
}

int cmd_encoding(const h5gate::HarnessConfig &config, Options opts) {
  std::vector<std::string> fixtures;
  bool build = false;
  for (; !opts.done(); opts.next()) {
    const std::string a = opts.peek();
    if (a == "--fixture") {
      auto v = opts.value();
      if (!v)
        return usage_error("--fixture expects a value");
      fixtures.push_back(*v);
    } else if (a == "--build") {
      build = true;
    } else {
      return usage_error("unknown option for encoding: " + a);
    }
  }
  if (fixtures.empty())
    fixtures = h5gate::default_encoding_fixtures();

  if ((build || !runner_exists(config)) && !build_runner(config))
    return kExitFail;
  h5gate::SubprocessEngine engine(config);
  h5gate::EventLog events(config.event_log_path);
  h5gate::RunContext ctx{config, engine, &events, std::cout, std::cerr};
  return h5gate::run_encoding(ctx, fixtures);
}

} // namespace

int main(int argc, char **argv) {
  std::optional<std::string> file, root, runner, timeout;
  std::string cmd;
  std::vector<std::string> rest;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-h" || a == "--help") {
      std::cout << kUsage;
      return kExitOk;
    }
    if (a == "--file" || a == "--root" || a == "--runner" || a == "--timeout-s") {
      if (i + 1 >= argc)
        return usage_error(a + " expects a value");
      const std::string v = argv[++i];
      if (a == "--file")
        file = v;
      else if (a == "--root")
        root = v;
      else if (a == "--runner")
        runner = v;
      else
        timeout = v;
      continue;
    }
    if (a.rfind("--", 0) == 0)
      return usage_error("unknown global option: " + a);
    cmd = a;
    break;
  }
  if (cmd.empty())
    return usage_error("missing command");
  for (++i; i < argc; ++i)
    rest.emplace_back(argv[i]);

  if (cmd == "version") {
    std::cout << h5gate::version::manifest_to_json(
                     h5gate::version::current_manifest())
              << "\n";
    return kExitOk;
  }

  h5gate::HarnessConfig config =
      h5gate::HarnessConfig::from_env(root ? absolute_path(*root) : "");
  if (file)
    config.allowlist_path = absolute_path(*file);
  if (runner) {
    const std::string previous = config.runner_path;
    config.runner_path = absolute_path(*runner);
    for (auto &arg : config.build_command) {
      if (arg == previous)
        arg = config.runner_path;
    }
  }
  if (timeout) {
    config.timeout_ms = h5gate::parse_timeout_seconds(*timeout);
    if (config.timeout_ms == 0)
      return usage_error("--timeout-s expects a positive number of seconds");
  }

  const auto validation = h5gate::validate_config(config);
  if (!validation.ok) {
    for (const auto &e : validation.errors)
      std::cerr << "error: " << e << "\n";
    return kExitUsage;
  }

  Options opts(std::move(rest));
  if (cmd == "show")
    return cmd_show(config, std::move(opts));
  if (cmd == "add")
    return cmd_add(config, std::move(opts));

  // Everything below reads the corpus.
  warn_config(validation);
  if (cmd == "stats")
    return cmd_stats(config, std::move(opts));
  if (cmd == "diff-prev")
    return cmd_diff_prev(config, std::move(opts));
  if (cmd == "run")
    return cmd_run(config, std::move(opts));
  if (cmd == "auto-allowlist")
    return cmd_auto_allowlist(config, std::move(opts));
  if (cmd == "report-tokenizer")
    return cmd_report_tokenizer(config, std::move(opts));
  if (cmd == "report-tree")
    return cmd_report_tree(config, std::move(opts));
  if (cmd == "encoding")
    return cmd_encoding(config, std::move(opts));

  return usage_error("unknown command: " + cmd);
}
