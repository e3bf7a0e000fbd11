#include "h5gate/corpus.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include "h5gate/utf8.hpp"

namespace fs = std::filesystem;

namespace h5gate {

namespace {

const std::set<std::string>& tree_directives() {
  static const std::set<std::string> kDirectives = {
      "#new-errors", "#document-fragment", "#document", "#script-off", "#script-on"};
  return kDirectives;
}

bool is_tree_directive(const std::string& line) {
  return tree_directives().count(line) != 0;
}

std::string normalize_newlines(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '\r' && i + 1 < raw.size() && raw[i + 1] == '\n') continue;
    out.push_back(raw[i]);
  }
  return out;
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const std::size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

std::string join_lines(const std::vector<std::string>& lines, std::size_t from, std::size_t to) {
  std::string out;
  for (std::size_t i = from; i < to; ++i) {
    if (i > from) out.push_back('\n');
    out += lines[i];
  }
  return out;
}

std::string trim(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

// Blocks start at every line equal to "#data"; trailing empty lines are
// dropped from each block.
std::vector<std::string> split_on_data_lines(std::string_view raw) {
  const std::string text = normalize_newlines(raw);
  const auto lines = split_lines(text);
  std::vector<std::size_t> starts;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (lines[i] == "#data") starts.push_back(i);
  }
  std::vector<std::string> blocks;
  for (std::size_t k = 0; k < starts.size(); ++k) {
    const std::size_t lo = starts[k];
    std::size_t hi = k + 1 < starts.size() ? starts[k + 1] : lines.size();
    while (hi > lo && lines[hi - 1].empty()) --hi;
    blocks.push_back(join_lines(lines, lo, hi));
  }
  return blocks;
}

std::string fixture_error(const std::string& name, std::size_t block, const std::string& what) {
  return name + ": block " + std::to_string(block) + ": " + what;
}

std::string apply_string_normalization(const std::string& s, bool double_escaped) {
  return utf8::forgiving_roundtrip(double_escaped ? utf8::decode_escapes(s) : s);
}

}  // namespace

// ---------------------------------------------------------------------------
// Tokenizer
// ---------------------------------------------------------------------------

Outcome<std::string> map_initial_state(const std::string& html5lib_name) {
  static const std::map<std::string, std::string> kStates = {
      {"Data state", "Data"},
      {"PLAINTEXT state", "PLAINTEXT"},
      {"RCDATA state", "RCDATA"},
      {"RAWTEXT state", "RAWTEXT"},
      {"Script data state", "ScriptData"},
      {"CDATA section state", "CDATASection"},
  };
  const auto it = kStates.find(trim(html5lib_name));
  if (it == kStates.end()) {
    return Outcome<std::string>::skip(ErrorCode::unsupported_state,
                                      "unsupported initialStates entry: " + html5lib_name);
  }
  return Outcome<std::string>::success(it->second);
}

Outcome<TokenizerCase> normalize_tokenizer_case(const jsonlite::Value& raw, CaseIndex index) {
  using R = Outcome<TokenizerCase>;
  const std::string where = "test #" + std::to_string(index);
  if (!raw.is_object()) return R::failure(ErrorCode::fixture_malformed, where + ": not an object");
  const auto& obj = raw.as_object();

  const jsonlite::Value* input = jsonlite::find(obj, "input");
  if (!input || !input->is_string()) {
    return R::failure(ErrorCode::fixture_malformed, where + ": missing string \"input\"");
  }
  const jsonlite::Value* output = jsonlite::find(obj, "output");
  if (!output) return R::failure(ErrorCode::fixture_malformed, where + ": missing \"output\"");

  TokenizerCase c;
  c.index = index;
  c.double_escaped = jsonlite::get_bool(obj, "doubleEscaped", false);
  const bool de = c.double_escaped;
  c.input = apply_string_normalization(input->as_string(), de);
  c.expected = jsonlite::transform_strings(
      *output, [de](const std::string& s) { return apply_string_normalization(s, de); });

  const std::string last = jsonlite::get_string(obj, "lastStartTag", "");
  if (!last.empty()) c.last_start_tag = apply_string_normalization(last, de);

  if (const jsonlite::Value* states = jsonlite::find(obj, "initialStates")) {
    if (!states->is_array()) {
      return R::failure(ErrorCode::fixture_malformed, where + ": \"initialStates\" is not a list");
    }
    for (const auto& s : states->as_array()) {
      if (!s.is_string()) {
        return R::failure(ErrorCode::fixture_malformed, where + ": non-string initial state");
      }
      c.initial_states.push_back(s.as_string());
    }
  }
  if (c.initial_states.empty()) c.initial_states.push_back(kDefaultInitialState);
  return R::success(std::move(c));
}

Outcome<TokenizerFixture> parse_tokenizer_fixture(const std::string& json_text,
                                                  const std::string& name) {
  using R = Outcome<TokenizerFixture>;
  std::optional<jsonlite::JsonError> err;
  const auto root = jsonlite::parse_value(json_text, &err);
  if (!root) {
    return R::failure(ErrorCode::json_parse_error, name + ": " + (err ? err->message : "parse error"));
  }
  if (!root->is_object()) return R::failure(ErrorCode::fixture_malformed, name + ": top level is not an object");

  TokenizerFixture fx;
  fx.name = name;
  const auto& obj = root->as_object();
  const jsonlite::Value* tests = jsonlite::find(obj, "tests");
  if (!tests) {
    tests = jsonlite::find(obj, "xmlViolationTests");
    fx.xml_violation = tests != nullptr;
  }
  if (!tests || !tests->is_array()) {
    return R::failure(ErrorCode::fixture_malformed,
                      name + ": expected a \"tests\" or \"xmlViolationTests\" list");
  }
  const auto& arr = tests->as_array();
  fx.cases.reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    auto c = normalize_tokenizer_case(arr[i], i);
    if (!c.ok()) return R::failure(c.error_code, name + ": " + c.detail);
    fx.cases.push_back(std::move(c.value));
  }
  return R::success(std::move(fx));
}

Outcome<TokenizerFixture> load_tokenizer_fixture(const std::string& path) {
  auto text = read_fixture_text(path);
  if (!text.ok()) return text.forward<TokenizerFixture>();
  auto fx = parse_tokenizer_fixture(text.value, basename_of(path));
  if (fx.ok()) fx.value.path = path;
  return fx;
}

Outcome<std::size_t> count_tokenizer_cases(const std::string& path) {
  auto fx = load_tokenizer_fixture(path);
  if (!fx.ok()) return fx.forward<std::size_t>();
  return Outcome<std::size_t>::success(fx.value.cases.size());
}

// ---------------------------------------------------------------------------
// Tree construction
// ---------------------------------------------------------------------------

std::vector<std::string> split_tree_blocks(std::string_view raw) {
  return split_on_data_lines(raw);
}

Outcome<TreeCase> parse_tree_block(const std::string& block) {
  using R = Outcome<TreeCase>;
  const auto lines = split_lines(normalize_newlines(block));
  if (lines.empty() || lines[0] != "#data") {
    return R::failure(ErrorCode::fixture_malformed, "missing #data");
  }
  const auto errors_it = std::find(lines.begin(), lines.end(), "#errors");
  if (errors_it == lines.end()) {
    return R::failure(ErrorCode::fixture_malformed, "missing #errors");
  }
  const std::size_t i_errors = static_cast<std::size_t>(errors_it - lines.begin());

  TreeCase c;
  c.input = join_lines(lines, 1, i_errors);

  std::size_t idx = i_errors + 1;
  auto count_error_lines = [&]() {
    while (idx < lines.size() && !lines[idx].empty() && !is_tree_directive(lines[idx])) {
      ++c.error_count;
      ++idx;
    }
  };
  count_error_lines();
  if (idx < lines.size() && lines[idx] == "#new-errors") {
    ++idx;
    count_error_lines();
  }

  if (idx < lines.size() && lines[idx] == "#document-fragment") {
    ++idx;
    c.fragment_context = idx < lines.size() ? lines[idx] : std::string();
    ++idx;
  }

  if (idx < lines.size() && (lines[idx] == "#script-off" || lines[idx] == "#script-on")) {
    c.scripting = lines[idx] == "#script-off" ? "off" : "on";
    ++idx;
  }

  if (idx >= lines.size() || lines[idx] != "#document") {
    return R::failure(ErrorCode::fixture_malformed, "missing #document");
  }
  std::string expected = join_lines(lines, idx + 1, lines.size());
  while (!expected.empty() && expected.back() == '\n') expected.pop_back();
  c.expected = std::move(expected);
  return R::success(std::move(c));
}

Outcome<TreeFixture> parse_tree_fixture(std::string_view raw, const std::string& name) {
  using R = Outcome<TreeFixture>;
  TreeFixture fx;
  fx.name = name;
  const auto blocks = split_tree_blocks(raw);
  for (std::size_t b = 0; b < blocks.size(); ++b) {
    auto parsed = parse_tree_block(blocks[b]);
    if (!parsed.ok()) {
      return R::failure(parsed.error_code, fixture_error(name, b, parsed.detail));
    }
    auto& target = parsed.value.is_fragment() ? fx.frag_cases : fx.doc_cases;
    parsed.value.index = target.size();
    target.push_back(std::move(parsed.value));
  }
  return R::success(std::move(fx));
}

Outcome<TreeFixture> load_tree_fixture(const std::string& path) {
  auto text = read_fixture_text(path);
  if (!text.ok()) return text.forward<TreeFixture>();
  auto fx = parse_tree_fixture(text.value, basename_of(path));
  if (fx.ok()) fx.value.path = path;
  return fx;
}

Outcome<TreeTotals> count_tree_cases(const std::string& path) {
  auto fx = load_tree_fixture(path);
  if (!fx.ok()) return fx.forward<TreeTotals>();
  TreeTotals t;
  t.doc = fx.value.doc_cases.size();
  t.frag = fx.value.frag_cases.size();
  return Outcome<TreeTotals>::success(t);
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

std::vector<std::string> split_encoding_blocks(std::string_view raw) {
  return split_on_data_lines(raw);
}

Outcome<EncodingCase> parse_encoding_block(const std::string& block) {
  using R = Outcome<EncodingCase>;
  const auto lines = split_lines(normalize_newlines(block));
  if (lines.empty() || lines[0] != "#data") {
    return R::failure(ErrorCode::fixture_malformed, "missing #data");
  }
  const auto enc_it = std::find(lines.begin(), lines.end(), "#encoding");
  if (enc_it == lines.end()) {
    return R::failure(ErrorCode::fixture_malformed, "missing #encoding");
  }
  const std::size_t i_enc = static_cast<std::size_t>(enc_it - lines.begin());
  EncodingCase c;
  c.input = join_lines(lines, 1, i_enc);
  c.expected_label = trim(join_lines(lines, i_enc + 1, lines.size()));
  return R::success(std::move(c));
}

Outcome<EncodingFixture> parse_encoding_fixture(std::string_view raw, const std::string& name) {
  using R = Outcome<EncodingFixture>;
  EncodingFixture fx;
  fx.name = name;
  const auto blocks = split_encoding_blocks(raw);
  for (std::size_t b = 0; b < blocks.size(); ++b) {
    auto parsed = parse_encoding_block(blocks[b]);
    if (!parsed.ok()) {
      return R::failure(parsed.error_code, fixture_error(name, b, parsed.detail));
    }
    parsed.value.index = fx.cases.size();
    fx.cases.push_back(std::move(parsed.value));
  }
  return R::success(std::move(fx));
}

Outcome<EncodingFixture> load_encoding_fixture(const std::string& path) {
  auto text = read_fixture_text(path);
  if (!text.ok()) return text.forward<EncodingFixture>();
  auto fx = parse_encoding_fixture(text.value, basename_of(path));
  if (fx.ok()) fx.value.path = path;
  return fx;
}

std::string normalize_encoding_label(std::string_view label) {
  std::string s = trim(label);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (s == "utf8" || s == "utf-8") return "utf-8";
  static const std::set<std::string> kLatin1Family = {
      "iso-8859-1", "iso8859-1", "latin1", "latin-1",
      "windows1252", "cp1252", "x-cp1252", "windows-1252"};
  if (kLatin1Family.count(s) != 0) return "windows-1252";
  return s;
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

std::vector<std::string> discover_fixtures(const std::string& dir, const std::string& extension) {
  std::vector<std::string> out;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;
  for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    if (it->path().extension().string() == extension) out.push_back(it->path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

Outcome<std::string> read_fixture_text(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return Outcome<std::string>::failure(ErrorCode::io_error, "cannot open " + path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  if (ifs.bad()) return Outcome<std::string>::failure(ErrorCode::io_error, "cannot read " + path);
  return Outcome<std::string>::success(utf8::to_valid_utf8(oss.str()));
}

std::string basename_of(const std::string& path) {
  return fs::path(path).filename().string();
}

}  // namespace h5gate
