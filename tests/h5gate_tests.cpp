#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "h5gate/allowlist.hpp"
#include "h5gate/base64.hpp"
#include "h5gate/config.hpp"
#include "h5gate/corpus.hpp"
#include "h5gate/coverage.hpp"
#include "h5gate/engine.hpp"
#include "h5gate/hash.hpp"
#include "h5gate/jsonlite.hpp"
#include "h5gate/observability.hpp"
#include "h5gate/process.hpp"
#include "h5gate/runner.hpp"
#include "h5gate/utf8.hpp"
#include "h5gate/version.hpp"

namespace fs = std::filesystem;
using namespace h5gate;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / name;
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

void write_file(const fs::path& p, const std::string& text) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << text;
}

std::string read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

void write_script(const fs::path& p, const std::string& body) {
  write_file(p, "#!/bin/sh\n" + body);
  fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                  fs::perm_options::replace);
}

HarnessConfig config_for(const fs::path& root) {
  HarnessConfig c;
  c.repo_root = root.string();
  c.allowlist_path = (root / "data" / "html5lib_allowlists.json").string();
  c.corpus_root = (root / "corpus").string();
  c.runner_path = (root / ".build" / "runner").string();
  c.build_source_dir = (root / "src").string();
  c.timeout_ms = 10000;
  return c;
}

jsonlite::Value json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  auto v = jsonlite::parse_value(text, &err);
  expect(v.has_value(), "test JSON must parse: " + text);
  return *v;
}

jsonlite::Value tree_result(const std::string& dump, std::uint64_t errors) {
  return jsonlite::Value(jsonlite::Array{jsonlite::Value(dump), jsonlite::Value(errors)});
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// ---------------------------------------------------------------------------
// Shared fixtures
// ---------------------------------------------------------------------------

const char* kTreeFixture =
    "#data\n"
    "<p>One\n"
    "#errors\n"
    "(1,3): expected-doctype-but-got-start-tag\n"
    "#document\n"
    "| <html>\n"
    "|   <head>\n"
    "|   <body>\n"
    "|     <p>\n"
    "|       \"One\"\n"
    "\n"
    "#data\n"
    "<td>x\n"
    "#errors\n"
    "(1,1): unexpected-start-tag\n"
    "#new-errors\n"
    "(1,5): eof-in-td\n"
    "#document-fragment\n"
    "tr\n"
    "#script-on\n"
    "#document\n"
    "| <td>\n"
    "|   \"x\"\n";

const char* kTreeDocExpected =
    "| <html>\n|   <head>\n|   <body>\n|     <p>\n|       \"One\"";
const char* kTreeFragExpected = "| <td>\n|   \"x\"";

const char* kTokenizerFixture = R"({"tests": [
  {"description": "named reference", "input": "&amp;", "output": [["Character", "&"]]},
  {"description": "two states", "initialStates": ["RCDATA state", "RAWTEXT state"],
   "lastStartTag": "xmp", "input": "<a>", "output": [["Character", "<a>"]]},
  {"description": "unsupported state", "initialStates": ["Bogus state"], "input": "x",
   "output": [["Character", "x"]]}
]}
)";

const char* kEncodingFixture =
    "#data\n"
    "<meta charset=\"utf-8\">\n"
    "#encoding\n"
    "utf-8\n"
    "\n"
    "#data\n"
    "<meta charset=\"latin1\">\n"
    "#encoding\n"
    "windows-1252\n";

// corpus/ with one tree fixture (plus a scripted/ duplicate), one tokenizer
// fixture and one encoding fixture.
HarnessConfig make_corpus(const std::string& name) {
  const fs::path root = fresh_dir(name);
  HarnessConfig c = config_for(root);
  write_file(fs::path(c.tree_dir()) / "tests1.dat", kTreeFixture);
  write_file(fs::path(c.tree_dir()) / "scripted" / "tests1.dat",
             "#data\n<b>\n#errors\n#document\n| <html>\n");
  write_file(fs::path(c.tokenizer_dir()) / "a.test", kTokenizerFixture);
  write_file(fs::path(c.encoding_dir()) / "tests1.dat", kEncodingFixture);
  return c;
}

// Answers tree batches: document cases pass, fragment cases get a wrong tree.
Outcome<jsonlite::Array> tree_responder(const Batch& batch) {
  jsonlite::Array out;
  for (const auto& item : batch.items) {
    if (item.fields[0] == "doc") {
      out.push_back(tree_result(kTreeDocExpected, 1));
    } else {
      out.push_back(tree_result("| <wrong>", 2));
    }
  }
  return Outcome<jsonlite::Array>::success(std::move(out));
}

// ============================================================================
// Phase 1: UTF-8, escapes, base64, JSON
// ============================================================================

void test_forgiving_decoder() {
  const std::u32string one = utf8::decode_forgiving("\x80");
  expect(one.size() == 1 && one[0] == 0xEE080, "lone continuation byte maps to PUA");

  const std::u32string sur = utf8::decode_forgiving("\xED\xA0\x80");
  expect(sur == std::u32string({0xEE0ED, 0xEE0A0, 0xEE080}), "encoded surrogate maps byte-wise to PUA");

  const std::u32string ok = utf8::decode_forgiving("a\xC3\xA9");
  expect(ok == std::u32string({U'a', 0xE9}), "valid UTF-8 decodes normally");
}

void test_forgiving_decoder_sequence_bounds() {
  expect(utf8::decode_forgiving("\xE2\x82\xAC") == std::u32string({0x20AC}), "3-byte sequence");
  expect(utf8::decode_forgiving("\xF0\x9F\x98\x80") == std::u32string({0x1F600}), "4-byte sequence");
  expect(utf8::decode_forgiving("\xF4\x8F\xBF\xBF") == std::u32string({0x10FFFF}), "U+10FFFF");

  expect(utf8::decode_forgiving("\xE0\x9F\x80") == std::u32string({0xEE0E0, 0xEE09F, 0xEE080}),
         "overlong 3-byte form after E0");
  expect(utf8::decode_forgiving("\xF0\x8F\xBF\xBF") ==
             std::u32string({0xEE0F0, 0xEE08F, 0xEE0BF, 0xEE0BF}),
         "overlong 4-byte form after F0");
  expect(utf8::decode_forgiving("\xF4\x90\x80\x80") ==
             std::u32string({0xEE0F4, 0xEE090, 0xEE080, 0xEE080}),
         "above U+10FFFF after F4");

  expect(utf8::decode_forgiving("\xC0\x80") == std::u32string({0xEE0C0, 0xEE080}), "C0 lead byte");
  expect(utf8::decode_forgiving("\xF5\x80\x80\x80") ==
             std::u32string({0xEE0F5, 0xEE080, 0xEE080, 0xEE080}),
         "F5 lead byte");

  expect(utf8::decode_forgiving("\xE2\x82") == std::u32string({0xEE0E2, 0xEE082}),
         "sequence cut off at end of input");
  expect(utf8::decode_forgiving("\xF0\x9F\x98" "a") == std::u32string({0xEE0F0, 0xEE09F, 0xEE098, U'a'}),
         "sequence cut off by ASCII");
}

void test_surrogate_passthrough() {
  std::string out;
  utf8::append_code_point(out, 0xD800);
  expect(out == "\xED\xA0\x80", "unpaired surrogate written as 3 bytes");
  expect(utf8::forgiving_roundtrip("plain") == "plain", "ASCII round-trips unchanged");
  expect(utf8::to_valid_utf8("a\xFF" "b") == "a\xEF\xBF\xBD" "b", "invalid byte replaced by U+FFFD");
}

void test_decode_escapes() {
  expect(utf8::decode_escapes("\\u0041\\n") == "A\n", "\\u and \\n escapes");
  expect(utf8::decode_escapes("\\uD83D\\uDE00") == "\xED\xA0\xBD\xED\xB8\x80",
         "surrogate escapes decode one at a time");
  expect(utf8::decode_escapes("\\q") == "\\q", "unknown escape kept literally");
  expect(utf8::decode_escapes("\\101") == "A", "octal escape");
  expect(utf8::decode_escapes("tail\\") == "tail\\", "trailing backslash kept");
}

void test_base64() {
  expect(base64_encode("f") == "Zg==", "one byte padding");
  expect(base64_encode("&amp;") == "JmFtcDs=", "payload for &amp;");
  expect(base64_encode("") == "", "empty payload");
  expect(!base64_decode("Zm9").has_value(), "length not a multiple of four rejected");
  expect(!base64_decode("Zm9*").has_value(), "bad character rejected");
  auto decoded = base64_decode("JmFtcDs=");
  expect(decoded && *decoded == "&amp;", "decode inverse of encode");
}

void test_json_strings_and_numbers() {
  auto pair = json(R"("\ud83d\ude00")");
  expect(pair.as_string() == "\xF0\x9F\x98\x80", "surrogate pair escape combines");
  auto lone = json(R"("\ud800")");
  expect(lone.as_string() == "\xED\xA0\x80", "lone surrogate escape kept as 3 bytes");
  expect(json("2") == json("2.0"), "2 equals 2.0");
  expect(json("[1,2]") != json("[2,1]"), "array order matters");
}

void test_json_duplicate_keys() {
  std::optional<jsonlite::JsonError> err;
  auto v = jsonlite::parse_value(R"({"a":1,"a":2})", &err);
  expect(!v.has_value(), "duplicate key rejected");
  expect(err && err->code == "json_duplicate_key", "duplicate key error code");
}

void test_json_pretty() {
  const std::string text = jsonlite::to_json_pretty(json(R"({"b":[1],"a":{}})"), 2);
  expect(text == "{\n  \"a\": {},\n  \"b\": [\n    1\n  ]\n}", "pretty layout with sorted keys");
}

// ============================================================================
// Phase 2: Corpus parsing
// ============================================================================

void test_tree_blocks_split() {
  const auto blocks = split_tree_blocks(kTreeFixture);
  expect(blocks.size() == 2, "two blocks");
  expect(blocks[0].rfind("#data\n<p>One", 0) == 0, "first block kept");
  expect(blocks[0].back() == '"', "trailing empty line trimmed");
}

void test_tree_fixture_parse() {
  auto fx = parse_tree_fixture(kTreeFixture, "tests1.dat");
  expect(fx.ok(), "tree fixture parses: " + fx.message());
  expect(fx.value.doc_cases.size() == 1 && fx.value.frag_cases.size() == 1, "one doc, one frag");

  const TreeCase& doc = fx.value.doc_cases[0];
  expect(doc.input == "<p>One", "doc input");
  expect(doc.expected == kTreeDocExpected, "doc expected tree");
  expect(doc.error_count == 1, "doc error count");
  expect(!doc.is_fragment() && !doc.scripting, "doc defaults");

  const TreeCase& frag = fx.value.frag_cases[0];
  expect(frag.error_count == 2, "#errors and #new-errors both counted");
  expect(frag.fragment_context && *frag.fragment_context == "tr", "fragment context");
  expect(frag.scripting && *frag.scripting == "on", "script-on");
  expect(frag.expected == kTreeFragExpected, "frag expected tree");
}

void test_tree_document_block() {
  auto c = parse_tree_block(
      "#data\n<p>X\n#errors\n#document\n| <html>\n|   <head>\n|   <body>\n|     <p>\n|       \"X\"");
  expect(c.ok(), "document block parses");
  expect(c.value.error_count == 0, "no errors");
  expect(!c.value.fragment_context, "not a fragment");
  expect(c.value.expected == "| <html>\n|   <head>\n|   <body>\n|     <p>\n|       \"X\"",
         "expected tree kept verbatim");
}

void test_tree_numbering_per_kind() {
  const std::string raw = std::string(kTreeFixture) + "\n" + kTreeFixture;
  auto fx = parse_tree_fixture(raw, "x.dat");
  expect(fx.ok(), "doubled fixture parses");
  expect(fx.value.doc_cases.size() == 2 && fx.value.frag_cases.size() == 2, "two of each");
  expect(fx.value.doc_cases[1].index == 1, "doc numbering independent");
  expect(fx.value.frag_cases[1].index == 1, "frag numbering independent");
}

void test_tree_missing_document_fatal() {
  const std::string raw = std::string(kTreeFixture) + "\n#data\n<x>\n#errors\n";
  auto fx = parse_tree_fixture(raw, "bad.dat");
  expect(fx.fatal(), "missing #document fails the fixture");
  expect(fx.error_code == ErrorCode::fixture_malformed, "malformed code");
  expect(fx.detail == "bad.dat: block 2: missing #document", "block position in detail");

  auto no_errors = parse_tree_block("#data\n<x>\n#document\n| <html>");
  expect(no_errors.fatal() && no_errors.detail == "missing #errors", "missing #errors");
}

void test_tree_crlf() {
  auto fx = parse_tree_fixture("#data\r\n<b>\r\n#errors\r\n#document\r\n| <html>\r\n", "crlf.dat");
  expect(fx.ok() && fx.value.doc_cases.size() == 1, "CRLF fixture parses");
  expect(fx.value.doc_cases[0].expected == "| <html>", "CR stripped");
}

void test_tokenizer_fixture_parse() {
  auto fx = parse_tokenizer_fixture(kTokenizerFixture, "a.test");
  expect(fx.ok(), "tokenizer fixture parses: " + fx.message());
  expect(!fx.value.xml_violation, "tests key");
  expect(fx.value.cases.size() == 3, "three cases");
  expect(fx.value.cases[0].initial_states == std::vector<std::string>{"Data state"}, "default state");
  expect(!fx.value.cases[0].last_start_tag, "no last start tag");
  expect(fx.value.cases[1].last_start_tag && *fx.value.cases[1].last_start_tag == "xmp", "last start tag");
  expect(fx.value.cases[1].initial_states.size() == 2, "two states");
}

void test_tokenizer_double_escaped() {
  auto fx = parse_tokenizer_fixture(
      R"({"tests":[{"doubleEscaped":true,"input":"\\u0000\\uD800","output":[["Character","\\u0000"]]}]})",
      "esc.test");
  expect(fx.ok(), "double-escaped fixture parses");
  const TokenizerCase& c = fx.value.cases[0];
  const std::string pua = utf8::encode_passthrough(std::u32string({0xEE0ED, 0xEE0A0, 0xEE080}));
  expect(c.input == std::string(1, '\0') + pua, "escapes decoded then round-tripped");
  const auto& token = c.expected.as_array()[0].as_array();
  expect(token[1].as_string() == std::string(1, '\0'), "expected output decoded too");
}

void test_tokenizer_xml_violation() {
  auto fx = parse_tokenizer_fixture(R"({"xmlViolationTests":[{"input":"a","output":[]}]})", "x.test");
  expect(fx.ok() && fx.value.xml_violation, "xmlViolationTests flagged");
  const auto sub = build_tokenizer_submission(fx.value, nullptr);
  expect(sub.batch.mode == BatchMode::tokenizer_xml, "xml batch mode");

  auto missing = parse_tokenizer_fixture(R"({"other":[]})", "y.test");
  expect(missing.fatal(), "no tests list is fatal");
  auto no_output = parse_tokenizer_fixture(R"({"tests":[{"input":"a"}]})", "z.test");
  expect(no_output.fatal() && no_output.error_code == ErrorCode::fixture_malformed, "missing output");
}

void test_initial_state_mapping() {
  auto data = map_initial_state("Script data state");
  expect(data.ok() && data.value == "ScriptData", "script data state");
  auto bogus = map_initial_state("Bogus state");
  expect(bogus.skipped(), "unknown state is skip-recoverable");
  expect(bogus.error_code == ErrorCode::unsupported_state, "unsupported_state code");
}

void test_encoding_fixture_parse() {
  auto fx = parse_encoding_fixture(kEncodingFixture, "tests1.dat");
  expect(fx.ok(), "encoding fixture parses");
  expect(fx.value.cases.size() == 2, "first block not dropped");
  expect(fx.value.cases[0].input == "<meta charset=\"utf-8\">", "input bytes");
  expect(fx.value.cases[1].expected_label == "windows-1252", "label");
  expect(normalize_encoding_label(" UTF8 ") == "utf-8", "utf8 alias");
  expect(normalize_encoding_label("ISO-8859-1") == "windows-1252", "latin1 family");
  expect(normalize_encoding_label("Shift_JIS") == "shift_jis", "case folded");
}

void test_discovery() {
  const HarnessConfig c = make_corpus("h5gate_discovery_test");
  const auto paths = discover_fixtures(c.tree_dir(), ".dat");
  expect(paths.size() == 2, "recursive discovery");
  expect(basename_of(paths[0]) == "tests1.dat", "basename");
  expect(discover_fixtures(c.tree_dir() + "/missing", ".dat").empty(), "missing dir is empty");
  fs::remove_all(c.repo_root);
}

// ============================================================================
// Phase 3: Batch protocol
// ============================================================================

void test_request_scenario_single_case() {
  auto fx = parse_tokenizer_fixture(kTokenizerFixture, "a.test");
  const IndexList only_first = {0};
  const auto sub = build_tokenizer_submission(fx.value, &only_first);
  expect(encode_request(sub.batch) == "1\nData\t-\t8\nJmFtcDs=\n", "request bytes");

  FakeEngine engine([](const Batch& b) {
    jsonlite::Array out(b.items.size(), json(R"([["Character","&"]])"));
    return Outcome<jsonlite::Array>::success(std::move(out));
  });
  auto results = engine.submit(sub.batch);
  expect(results.ok(), "fake engine answers");
  expect(engine.submitted()[0].items[0].fields == std::vector<std::string>{"Data", "-"}, "header fields");
  const auto verdicts = judge_tokenizer(fx.value, sub, results.value);
  expect(verdicts.passing[0], "case 0 passes");
}

void test_multi_state_judgement() {
  auto fx = parse_tokenizer_fixture(kTokenizerFixture, "a.test");
  const auto sub = build_tokenizer_submission(fx.value, nullptr);
  expect(sub.slots.size() == 3, "case 0 once, case 1 twice");
  expect(sub.unsupported == IndexList{2}, "case 2 unsupported");
  expect(sub.batch.items[1].fields == std::vector<std::string>{"RCDATA", "xmp"}, "state and tag");

  jsonlite::Array results = {json(R"([["Character","&"]])"), json(R"([["Character","<a>"]])"),
                             json(R"([["Character","<"],["Character","a>"]])")};
  const auto verdicts = judge_tokenizer(fx.value, sub, results);
  expect(verdicts.passing[0], "case 0 passes");
  expect(!verdicts.passing[1], "one mismatching state fails the case");
  expect(!verdicts.passing[2], "unsupported case never passes");
  expect(verdicts.mismatches.size() == 1 && verdicts.mismatches[0].state == "RAWTEXT", "mismatch slot");
}

void test_short_results_never_pass() {
  auto fx = parse_tokenizer_fixture(kTokenizerFixture, "a.test");
  const auto sub = build_tokenizer_submission(fx.value, nullptr);

  // Results for case 0 and the first state of case 1 only.
  jsonlite::Array results = {json(R"([["Character","&"]])"), json(R"([["Character","<a>"]])")};
  const auto verdicts = judge_tokenizer(fx.value, sub, results);
  expect(verdicts.passing[0], "answered case passes");
  expect(!verdicts.passing[1], "state without a result does not pass");
  expect(verdicts.mismatches.empty(), "missing results are not mismatches");

  const auto none = judge_tokenizer(fx.value, sub, {});
  expect(!none.passing[0] && !none.passing[1], "no results, no passes");
}

void test_payload_chunking() {
  Batch batch;
  batch.items.push_back(make_tokenizer_item("Data", std::nullopt, std::string(900, 'a')));
  const std::string b64 = base64_encode(std::string(900, 'a'));
  expect(b64.size() == 1200, "base64 length");
  expect(encode_request(batch) ==
             "1\nData\t-\t1200\n" + b64.substr(0, 900) + "\n" + b64.substr(900) + "\n",
         "payload split at 900 characters");

  Batch tree;
  tree.mode = BatchMode::tree;
  tree.items.push_back(make_tree_item(std::nullopt, std::nullopt, ""));
  expect(encode_request(tree) == "1\ndoc\t-\t-\t0\n", "empty payload has no lines");

  const BatchItem frag = make_tree_item(std::string("tr"), std::string("off"), "<td>");
  expect(frag.fields == std::vector<std::string>{"frag", "tr", "off"}, "fragment header");
}

void test_decode_response_errors() {
  auto bad = decode_response("not json", 1);
  expect(bad.fatal() && bad.error_code == ErrorCode::runner_output_invalid, "non-JSON output");
  auto obj = decode_response("{}", 1);
  expect(obj.error_code == ErrorCode::runner_output_invalid, "non-array output");
  auto len = decode_response("[1]", 2);
  expect(len.error_code == ErrorCode::runner_output_length, "wrong length");
  auto good = decode_response("[1, 2]\n", 2);
  expect(good.ok() && good.value.size() == 2, "valid output");
}

// ============================================================================
// Phase 4: Allowlist store
// ============================================================================

void test_allowlist_validation() {
  auto v2 = parse_allowlist(R"({"version":2,"tree":{"doc":{},"frag":{}},"tokenizer":{}})");
  expect(v2.fatal() && v2.error_code == ErrorCode::allowlist_invalid, "version 2 rejected");
  auto no_tree = parse_allowlist(R"({"version":1,"tokenizer":{}})");
  expect(no_tree.fatal(), "missing tree rejected");
  auto no_frag = parse_allowlist(R"({"version":1,"tree":{"doc":{}},"tokenizer":{}})");
  expect(no_frag.fatal(), "missing frag rejected");
  for (const char* bad : {"-1", "true", "1.5", "\"3\""}) {
    auto doc = parse_allowlist(std::string(R"({"version":1,"tree":{"doc":{},"frag":{}},"tokenizer":{"a.test":[)") +
                               bad + "]}}");
    expect(doc.fatal(), std::string("index rejected: ") + bad);
  }
  auto dup = parse_allowlist(R"({"version":1,"version":1,"tree":{"doc":{},"frag":{}},"tokenizer":{}})");
  expect(dup.error_code == ErrorCode::json_duplicate_key, "duplicate key code");

  auto ok = parse_allowlist(R"({"version":1,"tree":{"doc":{"t.dat":[3,1,3]},"frag":{}},"tokenizer":{}})");
  expect(ok.ok(), "valid document");
  expect(ok.value.tree_doc["t.dat"] == IndexList({1, 3}), "indices normalized on load");
}

void test_allowlist_serialization() {
  AllowlistDocument doc;
  set_indices(doc, SuiteKind::tokenizer, "a.test", {1, 0, 1});
  const std::string text = serialize_allowlist(doc);
  expect(text ==
             "{\n  \"tokenizer\": {\n    \"a.test\": [\n      0,\n      1\n    ]\n  },\n"
             "  \"tree\": {\n    \"doc\": {},\n    \"frag\": {}\n  },\n  \"version\": 1\n}\n",
         "on-disk layout");
  auto again = parse_allowlist(text);
  expect(again.ok() && serialize_allowlist(again.value) == text, "serialization idempotent");
  expect(canonical_allowlist_json(doc) ==
             R"({"tokenizer":{"a.test":[0,1]},"tree":{"doc":{},"frag":{}},"version":1})",
         "canonical form");
}

void test_allowlist_atomic_save() {
  const fs::path root = fresh_dir("h5gate_allowlist_save_test");
  const fs::path path = root / "nested" / "deep" / "allow.json";
  AllowlistDocument doc;
  set_indices(doc, SuiteKind::tree_frag, "tests1.dat", {4});
  auto saved = save_allowlist(doc, path.string());
  expect(saved.ok(), "save into new directories: " + saved.message());
  expect(!fs::exists(path.string() + ".tmp"), "temp file renamed away");
  auto loaded = load_allowlist(path.string());
  expect(loaded.ok() && loaded.value.tree_frag["tests1.dat"] == IndexList{4}, "reload");

  AllowlistDocument bad;
  bad.version = 7;
  expect(save_allowlist(bad, path.string()).fatal(), "invalid document not saved");
  expect(load_allowlist(path.string()).ok(), "previous file intact");
  fs::remove_all(root);
}

void test_ranges() {
  auto r = parse_ranges("1,2,5-7");
  expect(r.ok() && r.value == IndexList({1, 2, 5, 6, 7}), "ranges expand");
  auto sp = parse_ranges(" 3 , ,4 ");
  expect(sp.ok() && sp.value == IndexList({3, 4}), "whitespace and empty parts ignored");
  auto inv = parse_ranges("7-5");
  expect(inv.fatal() && contains(inv.detail, "hi < lo"), "inverted range");
  expect(parse_ranges("x").error_code == ErrorCode::range_invalid, "non-numeric");
  expect(parse_ranges("1-").fatal(), "open range");
  expect(parse_ranges("-3").fatal(), "negative");

  const IndexList xs = {0, 1, 2, 4, 5, 7, 8, 9, 10};
  expect(format_ranges(xs) == "0-2,4,5,7-10", "format collapses runs of three");
  auto back = parse_ranges(format_ranges(xs));
  expect(back.ok() && normalize_indices(back.value) == xs, "format then parse");
}

void test_add_monotonic() {
  AllowlistDocument doc;
  const AddResult first = add_indices(doc, SuiteKind::tree_doc, "t.dat", {3, 1});
  expect(first.before == 0 && first.after == 2, "first add");
  const AddResult second = add_indices(doc, SuiteKind::tree_doc, "t.dat", {1, 2});
  expect(second.before == 2 && second.after == 3, "existing indices kept");
  expect(get_indices(doc, SuiteKind::tree_doc, "t.dat") == IndexList({1, 2, 3}), "merged");
  expect(enabled_total(doc, SuiteKind::tree_doc) == 3, "enabled total");
  expect(enabled_total(doc, SuiteKind::tree_frag) == 0, "other kinds untouched");
}

// ============================================================================
// Phase 5: Coverage statistics and diffs
// ============================================================================

void test_corpus_totals() {
  const HarnessConfig c = make_corpus("h5gate_totals_test");
  auto totals = compute_corpus_totals(c);
  expect(totals.ok(), "totals computed: " + totals.message());
  expect(totals.value.tree["tests1.dat"].doc == 2, "doc cases aggregated across subdirectories");
  expect(totals.value.tree["tests1.dat"].frag == 1, "frag cases");
  expect(totals.value.total(SuiteKind::tokenizer) == 3, "tokenizer total");
  expect(totals.value.tree_paths.size() == 2, "both tree paths");

  write_file(fs::path(c.tree_dir()) / "broken.dat", "#data\n<x>\n");
  expect(compute_corpus_totals(c).fatal(), "malformed fixture fails the count");
  fs::remove_all(c.repo_root);
}

void test_percentages() {
  expect(format_pct(1, 3) == "33.3%", "one decimal");
  expect(format_pct(0, 0) == "n/a", "zero total");
  DiffLine line;
  line.label = "tree-doc";
  line.before = 2;
  line.after = 1;
  line.total = 2;
  expect(format_diff_line(line) == "2/2 (100.0%) -> 1/2 (50.0%)  Δ-1  -50.0pp", "diff line");
  expect(line.decreased(), "decrease detected");
  DiffLine empty;
  expect(format_diff_line(empty) == "0/0 (n/a) -> 0/0 (n/a)  Δ+0  n/a", "n/a diff line");
}

void test_diff_regression() {
  CorpusTotals totals;
  totals.tree["tests1.dat"] = TreeTotals{2, 1};
  AllowlistDocument before;
  set_indices(before, SuiteKind::tree_doc, "tests1.dat", {0, 1});
  AllowlistDocument after;
  set_indices(after, SuiteKind::tree_doc, "tests1.dat", {0});

  const DiffReport down = compute_diff(before, after, totals, false);
  expect(down.regression, "removal is a regression");
  expect(down.per_fixture.at(SuiteKind::tree_doc).size() == 1, "changed fixture listed");
  const std::string text = render_diff(down, "abc123", "data/allow.json");
  expect(text.rfind("Comparing allowlists: abc123 -> working tree (data/allow.json)\n", 0) == 0,
         "diff header");
  expect(contains(text, "  tests1.dat: 2/2 (100.0%) -> 1/2 (50.0%)  Δ-1  -50.0pp\n"), "fixture row");

  const DiffReport up = compute_diff(after, before, totals, false);
  expect(!up.regression, "addition is not a regression");
  const DiffReport same = compute_diff(before, before, totals, false);
  expect(same.per_fixture.at(SuiteKind::tree_doc).empty(), "unchanged fixtures hidden");
  expect(compute_diff(before, before, totals, true).per_fixture.at(SuiteKind::tree_doc).size() == 1,
         "show_all lists unchanged fixtures");
}

void test_bound_violations() {
  CorpusTotals totals;
  totals.tokenizer["a.test"] = 3;
  totals.tree["t.dat"] = TreeTotals{1, 0};
  AllowlistDocument doc;
  set_indices(doc, SuiteKind::tokenizer, "a.test", {0, 1, 2, 3, 4, 5});
  set_indices(doc, SuiteKind::tokenizer, "missing.test", {0});
  set_indices(doc, SuiteKind::tree_frag, "t.dat", {0});
  set_indices(doc, SuiteKind::tree_doc, "gone.dat", {});

  const auto v = check_coverage_bounds(doc, totals);
  expect(v.size() == 3, "three violations");
  expect(describe(v[0]) == "tree-frag t.dat: enabled 1 exceeds corpus total 0", "frag bound");
  expect(describe(v[1]) == "tokenizer a.test: enabled 6 exceeds corpus total 3", "count bound");
  expect(!v[2].total && v[2].fixture == "missing.test", "absent fixture");
}

void test_render_stats() {
  CorpusTotals totals;
  totals.tree["tests1.dat"] = TreeTotals{2, 1};
  totals.tokenizer["a.test"] = 4;
  AllowlistDocument doc;
  set_indices(doc, SuiteKind::tree_doc, "tests1.dat", {0, 1});
  set_indices(doc, SuiteKind::tokenizer, "a.test", {1});
  const std::string text = render_stats(doc, totals, std::nullopt);
  expect(text.rfind("Enabled totals:\n  tree-doc: 2\n  tree-frag: 0\n  tokenizer: 1\n", 0) == 0,
         "enabled totals block");
  expect(contains(text, "\nCoverage totals:\n  tree-doc: 2/2 (100.0%)\n"), "coverage totals");
  expect(contains(text, "tokenizer:\n  a.test: 1/4 (25.0%)\n"), "per fixture row");
  expect(!contains(text, "Fingerprints"), "no fingerprints unless asked");

  Fingerprints fp{"aa", "bb"};
  const std::string with_fp = render_stats(doc, totals, fp);
  expect(contains(with_fp, "\nFingerprints:\n  allowlist: blake3:aa\n  corpus: blake3:bb\n"), "fingerprints");
}

void test_baseline_without_history() {
  const HarnessConfig base = make_corpus("h5gate_baseline_test");
  HarnessConfig c = base;
  c.git_command = "false";
  AllowlistDocument current;
  set_indices(current, SuiteKind::tree_doc, "tests1.dat", {0});

  const AllowlistBaseline b = load_baseline(c, "HEAD", current);
  expect(!b.from_history, "no history");
  expect(b.warnings.size() == 2, "two warnings");
  expect(b.warnings[1] == "treating previous allowlists as current (no diff baseline available)",
         "fallback warning");

  auto totals = compute_corpus_totals(c);
  expect(totals.ok(), "totals");
  expect(!compute_diff(b.doc, current, totals.value, false).regression, "no regression against itself");
  fs::remove_all(c.repo_root);
}

void git_in(const HarnessConfig& c, std::vector<std::string> args) {
  ProcessSpec spec;
  spec.command = "git";
  spec.argv = {"-c", "user.name=h5gate", "-c", "user.email=h5gate@localhost",
               "-c", "commit.gpgsign=false"};
  spec.argv.insert(spec.argv.end(), args.begin(), args.end());
  spec.cwd = c.repo_root;
  const ProcessResult r = run_process(spec);
  expect(r.ok(), "git " + args[0] + ": " + r.stderr_text + r.error_message);
}

void test_baseline_from_history() {
  const HarnessConfig c = make_corpus("h5gate_history_test");
  git_in(c, {"init", "-q"});

  AllowlistDocument first;
  set_indices(first, SuiteKind::tree_doc, "tests1.dat", {0, 1, 2});
  expect(save_allowlist(first, c.allowlist_path).ok(), "first save");
  git_in(c, {"add", "data"});
  git_in(c, {"commit", "-q", "-m", "first"});

  AllowlistDocument second;
  set_indices(second, SuiteKind::tree_doc, "tests1.dat", {0});
  expect(save_allowlist(second, c.allowlist_path).ok(), "second save");
  git_in(c, {"commit", "-q", "-a", "-m", "second"});

  auto at_head = load_allowlist_from_git(c, "HEAD");
  expect(at_head.ok(), "HEAD snapshot: " + at_head.message());
  expect(get_indices(at_head.value, SuiteKind::tree_doc, "tests1.dat") == IndexList{0}, "HEAD indices");

  const AllowlistBaseline b = load_baseline(c, "HEAD~1", second);
  expect(b.from_history, "baseline read from history");
  expect(b.warnings.empty(), "no warnings");
  expect(get_indices(b.doc, SuiteKind::tree_doc, "tests1.dat") == IndexList({0, 1, 2}),
         "previous index set");
  const auto resolved = resolve_revision(c, "HEAD~1");
  expect(resolved.ok() && b.label == resolved.value && b.label.size() == 40, "label is the commit id");

  const AllowlistBaseline missing = load_baseline(c, "HEAD~5", second);
  expect(!missing.from_history, "unknown revision falls back");
  expect(missing.label == "HEAD~5", "label keeps the requested revision");
  expect(missing.warnings.size() == 2, "two warnings");
  expect(get_indices(missing.doc, SuiteKind::tree_doc, "tests1.dat") == IndexList{0},
         "current document is the baseline");
  fs::remove_all(c.repo_root);
}

// ============================================================================
// Phase 6: Subprocess engine and runner build
// ============================================================================

void test_run_process_pipes() {
  ProcessSpec spec;
  spec.command = "/bin/cat";
  spec.stdin_text = "hello";
  auto r = run_process(spec);
  expect(r.ok() && r.stdout_text == "hello", "stdin piped through cat");

  spec.stdin_text = std::string(1 << 20, 'x');
  r = run_process(spec);
  expect(r.ok() && r.stdout_text.size() == (1u << 20), "1MB through cat without deadlock");

  ProcessSpec sh;
  sh.command = "sh";
  sh.argv = {"-c", "echo err >&2; exit 7"};
  r = run_process(sh);
  expect(r.exit_code == 7 && r.stderr_text == "err\n", "exit status and stderr via PATH lookup");

  if (const char* path = std::getenv("PATH")) {
    ProcessSpec env;
    env.command = "/bin/sh";
    env.argv = {"-c", "printf %s \"$PATH\""};
    r = run_process(env);
    expect(r.ok() && r.stdout_text == path, "child inherits the environment");
  }
}

void test_subprocess_engine() {
  const fs::path root = fresh_dir("h5gate_subprocess_test");
  HarnessConfig c = config_for(root);
  const fs::path runner = c.runner_path;

  Batch batch;
  batch.mode = BatchMode::tree;
  batch.fixture = "tests1.dat";
  batch.items.push_back(make_tree_item(std::nullopt, std::nullopt, "<p>"));
  batch.items.push_back(make_tree_item(std::string("tr"), std::nullopt, "<td>"));

  SubprocessEngine missing(c);
  expect(missing.submit(batch).error_code == ErrorCode::runner_missing, "missing runner");
  expect(missing.submit(Batch{}).ok(), "empty batch never spawns");

  write_script(runner,
               "read count\n"
               "cat >/dev/null\n"
               "if [ \"$1\" != \"tree-batch\" ]; then echo \"bad mode $1\" >&2; exit 9; fi\n"
               "printf '['\n"
               "i=0\n"
               "while [ $i -lt $count ]; do\n"
               "  if [ $i -gt 0 ]; then printf ','; fi\n"
               "  printf '[\"| <html>\", 0]'\n"
               "  i=$((i+1))\n"
               "done\n"
               "printf ']\\n'\n");
  SubprocessEngine engine(c);
  auto ok = engine.submit(batch);
  expect(ok.ok(), "runner output accepted: " + ok.message());
  expect(ok.value.size() == 2, "count line read from stdin");
  expect(engine.last_request_bytes() == encode_request(batch).size(), "request size tracked");
  expect(engine.last_response_bytes() == std::string("[[\"| <html>\", 0],[\"| <html>\", 0]]\n").size(),
         "response size tracked");
  expect(engine.engine_id() == "subprocess:" + c.runner_path, "engine id names the runner");

  write_script(runner, "cat >/dev/null\necho boom >&2\nexit 3\n");
  auto bad_exit = engine.submit(batch);
  expect(bad_exit.error_code == ErrorCode::runner_exit_nonzero, "non-zero exit");
  expect(contains(bad_exit.detail, "status 3") && contains(bad_exit.detail, "boom"), "stderr tail");

  write_script(runner, "cat >/dev/null\necho '[]'\n");
  expect(engine.submit(batch).error_code == ErrorCode::runner_output_length, "wrong length");

  write_script(runner, "cat >/dev/null\necho nope\n");
  expect(engine.submit(batch).error_code == ErrorCode::runner_output_invalid, "non-JSON stdout");

  write_script(runner, "sleep 5\n");
  c.timeout_ms = 200;
  SubprocessEngine slow(c);
  expect(slow.submit(batch).error_code == ErrorCode::timeout, "timeout");
  fs::remove_all(root);
}

void test_ensure_runner_built() {
  const fs::path root = fresh_dir("h5gate_build_test");
  HarnessConfig c = config_for(root);
  c.build_command = {"/bin/sh", "-c", "echo '#!/bin/sh' > .build/runner && echo x >> builds.log"};
  write_file(root / "src" / "main.kk", "fun main() {}\n");

  auto first = ensure_runner_built(c, false);
  expect(first.ok() && first.value, "missing runner is built: " + first.message());
  expect(fs::exists(c.runner_path), "runner produced");

  auto fresh = ensure_runner_built(c, false);
  expect(fresh.ok() && !fresh.value, "fresh runner not rebuilt");

  auto forced = ensure_runner_built(c, true);
  expect(forced.ok() && forced.value, "force rebuilds");

  fs::last_write_time(root / "src" / "main.kk",
                      fs::last_write_time(c.runner_path) + std::chrono::seconds(10));
  auto stale = ensure_runner_built(c, false);
  expect(stale.ok() && stale.value, "newer source triggers rebuild");
  expect(read_file(root / "builds.log") == "x\nx\nx\n", "three builds ran");

  c.runner_path = (root / "other" / "runner").string();
  c.build_command = {"/bin/sh", "-c", "echo nope >&2; exit 2"};
  auto failed = ensure_runner_built(c, false);
  expect(failed.fatal() && failed.error_code == ErrorCode::build_failed, "build failure");
  expect(contains(failed.detail, "nope"), "build stderr in detail");
  fs::remove_all(root);
}

// ============================================================================
// Phase 7: Config, events, hashing, versions
// ============================================================================

void test_config() {
  expect(parse_timeout_seconds("2.5") == 2500, "fractional seconds");
  expect(parse_timeout_seconds("30") == 30000, "whole seconds");
  expect(parse_timeout_seconds("0") == 0, "zero invalid");
  expect(parse_timeout_seconds("abc") == 0, "text invalid");

  const fs::path root = fresh_dir("h5gate_config_test");
  HarnessConfig c = config_for(root);
  auto v = validate_config(c);
  expect(v.ok, "valid config");
  expect(v.warnings.size() == 1, "missing corpus warned");
  c.timeout_ms = 0;
  expect(!validate_config(c).ok, "zero timeout rejected");
  expect(c.allowlist_relpath() == "data/html5lib_allowlists.json", "relative allowlist path");
  fs::remove_all(root);
}

void test_event_log() {
  const fs::path root = fresh_dir("h5gate_events_test");
  const fs::path path = root / "events.jsonl";
  EventLog log(path.string());
  expect(log.enabled(), "enabled with a path");

  BatchEvent ok;
  ok.fixture = "a.test";
  ok.mode = "tokenizer-batch";
  ok.case_count = 3;
  ok.ok = true;
  log.emit(ok);
  BatchEvent bad = ok;
  bad.ok = false;
  bad.error_code = ErrorCode::timeout;
  log.emit(bad);

  const std::string text = read_file(path);
  std::size_t lines = 0;
  for (char ch : text) lines += ch == '\n' ? 1 : 0;
  expect(lines == 2, "one line per event");
  expect(contains(text, "\"error_code\":\"timeout\""), "error code recorded");
  expect(log.stats().batches() == 2 && log.stats().failed_batches() == 1, "stats folded");
  expect(log.stats().cases_submitted() == 6, "cases counted");
  expect(log.stats().summary_line().rfind("batches=2 failed=1 cases=6", 0) == 0, "summary line");

  EventLog quiet("");
  quiet.emit(ok);
  expect(!quiet.enabled() && quiet.stats().batches() == 1, "disabled log still counts");
  fs::remove_all(root);
}

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_fingerprint_domains() {
  expect(hash_domain("allowlist:", "x") != hash_domain("corpus:", "x"), "domains separate");
  expect(allowlist_fingerprint("{}") == hash_domain("allowlist:", "{}"), "allowlist domain");

  const HarnessConfig c = make_corpus("h5gate_fingerprint_test");
  const auto paths = discover_fixtures(c.tree_dir(), ".dat");
  const std::string fwd = corpus_fingerprint(c.corpus_root, paths);
  const std::string rev = corpus_fingerprint(c.corpus_root, {paths[1], paths[0]});
  expect(fwd == rev && fwd.size() == 64, "corpus fingerprint order independent");
  write_file(paths[0], std::string(kTreeFixture) + "\n");
  expect(corpus_fingerprint(c.corpus_root, paths) != fwd, "content change changes fingerprint");
  fs::remove_all(c.repo_root);
}

void test_version_manifest() {
  const std::string text = version::manifest_to_json(version::current_manifest());
  expect(contains(text, "\"allowlist_format\":1"), "allowlist format in manifest");
  expect(contains(text, "\"payload_line_width\":900"), "line width in manifest");
  expect(version::check_allowlist_version(1).ok, "version 1 accepted");
  expect(!version::check_allowlist_version(2).ok, "version 2 rejected");
}

// ============================================================================
// Phase 8: Runner against a fake engine
// ============================================================================

void test_run_tree_mismatch() {
  const HarnessConfig c = make_corpus("h5gate_run_tree_test");
  FakeEngine engine(tree_responder);
  EventLog events("");
  std::ostringstream out;
  std::ostringstream err;
  RunContext ctx{c, engine, &events, out, err};

  AllowlistDocument doc;
  set_indices(doc, SuiteKind::tree_doc, "tests1.dat", {0});
  set_indices(doc, SuiteKind::tree_frag, "tests1.dat", {0});
  const RunSummary s = run_allowlisted(ctx, doc);
  expect(s.cases_checked == 2, "two cases checked");
  expect(s.failures == std::vector<std::string>{"tree tests1.dat frag #0: tree mismatch"},
         "only the fragment fails");
  expect(engine.submitted().size() == 1, "one batch per fixture");
  expect(engine.submitted()[0].mode == BatchMode::tree, "tree mode");
  expect(engine.submitted()[0].items[1].fields == std::vector<std::string>{"frag", "tr", "on"},
         "fragment header");
  expect(events.stats().batches() == 1, "batch event recorded");
}

void test_batch_event_line() {
  const HarnessConfig c = make_corpus("h5gate_batch_event_test");
  const fs::path log_path = fs::path(c.repo_root) / "events.jsonl";
  FakeEngine engine(tree_responder);
  EventLog events(log_path.string());
  std::ostringstream out;
  std::ostringstream err;
  RunContext ctx{c, engine, &events, out, err};

  AllowlistDocument doc;
  set_indices(doc, SuiteKind::tree_doc, "tests1.dat", {0});
  run_allowlisted(ctx, doc);
  expect(engine.submitted().size() == 1, "one batch");

  const std::string request = encode_request(engine.submitted()[0]);
  const std::string line = read_file(log_path);
  expect(contains(line, "\"engine\":\"fake\""), "engine id in event");
  expect(contains(line, "\"bytes_in\":" + std::to_string(request.size()) + ","), "request size in event");
  expect(engine.last_response_bytes() > 0 &&
             contains(line, "\"bytes_out\":" + std::to_string(engine.last_response_bytes()) + "}"),
         "response size in event");
  fs::remove_all(c.repo_root);
}

void test_run_tokenizer() {
  const HarnessConfig c = make_corpus("h5gate_run_tok_test");
  FakeEngine engine([](const Batch& b) {
    jsonlite::Array out(b.items.size(), json(R"([["Character","&"]])"));
    return Outcome<jsonlite::Array>::success(std::move(out));
  });
  std::ostringstream out;
  std::ostringstream err;
  RunContext ctx{c, engine, nullptr, out, err};

  AllowlistDocument doc;
  set_indices(doc, SuiteKind::tokenizer, "a.test", {0, 2, 7});
  const RunSummary s = run_allowlisted(ctx, doc);
  expect(s.failures.size() == 2, "two failures");
  expect(s.failures[0] == "tokenizer a.test #7: index out of range (3 cases)", "out of range");
  expect(s.failures[1] == "tokenizer a.test #2: unsupported initial state", "unsupported");
  expect(engine.submitted()[0].items.size() == 1, "only supported case submitted");
}

void test_run_runner_failure() {
  const HarnessConfig c = make_corpus("h5gate_run_fail_test");
  FakeEngine engine([](const Batch&) {
    return Outcome<jsonlite::Array>::failure(ErrorCode::timeout, "runner exceeded 10 ms");
  });
  std::ostringstream out;
  std::ostringstream err;
  EventLog events("");
  RunContext ctx{c, engine, &events, out, err};

  AllowlistDocument doc;
  set_indices(doc, SuiteKind::tree_doc, "tests1.dat", {0});
  const RunSummary s = run_allowlisted(ctx, doc);
  expect(s.failures.size() == 1, "one failure for the batch");
  expect(s.failures[0] == "tree tests1.dat: runner failed: timeout: runner exceeded 10 ms",
         "batch failure message");
  expect(events.stats().failed_batches() == 1, "failed batch counted");
}

void test_auto_allowlist_tree() {
  const HarnessConfig c = make_corpus("h5gate_auto_tree_test");
  FakeEngine engine(tree_responder);
  std::ostringstream out;
  std::ostringstream err;
  RunContext ctx{c, engine, nullptr, out, err};

  AllowlistDocument doc;
  set_indices(doc, SuiteKind::tree_frag, "tests1.dat", {0});
  expect(auto_allowlist_tree(ctx, doc), "all fixtures evaluated");
  expect(out.str() == "tests1.dat: doc Δ+1 (now 1)  frag Δ-1 (now 0)\n", "delta line");
  expect(get_indices(doc, SuiteKind::tree_doc, "tests1.dat") == IndexList{0}, "doc passing set");
  expect(get_indices(doc, SuiteKind::tree_frag, "tests1.dat").empty(), "frag passing set");
  expect(engine.submitted().size() == 1, "scripted/ subdirectory not regenerated");
}

void test_auto_allowlist_tokenizer() {
  const HarnessConfig c = make_corpus("h5gate_auto_tok_test");
  FakeEngine engine([](const Batch& b) {
    jsonlite::Array out;
    for (const auto& item : b.items) {
      out.push_back(item.fields[0] == "Data" ? json(R"([["Character","&"]])")
                                             : json(R"([["Character","<a>"]])"));
    }
    return Outcome<jsonlite::Array>::success(std::move(out));
  });
  std::ostringstream out;
  std::ostringstream err;
  RunContext ctx{c, engine, nullptr, out, err};

  AllowlistDocument doc;
  expect(auto_allowlist_tokenizer(ctx, doc), "fixture evaluated");
  expect(get_indices(doc, SuiteKind::tokenizer, "a.test") == IndexList({0, 1}),
         "unsupported case excluded");
  expect(out.str() == "a.test: Δ+2 (now 2)\n", "delta line");
}

void test_report_tokenizer() {
  const HarnessConfig c = make_corpus("h5gate_report_tok_test");
  FakeEngine engine([](const Batch& b) {
    jsonlite::Array out;
    for (const auto& item : b.items) {
      out.push_back(item.fields[0] == "Data" ? json(R"([["Character","&"]])") : json("[]"));
    }
    return Outcome<jsonlite::Array>::success(std::move(out));
  });
  std::ostringstream out;
  std::ostringstream err;
  RunContext ctx{c, engine, nullptr, out, err};

  TokenizerReportOptions opts;
  opts.fixture = std::string("a.test");
  expect(report_tokenizer_failures(ctx, opts) == 1, "failures reported");
  expect(out.str() ==
             "a.test: 1/3 passing  (2 failing)\n\nFirst mismatches:\n"
             "  a.test #1 (RCDATA): mismatch\n  a.test #1 (RAWTEXT): mismatch\n",
         "report text");

  auto show = parse_tokenizer_show("a.test#1#RAWTEXT");
  expect(show.ok() && show.value.index == 1 && show.value.state == "RAWTEXT", "show parsed");
  expect(parse_tokenizer_show("a.test#x#Data").fatal(), "bad show index");
  std::ostringstream shown;
  RunContext show_ctx{c, engine, nullptr, shown, err};
  opts.show = show.value;
  expect(report_tokenizer_failures(show_ctx, opts) == 1, "show returns 1");
  expect(contains(shown.str(), "state: RAWTEXT\nlastStartTag: 'xmp'\ninput:\n<a>\n"), "show detail");
}

void test_report_tree_show() {
  const HarnessConfig c = make_corpus("h5gate_report_tree_test");
  FakeEngine engine(tree_responder);
  std::ostringstream out;
  std::ostringstream err;
  RunContext ctx{c, engine, nullptr, out, err};

  TreeReportOptions opts;
  opts.fixture = "tests1.dat";
  opts.fragment = true;
  opts.show = 0;
  expect(report_tree_failures(ctx, opts) == 1, "show returns 1");
  expect(contains(out.str(), "kind: frag\n"), "kind line");
  expect(contains(out.str(), "\ngot tree:\n| <wrong>\n"), "engine tree shown");
  expect(contains(out.str(), "\nexpected errors: 2\ngot errors: 2\n"), "error counts shown");

  std::ostringstream list;
  RunContext list_ctx{c, engine, nullptr, list, err};
  TreeReportOptions all;
  all.fixture = "tests1.dat";
  expect(report_tree_failures(list_ctx, all) == 0, "document cases all pass");
  all.fragment = true;
  expect(report_tree_failures(list_ctx, all) == 1, "fragment case fails");
  expect(list.str() == "tests1.dat frag #0: mismatch\n", "mismatch line");
}

void test_run_encoding() {
  const HarnessConfig c = make_corpus("h5gate_encoding_test");
  FakeEngine pass([](const Batch&) {
    return Outcome<jsonlite::Array>::success(
        jsonlite::Array{jsonlite::Value("UTF8"), jsonlite::Value("iso-8859-1")});
  });
  std::ostringstream out;
  std::ostringstream err;
  RunContext ctx{c, pass, nullptr, out, err};
  expect(run_encoding(ctx, {"tests1.dat"}) == 0, "aliases match");
  expect(out.str().empty(), "nothing printed on success");
  expect(pass.submitted()[0].items[0].fields == std::vector<std::string>{"-"}, "no transport hint");

  FakeEngine fail([](const Batch&) {
    return Outcome<jsonlite::Array>::success(
        jsonlite::Array{jsonlite::Value("utf-8"), jsonlite::Value("shift_jis")});
  });
  std::ostringstream fail_out;
  RunContext fail_ctx{c, fail, nullptr, fail_out, err};
  expect(run_encoding(fail_ctx, {"tests1.dat"}) == 1, "mismatch fails");
  expect(fail_out.str() == "tests1.dat case #1: expected='windows-1252' got='shift_jis'\n",
         "mismatch line");

  std::ostringstream missing_err;
  RunContext missing_ctx{c, pass, nullptr, out, missing_err};
  expect(run_encoding(missing_ctx, {"nope.dat"}) == 1, "missing fixture fails");
  expect(contains(missing_err.str(), "cannot open"), "missing fixture reported");
}

}  // namespace

int main() {
  std::cout << "h5gate test suite\n";

  std::cout << "\n[Phase 1] UTF-8, escapes, base64, JSON\n";
  run_test("forgiving_decoder", test_forgiving_decoder);
  run_test("forgiving_decoder_sequence_bounds", test_forgiving_decoder_sequence_bounds);
  run_test("surrogate_passthrough", test_surrogate_passthrough);
  run_test("decode_escapes", test_decode_escapes);
  run_test("base64", test_base64);
  run_test("json_strings_and_numbers", test_json_strings_and_numbers);
  run_test("json_duplicate_keys", test_json_duplicate_keys);
  run_test("json_pretty", test_json_pretty);

  std::cout << "\n[Phase 2] Corpus parsing\n";
  run_test("tree_blocks_split", test_tree_blocks_split);
  run_test("tree_fixture_parse", test_tree_fixture_parse);
  run_test("tree_document_block", test_tree_document_block);
  run_test("tree_numbering_per_kind", test_tree_numbering_per_kind);
  run_test("tree_missing_document_fatal", test_tree_missing_document_fatal);
  run_test("tree_crlf", test_tree_crlf);
  run_test("tokenizer_fixture_parse", test_tokenizer_fixture_parse);
  run_test("tokenizer_double_escaped", test_tokenizer_double_escaped);
  run_test("tokenizer_xml_violation", test_tokenizer_xml_violation);
  run_test("initial_state_mapping", test_initial_state_mapping);
  run_test("encoding_fixture_parse", test_encoding_fixture_parse);
  run_test("discovery", test_discovery);

  std::cout << "\n[Phase 3] Batch protocol\n";
  run_test("request_single_case", test_request_scenario_single_case);
  run_test("multi_state_judgement", test_multi_state_judgement);
  run_test("short_results_never_pass", test_short_results_never_pass);
  run_test("payload_chunking", test_payload_chunking);
  run_test("decode_response_errors", test_decode_response_errors);

  std::cout << "\n[Phase 4] Allowlist store\n";
  run_test("allowlist_validation", test_allowlist_validation);
  run_test("allowlist_serialization", test_allowlist_serialization);
  run_test("allowlist_atomic_save", test_allowlist_atomic_save);
  run_test("ranges", test_ranges);
  run_test("add_monotonic", test_add_monotonic);

  std::cout << "\n[Phase 5] Coverage statistics and diffs\n";
  run_test("corpus_totals", test_corpus_totals);
  run_test("percentages", test_percentages);
  run_test("diff_regression", test_diff_regression);
  run_test("bound_violations", test_bound_violations);
  run_test("render_stats", test_render_stats);
  run_test("baseline_without_history", test_baseline_without_history);
  run_test("baseline_from_history", test_baseline_from_history);

  std::cout << "\n[Phase 6] Subprocess engine and runner build\n";
  run_test("run_process_pipes", test_run_process_pipes);
  run_test("subprocess_engine", test_subprocess_engine);
  run_test("ensure_runner_built", test_ensure_runner_built);

  std::cout << "\n[Phase 7] Config, events, hashing, versions\n";
  run_test("config", test_config);
  run_test("event_log", test_event_log);
  run_test("blake3_known_vectors", test_blake3_known_vectors);
  run_test("fingerprint_domains", test_fingerprint_domains);
  run_test("version_manifest", test_version_manifest);

  std::cout << "\n[Phase 8] Runner against a fake engine\n";
  run_test("run_tree_mismatch", test_run_tree_mismatch);
  run_test("batch_event_line", test_batch_event_line);
  run_test("run_tokenizer", test_run_tokenizer);
  run_test("run_runner_failure", test_run_runner_failure);
  run_test("auto_allowlist_tree", test_auto_allowlist_tree);
  run_test("auto_allowlist_tokenizer", test_auto_allowlist_tokenizer);
  run_test("report_tokenizer", test_report_tokenizer);
  run_test("report_tree_show", test_report_tree_show);
  run_test("run_encoding", test_run_encoding);

  std::cout << "\n" << g_tests_passed << "/" << g_tests_run << " tests passed\n";
  return 0;
}
