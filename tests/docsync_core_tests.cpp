#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "docsync/adapters.hpp"
#include "docsync/chain.hpp"
#include "docsync/claims.hpp"
#include "docsync/commands.hpp"
#include "docsync/config.hpp"
#include "docsync/errors.hpp"
#include "docsync/evaluator.hpp"
#include "docsync/hash.hpp"
#include "docsync/jsonlite.hpp"
#include "docsync/manifest.hpp"
#include "docsync/observability.hpp"
#include "docsync/pack_codec.hpp"
#include "docsync/runner.hpp"
#include "docsync/types.hpp"
#include "docsync/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

std::mutex g_events_mu;
std::vector<docsync::LogEvent> g_events;

void capture_event(const docsync::LogEvent& ev) {
  std::lock_guard<std::mutex> lock(g_events_mu);
  g_events.push_back(ev);
}

void clear_events() {
  std::lock_guard<std::mutex> lock(g_events_mu);
  g_events.clear();
}

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

void write_text(const fs::path& path, const std::string& text) {
  fs::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << text;
}

// Small repository: one matching line in src/, a Python module and a doc.
fs::path make_fixture_repo(const std::string& name) {
  const fs::path root = fs::temp_directory_path() / name;
  fs::remove_all(root);
  write_text(root / "src" / "app.py", "import os\n\ndef helper():\n    return foo()\n");
  write_text(root / "src" / "engine.py", "class RunEngine:\n    pass\n");
  write_text(root / "docs" / "guide.md", "# Guide\n\nThe runner writes evidence packs.\n");
  write_text(root / "outside.txt", "foo in the wrong place\n");
  return root;
}

std::size_t replace_all(std::string& text, const std::string& from, const std::string& to) {
  std::size_t n = 0;
  for (std::size_t pos = text.find(from); pos != std::string::npos;
       pos = text.find(from, pos + to.size())) {
    text.replace(pos, from.size(), to);
    ++n;
  }
  return n;
}

std::size_t count_events(const std::string& message) {
  std::lock_guard<std::mutex> lock(g_events_mu);
  std::size_t n = 0;
  for (const auto& ev : g_events)
    if (ev.message == message) ++n;
  return n;
}

docsync::ClaimResult sample_result(const std::string& id, docsync::ClaimStatus status) {
  docsync::ClaimResult r;
  r.claim_id = id;
  r.claim_text = "claim " + id;
  r.status = status;
  r.evidence.emplace_back("code", "src/app.py", 4, "return foo()", true);
  r.message = "1/1 evidence found";
  return r;
}

std::shared_ptr<const docsync::EvidencePack> frozen_pack(std::vector<docsync::ClaimResult> results,
                                                         docsync::HashAlgorithm alg =
                                                             docsync::HashAlgorithm::sha256) {
  docsync::EvidencePack pack;
  pack.manifest_hash = docsync::hash_text(docsync::HashAlgorithm::sha256, "manifest");
  pack.runner = docsync::version::RUNNER_NAME;
  pack.runner_version = docsync::version::RUNNER_SEMVER;
  pack.timestamp = "2026-01-01T00:00:00+00:00";
  pack.results = std::move(results);
  return docsync::ChainBuilder(alg).freeze(std::move(pack));
}

// ============================================================================
// Phase 1: Hash authority
// ============================================================================

void test_sha256_known_vectors() {
  expect(docsync::sha256_hex("") ==
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
         "SHA-256 empty vector");
  expect(docsync::sha256_hex("abc") ==
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA-256 abc vector");
}

void test_blake3_known_vectors() {
  expect(docsync::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(docsync::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_prefixed_digests() {
  const auto d = docsync::hash_text(docsync::HashAlgorithm::sha256, "abc");
  expect(d == "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "sha256 digest must carry its prefix");
  expect(docsync::is_prefixed_digest(d), "prefixed digest recognized");
  expect(docsync::digest_algorithm(d) == docsync::HashAlgorithm::sha256, "prefix names algorithm");
  expect(!docsync::is_prefixed_digest("md5:abc"), "unknown prefix rejected");
  const auto b = docsync::hash_text(docsync::HashAlgorithm::blake3, "hello");
  expect(b.rfind("blake3:", 0) == 0, "blake3 prefix");
  expect(docsync::parse_hash_algorithm("blake3") == docsync::HashAlgorithm::blake3,
         "parse blake3");
  expect(!docsync::parse_hash_algorithm("md5").has_value(), "md5 is not supported");
}

void test_file_hashing() {
  const fs::path tmp = fs::temp_directory_path() / "docsync_hash_test";
  fs::create_directories(tmp);
  write_text(tmp / "f.txt", "abc");
  expect(docsync::hash_file((tmp / "f.txt").string(), docsync::HashAlgorithm::sha256) ==
             docsync::hash_text(docsync::HashAlgorithm::sha256, "abc"),
         "file digest equals text digest");
  expect(docsync::hash_file((tmp / "missing").string(), docsync::HashAlgorithm::sha256).empty(),
         "missing file hashes to empty");
  fs::remove_all(tmp);
}

// ============================================================================
// Phase 2: Canonical JSON and claim dicts
// ============================================================================

void test_json_canonicalization() {
  std::optional<docsync::jsonlite::JsonError> err;
  const auto canon = docsync::jsonlite::canonicalize_json(R"({"b":1, "a":"x"})", &err);
  expect(!err, "canonicalize valid JSON");
  expect(canon == R"({"a":"x","b":1})", "keys sorted, minimal separators");

  docsync::jsonlite::Object o;
  o["t"] = std::string("caf\xC3\xA9\n\"q\"");
  expect(docsync::jsonlite::to_json(docsync::jsonlite::Value{o}) ==
             R"({"t":"caf\u00e9\n\"q\""})",
         "non-ASCII escaped as \\u, controls as short escapes");
}

void test_json_strict_parser() {
  std::optional<docsync::jsonlite::JsonError> err;
  (void)docsync::jsonlite::parse_value(R"({"a":1,"a":2})", &err);
  expect(err.has_value(), "duplicate keys rejected");
  err.reset();
  (void)docsync::jsonlite::parse_value("[1,2] trailing", &err);
  expect(err.has_value(), "trailing data rejected");
  err.reset();
  (void)docsync::jsonlite::parse_value("{not-json", &err);
  expect(err.has_value(), "malformed object rejected");
  err.reset();
  const auto v = docsync::jsonlite::parse_value(R"(["x",null,true])", &err);
  expect(!err && v.is_array(), "valid array parses");
}

void test_claim_dict_shape() {
  const auto r = sample_result("A-001", docsync::ClaimStatus::pass);
  const std::string canon = docsync::canonical_claim_json(r);
  expect(canon ==
             R"json({"claim_id":"A-001","claim_text":"claim A-001","evidence":[{"line":4,"matched":true,"path":"src/app.py","snippet":"return foo()","source_type":"code"}],"message":"1/1 evidence found","status":"pass"})json",
         "canonical claim JSON shape");
  const auto back = docsync::decode_claim_result(docsync::claim_result_to_value(r));
  expect(back == r, "decoded claim equals original");
}

void test_claim_decoder_is_strict() {
  std::optional<docsync::jsonlite::JsonError> err;
  const auto bad_status = docsync::jsonlite::parse_value(
      R"({"claim_id":"A","claim_text":"t","status":"maybe","evidence":[],"message":""})", &err);
  bool threw = false;
  try {
    (void)docsync::decode_claim_result(bad_status);
  } catch (const docsync::StructuralDecodeError&) {
    threw = true;
  }
  expect(threw, "unknown status must be rejected");

  const auto bad_line = docsync::jsonlite::parse_value(
      R"({"claim_id":"A","claim_text":"t","status":"pass","evidence":[{"source_type":"code","path":"p","line":"4","snippet":"s","matched":true}],"message":""})",
      &err);
  threw = false;
  try {
    (void)docsync::decode_claim_result(bad_line);
  } catch (const docsync::StructuralDecodeError&) {
    threw = true;
  }
  expect(threw, "string line number must be rejected");

  const auto missing_id =
      docsync::jsonlite::parse_value(R"({"claim_text":"t","status":"pass"})", &err);
  threw = false;
  try {
    (void)docsync::decode_claim_result(missing_id);
  } catch (const docsync::StructuralDecodeError&) {
    threw = true;
  }
  expect(threw, "missing claim_id must be rejected");
}

void test_json_rejects_ambiguous_text() {
  std::optional<docsync::jsonlite::JsonError> err;
  for (const std::string text :
       {std::string(R"(["\ud800"])"), std::string(R"(["\udc00"])"),
        std::string(R"(["\ud800\u0041"])"), std::string("[\"\xff\"]"),
        std::string("[\"\xC3\"]"), std::string("[\"\xC0\xAF\"]")}) {
    err.reset();
    (void)docsync::jsonlite::parse_value(text, &err);
    expect(err.has_value(), "lone surrogate or invalid UTF-8 rejected: " + text);
  }

  err.reset();
  const auto pair = docsync::jsonlite::parse_value(R"(["\ud83d\ude00"])", &err);
  expect(!err, "surrogate pair accepted");
  expect(std::get<std::string>(std::get<docsync::jsonlite::Array>(pair.v)[0].v) ==
             "\xF0\x9F\x98\x80",
         "surrogate pair decoded");
  err.reset();
  (void)docsync::jsonlite::parse_value("[\"\xEF\xBF\xBD caf\xC3\xA9\"]", &err);
  expect(!err, "valid UTF-8 and a literal U+FFFD accepted");

  docsync::jsonlite::Object o;
  o["t"] = std::string("a\xFF" "b");
  const std::string pretty = docsync::jsonlite::to_json_pretty(docsync::jsonlite::Value{o});
  expect(pretty.find("a\\ufffdb") != std::string::npos, "invalid byte written as \\ufffd");
  err.reset();
  (void)docsync::jsonlite::parse_value(pretty, &err);
  expect(!err, "pretty output parses back");
}

void test_claim_decoder_rejects_extras() {
  const auto expect_rejected = [](const docsync::jsonlite::Value& v, const std::string& what) {
    bool threw = false;
    try {
      (void)docsync::decode_claim_result(v);
    } catch (const docsync::StructuralDecodeError&) {
      threw = true;
    }
    expect(threw, what);
  };
  std::optional<docsync::jsonlite::JsonError> err;
  expect_rejected(
      docsync::jsonlite::parse_value(
          R"({"claim_id":"A","claim_text":"t","status":"pass","evidence":[],"message":"","approved_by":"auditor"})",
          &err),
      "unknown claim key rejected");
  expect_rejected(
      docsync::jsonlite::parse_value(
          R"({"claim_id":"A","claim_text":"t","status":"pass","evidence":[{"source_type":"code","path":"p","line":1,"snippet":"s","matched":true,"reviewed":true}],"message":""})",
          &err),
      "unknown evidence key rejected");
  expect(!err, "fixtures parse");

  auto r = sample_result("A-001", docsync::ClaimStatus::pass);
  r.evidence[0].snippet = std::string(docsync::kMaxSnippetLength + 1, 'x');
  expect_rejected(docsync::claim_result_to_value(r), "over-long snippet rejected, not truncated");

  std::string accents;
  for (std::size_t i = 0; i < docsync::kMaxSnippetLength; ++i) accents += "\xC3\xA9";
  r.evidence[0].snippet = accents;
  expect(docsync::decode_claim_result(docsync::claim_result_to_value(r)) == r,
         "snippet at the limit counted in code points");
}

void test_snippet_truncation() {
  const std::string long_line(300, 'x');
  docsync::EvidenceRef ref("code", "a.py", 1, long_line, true);
  expect(ref.snippet.size() == docsync::kMaxSnippetLength, "snippet truncated to 120");

  std::string accents;
  for (int i = 0; i < 130; ++i) accents += "\xC3\xA9";
  const auto cut = docsync::truncate_utf8(accents, 120);
  expect(cut.size() == 240, "truncation counts code points, not bytes");
}

// ============================================================================
// Phase 3: Evidence adapters and claim evaluation
// ============================================================================

void test_end_to_end_pass() {
  const fs::path repo = make_fixture_repo("docsync_e2e_pass");
  auto evaluator = docsync::ClaimEvaluator::with_default_adapters(repo.string());

  docsync::ClaimEntry claim;
  claim.id = "A-001";
  claim.text = "helper delegates to foo";
  claim.evidence.push_back(docsync::EvidenceSpec{"code", "foo", "src/"});

  const auto r = evaluator.evaluate(claim);
  expect(r.status == docsync::ClaimStatus::pass, "claim must pass");
  expect(r.message == "1/1 evidence found", "pass message: " + r.message);
  expect(r.evidence.size() == 1, "exactly one ref");
  expect(r.evidence[0].matched, "ref matched");
  expect(r.evidence[0].line == 4, "1-based line number");
  expect(r.evidence[0].path == "src/app.py", "repo-relative path: " + r.evidence[0].path);
  expect(r.evidence[0].snippet == "return foo()", "trimmed snippet");
  fs::remove_all(repo);
}

void test_skip_and_fail() {
  const fs::path repo = make_fixture_repo("docsync_e2e_skip");
  auto evaluator = docsync::ClaimEvaluator::with_default_adapters(repo.string());

  docsync::ClaimEntry no_specs;
  no_specs.id = "A-002";
  no_specs.text = "untestable";
  const auto skipped = evaluator.evaluate(no_specs);
  expect(skipped.status == docsync::ClaimStatus::skip, "no specs -> skip");
  expect(skipped.message == docsync::kMessageNoSpecs, "skip message");

  docsync::ClaimEntry missing;
  missing.id = "A-003";
  missing.text = "mentions a symbol nobody wrote";
  missing.evidence.push_back(docsync::EvidenceSpec{"code", "definitely_absent_symbol", "src/"});
  const auto failed = evaluator.evaluate(missing);
  expect(failed.status == docsync::ClaimStatus::fail, "no match -> fail");
  expect(failed.message == docsync::kMessageNoMatch, "fail message");
  expect(failed.evidence.empty(), "fail carries no refs");
  fs::remove_all(repo);
}

void test_markdown_and_python_fallback() {
  const fs::path repo = make_fixture_repo("docsync_e2e_fallback");
  auto evaluator = docsync::ClaimEvaluator::with_default_adapters(repo.string());

  const auto md = evaluator.collect(docsync::EvidenceSpec{"markdown", "evidence packs", "docs"});
  expect(md.size() == 1 && md[0].source_type == "markdown", "markdown adapter finds the line");
  expect(md[0].line == 3, "markdown line number");

  // Pattern matches the class name only through the declaration fallback.
  const auto decl = evaluator.collect(docsync::EvidenceSpec{"code", "^RunEngine$", "src"});
  expect(decl.size() == 1, "declaration fallback finds the class");
  expect(decl[0].snippet == "def/class RunEngine", "fallback snippet");
  fs::remove_all(repo);
}

void test_scope_confinement() {
  const fs::path repo = make_fixture_repo("docsync_scope_test");
  clear_events();

  docsync::CodeAdapter adapter(repo / "src");
  const auto refs = adapter.search("foo", "../");
  expect(refs.empty(), "escaping scope yields no refs");
  {
    std::lock_guard<std::mutex> lock(g_events_mu);
    expect(g_events.size() == 1, "one warning for the rejected scope");
    expect(g_events[0].level == docsync::LogLevel::warning, "warning level");
    expect(g_events[0].stage == "evidence", "evidence stage");
  }
  expect(!docsync::resolve_scope(repo, "../..").has_value(), "parent traversal rejected");
  expect(docsync::resolve_scope(repo, "src").has_value(), "inner scope accepted");
  fs::remove_all(repo);
}

void test_pattern_compilation() {
  const auto literal = docsync::compile_pattern("foo(");
  expect(std::regex_search(std::string("call foo(x)"), literal), "invalid regex matched literally");
  const std::string huge(docsync::kMaxPatternLength + 50, 'a');
  const auto capped = docsync::compile_pattern(huge);
  expect(std::regex_search(std::string(docsync::kMaxPatternLength, 'a'), capped),
         "over-long pattern truncated");
  expect(docsync::regex_escape("a.b*c") == "a\\.b\\*c", "metacharacters escaped");
}

void test_overlong_lines_skipped() {
  const fs::path repo = fs::temp_directory_path() / "docsync_long_line_test";
  fs::remove_all(repo);
  write_text(repo / "src" / "bundle.js", std::string(200000, 'x') + " foo\nx marks foo\n");
  clear_events();

  docsync::CodeAdapter adapter(repo);
  const auto refs = adapter.search("x.*foo", "src/");
  expect(refs.size() == 1, "only the short line is matched");
  expect(refs[0].line == 2 && refs[0].snippet == "x marks foo", "short line located");
  expect(count_events("overlong lines skipped") == 1, "skipped line reported once per file");
  fs::remove_all(repo);
}

void test_parallel_evidence_keeps_order() {
  const fs::path repo = make_fixture_repo("docsync_parallel_test");
  auto evaluator = docsync::ClaimEvaluator::with_default_adapters(repo.string());

  docsync::ClaimEntry claim;
  claim.id = "A-010";
  claim.text = "several specs";
  claim.evidence.push_back(docsync::EvidenceSpec{"markdown", "Guide", ""});
  claim.evidence.push_back(docsync::EvidenceSpec{"code", "import", ""});
  claim.evidence.push_back(docsync::EvidenceSpec{"code", "nothing_matches_this", ""});

  const auto serial = evaluator.evaluate(claim);
  evaluator.set_parallel_evidence(true);
  const auto parallel = evaluator.evaluate(claim);
  expect(serial == parallel, "parallel evidence yields the same result");
  expect(serial.evidence.size() == 2, "two refs collected");
  expect(serial.evidence[0].source_type == "markdown", "spec order preserved");
  expect(serial.message == "2/2 evidence found", "aggregate message");
  fs::remove_all(repo);
}

// ============================================================================
// Phase 4: Hash chain
// ============================================================================

void test_chain_two_links() {
  const auto pack = frozen_pack({sample_result("A-001", docsync::ClaimStatus::pass),
                                 sample_result("A-002", docsync::ClaimStatus::fail)});
  expect(pack->chain.size() == 2, "two links");
  expect(pack->chain[0].previous_hash == docsync::version::GENESIS_SENTINEL, "genesis sentinel");
  expect(pack->chain[1].previous_hash == pack->chain[0].chain_hash, "links are chained");
  expect(pack->chain[0].item_id == "claim-0" && pack->chain[1].sequence == 1, "link metadata");
  expect(pack->root_hash ==
             docsync::hash_text(docsync::HashAlgorithm::sha256,
                                pack->chain[0].chain_hash + pack->chain[1].chain_hash),
         "root over concatenated links");
  expect(pack->chain[0].content_hash ==
             docsync::hash_text(docsync::HashAlgorithm::sha256,
                                docsync::canonical_claim_json(pack->results[0])),
         "content hash over canonical JSON");
  const auto v = docsync::ChainBuilder::verify(*pack);
  expect(v.ok && v.reason == "ok", "fresh pack verifies");
}

void test_chain_empty_pack() {
  const auto pack = frozen_pack({});
  expect(pack->chain.empty(), "empty chain");
  expect(pack->root_hash == docsync::hash_text(docsync::HashAlgorithm::sha256, ""), "root of nothing");
  expect(docsync::ChainBuilder::verify(*pack).ok, "empty pack verifies");
}

void test_chain_tamper_detection() {
  const auto pack = frozen_pack({sample_result("A-001", docsync::ClaimStatus::pass),
                                 sample_result("A-002", docsync::ClaimStatus::pass),
                                 sample_result("A-003", docsync::ClaimStatus::fail)});

  docsync::EvidencePack link_edit = *pack;
  link_edit.chain[1].chain_hash.back() = link_edit.chain[1].chain_hash.back() == '0' ? '1' : '0';
  auto v = docsync::ChainBuilder::verify(link_edit);
  expect(!v.ok && v.index == 1u, "edited chain hash detected at index 1");
  expect(v.reason.rfind("hash mismatch at index 1: expected ", 0) == 0, "reason: " + v.reason);

  docsync::EvidencePack content_edit = *pack;
  content_edit.results[2].status = docsync::ClaimStatus::pass;
  v = docsync::ChainBuilder::verify(content_edit);
  expect(!v.ok && v.index == 2u, "edited result detected at index 2");

  docsync::EvidencePack reordered = *pack;
  std::swap(reordered.results[0], reordered.results[1]);
  v = docsync::ChainBuilder::verify(reordered);
  expect(!v.ok && v.index == 0u, "reorder detected at first divergent index");

  docsync::EvidencePack root_edit = *pack;
  root_edit.root_hash.back() = root_edit.root_hash.back() == 'a' ? 'b' : 'a';
  v = docsync::ChainBuilder::verify(root_edit);
  expect(!v.ok && v.reason.rfind("root hash mismatch", 0) == 0, "root edit detected");

  docsync::EvidencePack truncated = *pack;
  truncated.results.pop_back();
  v = docsync::ChainBuilder::verify(truncated);
  expect(!v.ok && v.reason == "chain length (3) != results length (2)", "length mismatch reason");

  docsync::EvidencePack blank_root = *pack;
  blank_root.root_hash.clear();
  v = docsync::ChainBuilder::verify(blank_root);
  expect(!v.ok && v.reason.rfind("root hash missing", 0) == 0, "blank root hash rejected");

  bool threw = false;
  try {
    docsync::ChainBuilder::require_verified(link_edit);
  } catch (const docsync::ChainIntegrityError& e) {
    threw = e.index() == 1 && !e.expected().empty();
  }
  expect(threw, "require_verified raises ChainIntegrityError with index");
}

void test_chain_determinism() {
  const std::vector<docsync::ClaimResult> results = {
      sample_result("A-001", docsync::ClaimStatus::pass),
      sample_result("A-002", docsync::ClaimStatus::skip)};
  const auto a = docsync::ChainBuilder().build(results);
  const auto b = docsync::ChainBuilder().build(results);
  expect(a.chain == b.chain && a.root_hash == b.root_hash, "build is deterministic");
  const auto c = docsync::ChainBuilder(docsync::HashAlgorithm::blake3).build(results);
  expect(c.root_hash.rfind("blake3:", 0) == 0, "blake3 chain uses blake3 digests");
  expect(c.root_hash != a.root_hash, "algorithms produce distinct roots");
}

void test_freeze_twice_rejected() {
  const auto pack = frozen_pack({sample_result("A-001", docsync::ClaimStatus::pass)});
  bool threw = false;
  try {
    (void)docsync::ChainBuilder().freeze(*pack);
  } catch (const std::logic_error&) {
    threw = true;
  }
  expect(threw, "re-freezing a frozen pack is a logic error");
}

// ============================================================================
// Phase 5: Pack codec
// ============================================================================

void test_codec_round_trip() {
  const auto pack = frozen_pack({sample_result("A-001", docsync::ClaimStatus::pass),
                                 sample_result("A-002", docsync::ClaimStatus::fail)},
                                docsync::HashAlgorithm::blake3);
  const std::string text = docsync::serialize_pack(*pack);
  expect(!text.empty() && text.back() == '\n', "serialized pack is newline-terminated");

  const auto root = docsync::jsonlite::parse(text, nullptr);
  expect(docsync::jsonlite::get_string(root, "version") == docsync::version::PACK_FORMAT_VERSION,
         "unsanitized pack tagged 0.2.0");

  const auto back = docsync::deserialize_pack(text);
  expect(back.results == pack->results, "results survive");
  expect(back.chain == pack->chain && back.root_hash == pack->root_hash, "proof survives");
  expect(back.hash_algorithm == docsync::HashAlgorithm::blake3, "pinned algorithm survives");
  expect(back.chain_algorithm_version == docsync::version::CHAIN_ALGORITHM_VERSION,
         "pinned chain version survives");
  expect(docsync::ChainBuilder::verify(back).ok, "decoded pack verifies");
}

void test_codec_items_only() {
  const auto pack = frozen_pack({sample_result("A-001", docsync::ClaimStatus::pass)});
  auto value = docsync::pack_to_value(*pack);
  auto& root = std::get<docsync::jsonlite::Object>(value.v);
  root.erase("results");
  root.erase("hash_chain");
  const auto back = docsync::pack_from_value(value);
  expect(back.results == pack->results, "results rebuilt from per-item content");
  expect(back.hash_chain.size() == 1, "flat view derived from proof");
  expect(docsync::ChainBuilder::verify(back).ok, "items-only pack verifies");
}

void test_codec_legacy_pack() {
  const auto r = sample_result("A-001", docsync::ClaimStatus::pass);
  const std::string manifest_hash = docsync::hash_text(docsync::HashAlgorithm::sha256, "m");
  const auto legacy = docsync::ChainBuilder::legacy_chain(manifest_hash, {r});

  docsync::jsonlite::Object root;
  root["manifest_hash"] = manifest_hash;
  root["runner"] = "rlm-docsync";
  root["timestamp"] = "2025-06-01T00:00:00+00:00";
  root["results"] = docsync::jsonlite::Array{docsync::claim_result_to_value(r)};
  root["hash_chain"] = docsync::jsonlite::Array{docsync::jsonlite::Value{legacy[0]}};

  const auto pack = docsync::pack_from_value(docsync::jsonlite::Value{root});
  expect(pack.chain_algorithm_version == docsync::version::LEGACY_CHAIN_ALGORITHM_VERSION,
         "flat pack pinned to legacy algorithm");
  expect(pack.runner_version == "0.1.0", "legacy runner_version default");
  expect(docsync::ChainBuilder::verify(pack).ok, "legacy pack verifies");

  auto tampered = pack;
  tampered.results[0].message = "edited";
  expect(!docsync::ChainBuilder::verify(tampered).ok, "legacy tamper detected");
}

void test_codec_rejections() {
  const auto expect_decode_error = [](const std::string& text, const std::string& what) {
    bool threw = false;
    try {
      (void)docsync::deserialize_pack(text);
    } catch (const docsync::StructuralDecodeError&) {
      threw = true;
    }
    expect(threw, what);
  };
  expect_decode_error("{not-json", "non-JSON pack rejected");
  expect_decode_error("[]", "non-object root rejected");
  expect_decode_error(R"({"manifest_hash":"x","version":"0.2.0","results":[]})",
                      "version without proof rejected");
  expect_decode_error(R"({"manifest_hash":"x","version":"9.9.9","immutability_proof":{"hash_chain":[]}})",
                      "unknown envelope version rejected");
  expect_decode_error(
      R"({"manifest_hash":"x","version":"0.2.0","immutability_proof":{"hash_chain":[],"chain_algorithm_version":7}})",
      "unsupported chain algorithm rejected");
  expect_decode_error(
      R"({"manifest_hash":"x","version":"0.2.0","immutability_proof":{"hash_chain":[],"hash_algorithm":"md5"}})",
      "unknown hash algorithm rejected");
  expect_decode_error(R"({"manifest_hash":"x","results":[{"claim_id":1}]})",
                      "malformed claim dict rejected");
  expect_decode_error(R"({"results":[]})", "missing manifest_hash rejected");
}

// Every case edits the serialized envelope and reloads it, the way the verify
// command reads a pack from disk.
void test_codec_text_tamper() {
  auto long_snippet = sample_result("A-001", docsync::ClaimStatus::pass);
  long_snippet.evidence[0] = docsync::EvidenceRef("code", "src/app.py", 4, std::string(130, 'x'), true);
  const auto pack = frozen_pack({long_snippet, sample_result("A-002", docsync::ClaimStatus::fail)});
  const std::string text = docsync::serialize_pack(*pack);
  expect(docsync::ChainBuilder::verify(docsync::deserialize_pack(text)).ok, "untouched text verifies");

  const auto expect_rejected = [](const std::string& edited, const std::string& what) {
    bool rejected = false;
    try {
      rejected = !docsync::ChainBuilder::verify(docsync::deserialize_pack(edited)).ok;
    } catch (const docsync::StructuralDecodeError&) {
      rejected = true;
    }
    expect(rejected, what);
  };

  const std::string full = "\"" + std::string(docsync::kMaxSnippetLength, 'x') + "\"";
  std::string appended = text;
  expect(replace_all(appended, full, full.substr(0, full.size() - 1) + " INJECTED\"") == 2,
         "snippet present in both views");
  expect_rejected(appended, "text appended to a full-length snippet");

  std::string extra_key = text;
  expect(replace_all(extra_key, "\"claim_id\": \"A-001\"",
                     "\"approved_by\": \"auditor\", \"claim_id\": \"A-001\"") == 2,
         "claim present in both views");
  expect_rejected(extra_key, "unknown key inserted into a claim");

  const auto edit_item = [&](const std::string& key, const docsync::jsonlite::Value& replacement) {
    auto value = docsync::pack_to_value(*pack);
    auto& items = std::get<docsync::jsonlite::Array>(
        std::get<docsync::jsonlite::Object>(value.v)["items"].v);
    auto& item = std::get<docsync::jsonlite::Object>(items[0].v);
    if (key == "claim_text") {
      std::get<docsync::jsonlite::Object>(item["content"].v)["claim_text"] = replacement;
    } else {
      item[key] = replacement;
    }
    return docsync::jsonlite::to_json_pretty(value);
  };
  expect_rejected(edit_item("claim_text", "FORGED"), "item content diverging from results");
  expect_rejected(edit_item("content_hash", pack->chain[1].content_hash),
                  "item content_hash diverging from the proof");
  expect_rejected(edit_item("item_id", "claim-7"), "item id diverging from the proof");
  expect_rejected(edit_item("sequence", static_cast<uint64_t>(3)),
                  "item sequence diverging from the proof");

  std::string blank_root = text;
  expect(replace_all(blank_root, "\"root_hash\": \"" + pack->root_hash + "\"",
                     "\"root_hash\": \"\"") == 1,
         "root hash present once");
  const auto v = docsync::ChainBuilder::verify(docsync::deserialize_pack(blank_root));
  expect(!v.ok && v.reason.rfind("root hash missing", 0) == 0, "blanked root hash: " + v.reason);
}

void test_codec_files() {
  const fs::path tmp = fs::temp_directory_path() / "docsync_codec_files";
  fs::remove_all(tmp);
  fs::create_directories(tmp);
  const auto pack = frozen_pack({sample_result("A-001", docsync::ClaimStatus::pass)});
  const std::string path = (tmp / "evidence-pack-0.json").string();
  docsync::write_pack_file(path, *pack);
  expect(!fs::exists(path + ".tmp"), "no temp file left behind");
  const auto back = docsync::load_pack_file(path);
  expect(docsync::ChainBuilder::verify(back).ok, "written pack verifies");

  bool not_found = false;
  try {
    (void)docsync::load_pack_file((tmp / "missing.json").string());
  } catch (const docsync::IoError& e) {
    not_found = e.code() == docsync::ErrorCode::pack_not_found;
  }
  expect(not_found, "missing pack reports pack_not_found");

  bool unfrozen = false;
  try {
    (void)docsync::serialize_pack(docsync::EvidencePack{});
  } catch (const std::logic_error&) {
    unfrozen = true;
  }
  expect(unfrozen, "serializing an unfrozen pack is a logic error");
  fs::remove_all(tmp);
}

void test_verify_command_streams() {
  const fs::path tmp = fs::temp_directory_path() / "docsync_verify_command";
  fs::remove_all(tmp);
  fs::create_directories(tmp);
  const auto pack = frozen_pack({sample_result("A-001", docsync::ClaimStatus::pass)});
  const std::string good = (tmp / "good.json").string();
  docsync::write_pack_file(good, *pack);

  std::ostringstream out;
  std::ostringstream err;
  expect(docsync::verify_command(good, out, err) == 0, "intact pack exits 0");
  expect(out.str() == "VERIFIED: ok\n  1 claims, chain intact\n", "report: " + out.str());
  expect(err.str().empty(), "nothing on stderr for an intact pack");

  std::string text = docsync::serialize_pack(*pack);
  expect(replace_all(text, "\"root_hash\": \"" + pack->root_hash + "\"", "\"root_hash\": \"\"") == 1,
         "root hash present once");
  const std::string edited = (tmp / "edited.json").string();
  write_text(edited, text);
  out.str("");
  err.str("");
  expect(docsync::verify_command(edited, out, err) == 1, "edited pack exits 1");
  expect(out.str().empty(), "failure not reported on stdout");
  expect(err.str().rfind("FAILED: root hash missing", 0) == 0, "failure on stderr: " + err.str());

  out.str("");
  err.str("");
  expect(docsync::verify_command((tmp / "missing.json").string(), out, err) == 1,
         "missing pack exits 1");
  expect(out.str().empty() && err.str().rfind("FAILED: pack not found", 0) == 0,
         "missing pack reported on stderr");
  fs::remove_all(tmp);
}

// ============================================================================
// Phase 6: Manifest
// ============================================================================

void test_manifest_defaults() {
  const auto m = docsync::parse_manifest(
      R"({"docs":[{"path":"docs/api.md","claims":[{"id":"A-001","text":"t","evidence":[{"pattern":"foo"}]}]}]})");
  expect(m.version == "1.0", "version defaults to 1.0");
  expect(m.docs[0].mode == "spec-first", "mode defaults to spec-first");
  expect(m.docs[0].claims[0].evidence[0].type == "code", "evidence type defaults to code");
  expect(m.docs[0].claims[0].evidence[0].scope.empty(), "scope defaults to whole repo");
}

void test_manifest_validation_collects_errors() {
  std::vector<std::string> errors;
  try {
    (void)docsync::parse_manifest(
        R"({"version":"1.0","docs":[{"path":"a.md","mode":"sideways","claims":[{"id":"X","text":"t"},{"id":"X","text":""},{"id":"Y","text":"t","evidence":[{"type":"binary","pattern":"p"}]}]}]})");
  } catch (const docsync::ValidationError& e) {
    errors = e.errors();
  }
  const auto has = [&](const std::string& needle) {
    for (const auto& e : errors)
      if (e == needle) return true;
    return false;
  };
  expect(errors.size() == 4, "all four problems reported, got " + std::to_string(errors.size()));
  expect(has("duplicate claim id: X"), "duplicate id");
  expect(has("doc 'a.md': claim 'X' missing 'text'"), "missing text");
  expect(has("claim 'Y': unknown evidence type 'binary'"), "unknown evidence type");

  bool empty_docs = false;
  try {
    (void)docsync::parse_manifest(R"({"version":"1.0","docs":[]})");
  } catch (const docsync::ValidationError& e) {
    empty_docs = e.errors().size() == 1 &&
                 e.errors()[0] == "manifest.docs must contain at least one entry";
  }
  expect(empty_docs, "empty docs rejected");

  bool not_found = false;
  try {
    (void)docsync::load_manifest_file("/nonexistent/docsync/manifest.json");
  } catch (const docsync::ValidationError& e) {
    not_found = e.code() == docsync::ErrorCode::manifest_not_found;
  }
  expect(not_found, "missing manifest reports manifest_not_found");
}

// ============================================================================
// Phase 7: Runner and configuration
// ============================================================================

void test_runner_end_to_end() {
  const fs::path repo = make_fixture_repo("docsync_runner_test");
  const std::string manifest_text =
      R"({"version":"1.0","docs":[)"
      R"({"path":"docs/a.md","claims":[{"id":"A-001","text":"uses foo","evidence":[{"type":"code","pattern":"foo","scope":"src/"}]}]},)"
      R"({"path":"docs/b.md","claims":[{"id":"B-001","text":"nothing","evidence":[{"pattern":"zzz_absent","scope":"src/"}]},{"id":"B-002","text":"untested"}]},)"
      R"({"path":"docs/c.md","claims":[]}]})";
  const auto manifest = docsync::parse_manifest(manifest_text);

  docsync::RunnerConfig config;
  config.repo_root = repo.string();
  config.max_workers = 3;
  docsync::NightlyRunner runner(config);
  const auto outcomes = runner.run(manifest, manifest_text);

  expect(outcomes.size() == 3, "one outcome per document");
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    expect(outcomes[i].doc_index == i, "outcomes in manifest order");
    expect(outcomes[i].ok(), "every document produced a pack");
    expect(docsync::ChainBuilder::verify(*outcomes[i].pack).ok, "every pack verifies");
    expect(!outcomes[i].pack->sanitization.has_value(), "no summary without a capability");
    expect(outcomes[i].pack->manifest_hash ==
               docsync::hash_text(docsync::HashAlgorithm::sha256, manifest_text),
           "manifest hash over manifest text");
  }
  expect(outcomes[0].pack->results[0].status == docsync::ClaimStatus::pass, "A-001 passes");
  expect(outcomes[1].pack->results[0].status == docsync::ClaimStatus::fail, "B-001 fails");
  expect(outcomes[1].pack->results[1].status == docsync::ClaimStatus::skip, "B-002 skipped");
  expect(outcomes[2].pack->results.empty(), "empty document yields empty pack");

  const auto& stats = runner.stats();
  expect(stats.documents_processed.load() == 3, "documents counted");
  expect(stats.claims_pass.load() == 1 && stats.claims_fail.load() == 1 &&
             stats.claims_skip.load() == 1,
         "claims counted by status");
  fs::remove_all(repo);
}

void test_runner_deterministic_chain() {
  const fs::path repo = make_fixture_repo("docsync_runner_determinism");
  const std::string manifest_text =
      R"({"docs":[{"path":"d.md","claims":[{"id":"A-001","text":"t","evidence":[{"pattern":"foo"}]},{"id":"A-002","text":"u","evidence":[{"pattern":"import"}]}]}]})";
  const auto manifest = docsync::parse_manifest(manifest_text);
  docsync::RunnerConfig config;
  config.repo_root = repo.string();
  docsync::NightlyRunner first(config);
  docsync::NightlyRunner second(config);
  const auto a = first.run(manifest, manifest_text);
  const auto b = second.run(manifest, manifest_text);
  expect(a[0].pack->root_hash == b[0].pack->root_hash, "same tree and manifest, same root");
  fs::remove_all(repo);
}

void test_config_from_env() {
  ::setenv("DOCSYNC_PII_SHIELD_ENDPOINT", "http://127.0.0.1:9/v1/sanitize", 1);
  ::setenv("DOCSYNC_PII_SHIELD_TIMEOUT_MS", "250", 1);
  ::setenv("DOCSYNC_PII_SHIELD_FAIL_CLOSED", "yes", 1);
  ::setenv("DOCSYNC_HASH_ALGORITHM", "blake3", 1);
  ::setenv("DOCSYNC_MAX_WORKERS", "not-a-number", 1);

  docsync::RunnerConfig config;
  const auto problems = docsync::apply_env(config);
  expect(config.sanitizer.endpoint == "http://127.0.0.1:9/v1/sanitize", "endpoint from env");
  expect(config.sanitizer.timeout_ms == 250, "timeout from env");
  expect(config.sanitizer.fail_closed, "fail-closed from env");
  expect(config.hash_algorithm == docsync::HashAlgorithm::blake3, "hash algorithm from env");
  expect(config.max_workers == 4, "malformed worker count keeps default");
  expect(problems.size() == 1, "malformed value reported");
  expect(config.sanitizer.enabled(), "endpoint enables sanitization");

  ::unsetenv("DOCSYNC_PII_SHIELD_ENDPOINT");
  ::unsetenv("DOCSYNC_PII_SHIELD_TIMEOUT_MS");
  ::unsetenv("DOCSYNC_PII_SHIELD_FAIL_CLOSED");
  ::unsetenv("DOCSYNC_HASH_ALGORITHM");
  ::unsetenv("DOCSYNC_MAX_WORKERS");

  expect(docsync::parse_bool_flag("ON") && docsync::parse_bool_flag("1"), "truthy flags");
  expect(!docsync::parse_bool_flag("0") && !docsync::parse_bool_flag(""), "falsy flags");
}

void test_version_manifest_contract() {
  const auto m = docsync::version::current_manifest();
  expect(m.chain_algorithm == 2, "current chain algorithm is 2");
  expect(m.default_hash_primitive == "sha256", "default primitive");
  expect(docsync::version::supports_chain_algorithm(1), "legacy algorithm verifiable");
  expect(!docsync::version::supports_chain_algorithm(3), "future algorithm unsupported");
  const auto root = docsync::jsonlite::parse(docsync::version::manifest_to_json(m), nullptr);
  expect(docsync::jsonlite::get_string(root, "runner") == docsync::version::RUNNER_NAME,
         "manifest JSON names the runner");
}

}  // namespace

int main() {
  std::cout << "=== docsync Core Test Suite ===\n";
  docsync::set_log_event_hook(capture_event);

  std::cout << "\n[Phase 1] Hash authority\n";
  run_test("SHA-256 known vectors", test_sha256_known_vectors);
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("prefixed digests", test_prefixed_digests);
  run_test("file hashing", test_file_hashing);

  std::cout << "\n[Phase 2] Canonical JSON and claim dicts\n";
  run_test("JSON canonicalization", test_json_canonicalization);
  run_test("strict JSON parser", test_json_strict_parser);
  run_test("claim dict shape", test_claim_dict_shape);
  run_test("strict claim decoder", test_claim_decoder_is_strict);
  run_test("claim decoder rejects extras", test_claim_decoder_rejects_extras);
  run_test("strict parser rejects lone surrogates and bad UTF-8", test_json_rejects_ambiguous_text);
  run_test("snippet truncation", test_snippet_truncation);

  std::cout << "\n[Phase 3] Evidence adapters and evaluation\n";
  run_test("end-to-end pass (A-001)", test_end_to_end_pass);
  run_test("skip and fail verdicts", test_skip_and_fail);
  run_test("markdown + declaration fallback", test_markdown_and_python_fallback);
  run_test("scope confinement", test_scope_confinement);
  run_test("pattern compilation", test_pattern_compilation);
  run_test("overlong lines skipped", test_overlong_lines_skipped);
  run_test("parallel evidence keeps order", test_parallel_evidence_keeps_order);

  std::cout << "\n[Phase 4] Hash chain\n";
  run_test("two-link chain", test_chain_two_links);
  run_test("empty pack", test_chain_empty_pack);
  run_test("tamper detection", test_chain_tamper_detection);
  run_test("build determinism", test_chain_determinism);
  run_test("freeze twice rejected", test_freeze_twice_rejected);

  std::cout << "\n[Phase 5] Pack codec\n";
  run_test("envelope round trip", test_codec_round_trip);
  run_test("items-only envelope", test_codec_items_only);
  run_test("legacy flat pack", test_codec_legacy_pack);
  run_test("malformed packs rejected", test_codec_rejections);
  run_test("edited envelope text rejected", test_codec_text_tamper);
  run_test("pack files", test_codec_files);
  run_test("verify command output streams", test_verify_command_streams);

  std::cout << "\n[Phase 6] Manifest\n";
  run_test("manifest defaults", test_manifest_defaults);
  run_test("validation collects every error", test_manifest_validation_collects_errors);

  std::cout << "\n[Phase 7] Runner and configuration\n";
  run_test("runner end to end", test_runner_end_to_end);
  run_test("runner determinism", test_runner_deterministic_chain);
  run_test("configuration from environment", test_config_from_env);
  run_test("version manifest contract", test_version_manifest_contract);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
