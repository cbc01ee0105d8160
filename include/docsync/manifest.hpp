#pragma once

// docsync/manifest.hpp — Documentation manifest model, loader and validator.
//
// FORMAT (JSON):
//   {"version": "1.0",
//    "docs": [{"path": "docs/api.md", "mode": "spec-first",
//              "claims": [{"id": "A-001", "text": "...",
//                          "evidence": [{"type": "code", "pattern": "foo",
//                                        "scope": "src/"}]}]}]}
//
// Defaults: version "1.0", mode "spec-first", evidence type "code",
// scope "" (whole repository).
//
// Validation collects every problem before failing so one run reports all of
// them. A manifest that fails validation never produces a pack.

#include <string>
#include <vector>

#include "docsync/jsonlite.hpp"

namespace docsync {

struct EvidenceSpec {
  std::string type{"code"};  // "code" | "markdown"
  std::string pattern;       // regex, or literal if not a valid regex
  std::string scope;         // repo-relative directory or file, "" = whole repo
};

struct ClaimEntry {
  std::string id;
  std::string text;
  std::vector<EvidenceSpec> evidence;
};

struct DocEntry {
  std::string path;
  std::string mode{"spec-first"};  // "spec-first" | "reality-first"
  std::vector<ClaimEntry> claims;
};

struct DocManifest {
  std::string version{"1.0"};
  std::vector<DocEntry> docs;
};

// Build a manifest from a parsed JSON object. Shape errors (wrong JSON types)
// are appended to *errors; the affected entries are skipped.
DocManifest manifest_from_value(const jsonlite::Object& root, std::vector<std::string>* errors);

// Semantic checks. Returns an empty list when the manifest is valid.
std::vector<std::string> validate_manifest(const DocManifest& manifest);

// Parse and validate manifest text. Throws ValidationError carrying every
// message.
DocManifest parse_manifest(const std::string& text);

// Load from a file. Throws ValidationError with code manifest_not_found when
// the file is missing or unreadable.
DocManifest load_manifest_file(const std::string& path, std::string* raw_text = nullptr);

}  // namespace docsync
