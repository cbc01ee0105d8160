#pragma once

// docsync/adapters.hpp — Read-only evidence search adapters.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. READ-ONLY: adapters never create, modify or delete files.
//   2. CONFINED: a scope that resolves outside repo_root yields no refs and a
//      warning; it is never followed.
//   3. REPRODUCIBLE: files are visited in sorted repo-relative path order and
//      lines in file order, so the same tree always yields the same refs.
//   4. Paths in refs are repo-relative and '/'-separated on every platform.
//
// Thread-safety: search() is const and touches no shared state, so one
// adapter instance may serve concurrent evidence specs.
//
// EXTENSION_POINT: evidence_sources
//   Add an adapter by deriving from IEvidenceAdapter and registering it under
//   its discriminator in ClaimEvaluator. The manifest validator must learn the
//   new discriminator in the same change.

#include <filesystem>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "docsync/types.hpp"

namespace docsync {

// Patterns longer than this are truncated and matched literally (ReDoS guard).
inline constexpr std::size_t kMaxPatternLength = 1000;

// Lines longer than this many bytes are skipped with a warning. std::regex
// recursion depth grows with the subject length.
inline constexpr std::size_t kMaxScannedLineLength = 4096;

// ---------------------------------------------------------------------------
// IEvidenceAdapter — abstract search capability
// ---------------------------------------------------------------------------
class IEvidenceAdapter {
 public:
  virtual ~IEvidenceAdapter() = default;

  // Discriminator used in manifests: "code" | "markdown".
  virtual std::string source_type() const = 0;

  // Search files under scope (repo-relative; "" = whole repo).
  virtual std::vector<EvidenceRef> search(const std::string& pattern,
                                          const std::string& scope) const = 0;
};

// Escape every ECMAScript metacharacter so the pattern matches literally.
std::string regex_escape(const std::string& text);

// Compile a manifest pattern: over-long patterns are truncated and escaped,
// invalid regexes fall back to a literal match.
std::regex compile_pattern(const std::string& pattern);

// Resolve scope under repo_root. Returns nullopt if it escapes the root.
std::optional<std::filesystem::path> resolve_scope(const std::filesystem::path& repo_root,
                                                   const std::string& scope);

// ---------------------------------------------------------------------------
// FileScanAdapter — line grep over files with a fixed extension set
// ---------------------------------------------------------------------------
class FileScanAdapter : public IEvidenceAdapter {
 public:
  FileScanAdapter(std::filesystem::path repo_root, std::string source_type,
                  std::set<std::string> extensions);

  std::string source_type() const override { return source_type_; }
  std::vector<EvidenceRef> search(const std::string& pattern,
                                  const std::string& scope) const override;

  const std::filesystem::path& repo_root() const { return repo_root_; }

 protected:
  struct ScannedFile {
    std::string rel;  // repo-relative, '/'-separated
    std::filesystem::path path;
  };

  // Candidate files under root, sorted by repo-relative path.
  std::vector<ScannedFile> list_files(const std::filesystem::path& root) const;
  std::string relative_path(const std::filesystem::path& file) const;

  // Called when the line grep found nothing. Default: no refs.
  virtual std::vector<EvidenceRef> fallback_search(const std::filesystem::path& root,
                                                   const std::regex& compiled) const;

 private:
  std::filesystem::path repo_root_;
  std::string source_type_;
  std::set<std::string> extensions_;
};

// .py .js .ts .go .rs .java .c .h .cpp, plus a Python def/class name fallback.
class CodeAdapter final : public FileScanAdapter {
 public:
  explicit CodeAdapter(std::filesystem::path repo_root);

 protected:
  std::vector<EvidenceRef> fallback_search(const std::filesystem::path& root,
                                           const std::regex& compiled) const override;
};

// .md .markdown .rst .txt
class MarkdownAdapter final : public FileScanAdapter {
 public:
  explicit MarkdownAdapter(std::filesystem::path repo_root);
};

}  // namespace docsync
