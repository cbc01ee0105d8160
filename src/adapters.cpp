#include "docsync/adapters.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

#include "docsync/jsonlite.hpp"
#include "docsync/observability.hpp"

namespace fs = std::filesystem;

namespace docsync {

namespace {

bool starts_with(const std::string& v, const std::string& prefix) {
  return v.size() >= prefix.size() && v.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(const std::string& s) {
  const auto is_space = [](unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
  };
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && is_space(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && is_space(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

// Replace invalid UTF-8 with U+FFFD so snippets are always valid text.
std::string repair_utf8(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  std::size_t i = 0;
  while (i < s.size()) {
    const std::size_t start = i;
    const std::uint32_t cp = jsonlite::next_code_point(s, i);
    if (cp == 0xFFFD && !(i - start == 3 && s.compare(start, 3, "\xEF\xBF\xBD") == 0)) {
      out += "\xEF\xBF\xBD";
    } else {
      out.append(s, start, i - start);
    }
  }
  return out;
}

std::vector<std::string> read_lines(const fs::path& file, bool* ok) {
  std::vector<std::string> lines;
  std::ifstream ifs(file, std::ios::binary);
  if (!ifs) {
    *ok = false;
    return lines;
  }
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
  }
  *ok = !ifs.bad();
  return lines;
}

}  // namespace

std::string regex_escape(const std::string& text) {
  static const std::string kMeta = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(text.size() * 2);
  for (char c : text) {
    if (kMeta.find(c) != std::string::npos) out += '\\';
    out += c;
  }
  return out;
}

std::regex compile_pattern(const std::string& pattern) {
  if (pattern.size() > kMaxPatternLength) {
    return std::regex(regex_escape(pattern.substr(0, kMaxPatternLength)),
                      std::regex::ECMAScript);
  }
  try {
    return std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error&) {
    return std::regex(regex_escape(pattern), std::regex::ECMAScript);
  }
}

// Path normalization with symlink resolution and confinement check.
std::optional<fs::path> resolve_scope(const fs::path& repo_root, const std::string& scope) {
  std::error_code ec;
  const fs::path base = fs::weakly_canonical(repo_root, ec);
  if (ec) return std::nullopt;
  const fs::path in = scope.empty() ? base : fs::weakly_canonical(base / scope, ec);
  if (ec) return std::nullopt;
  std::string base_str = base.generic_string();
  while (base_str.size() > 1 && base_str.back() == '/') base_str.pop_back();
  std::string in_str = in.generic_string();
  while (in_str.size() > 1 && in_str.back() == '/') in_str.pop_back();
  if (in_str != base_str && !starts_with(in_str, base_str + "/")) return std::nullopt;
  return in;
}

// ---------------------------------------------------------------------------
// FileScanAdapter
// ---------------------------------------------------------------------------

FileScanAdapter::FileScanAdapter(fs::path repo_root, std::string source_type,
                                 std::set<std::string> extensions)
    : repo_root_(std::move(repo_root)),
      source_type_(std::move(source_type)),
      extensions_(std::move(extensions)) {}

std::vector<FileScanAdapter::ScannedFile> FileScanAdapter::list_files(const fs::path& root) const {
  std::vector<ScannedFile> files;
  std::error_code ec;
  if (fs::is_regular_file(root, ec)) {
    if (extensions_.contains(root.extension().string()))
      files.push_back(ScannedFile{relative_path(root), root});
    return files;
  }
  for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec),
       end;
       !ec && it != end; it.increment(ec)) {
    std::error_code fec;
    if (!it->is_regular_file(fec) || fec) continue;
    if (!extensions_.contains(it->path().extension().string())) continue;
    files.push_back(ScannedFile{relative_path(it->path()), it->path()});
  }
  if (ec) {
    log_warning("directory scan stopped early", "evidence", "IoError", "",
                root.generic_string() + ": " + ec.message());
  }
  std::sort(files.begin(), files.end(),
            [](const ScannedFile& a, const ScannedFile& b) { return a.rel < b.rel; });
  return files;
}

std::string FileScanAdapter::relative_path(const fs::path& file) const {
  std::error_code ec;
  const fs::path base = fs::weakly_canonical(repo_root_, ec);
  const fs::path rel = fs::relative(file, ec ? repo_root_ : base, ec);
  return ec ? file.generic_string() : rel.generic_string();
}

std::vector<EvidenceRef> FileScanAdapter::search(const std::string& pattern,
                                                 const std::string& scope) const {
  const auto root = resolve_scope(repo_root_, scope);
  if (!root) {
    log_warning("evidence scope escapes repository root, ignored", "evidence",
                "ValidationError", "", scope);
    return {};
  }
  std::error_code ec;
  if (!fs::exists(*root, ec)) return {};

  const std::regex compiled = compile_pattern(pattern);
  std::vector<EvidenceRef> refs;
  for (const auto& file : list_files(*root)) {
    bool ok = true;
    const auto lines = read_lines(file.path, &ok);
    if (!ok) continue;
    std::size_t skipped = 0;
    for (std::size_t i = 0; i < lines.size(); ++i) {
      if (lines[i].size() > kMaxScannedLineLength) {
        ++skipped;
        continue;
      }
      if (!std::regex_search(lines[i], compiled)) continue;
      refs.emplace_back(source_type_, repair_utf8(file.rel), static_cast<uint64_t>(i + 1),
                        repair_utf8(trim(lines[i])), true);
    }
    if (skipped > 0) {
      log_warning("overlong lines skipped", "evidence", "ValidationError", "",
                  file.rel + ": " + std::to_string(skipped) + " line(s) over " +
                      std::to_string(kMaxScannedLineLength) + " bytes");
    }
  }
  if (refs.empty()) refs = fallback_search(*root, compiled);
  return refs;
}

std::vector<EvidenceRef> FileScanAdapter::fallback_search(const fs::path&,
                                                          const std::regex&) const {
  return {};
}

// ---------------------------------------------------------------------------
// CodeAdapter
// ---------------------------------------------------------------------------

CodeAdapter::CodeAdapter(fs::path repo_root)
    : FileScanAdapter(std::move(repo_root), "code",
                      {".py", ".js", ".ts", ".go", ".rs", ".java", ".c", ".h", ".cpp"}) {}

// Python declarations whose NAME matches the pattern. Catches claims about a
// function or class when the pattern was written against the bare name.
std::vector<EvidenceRef> CodeAdapter::fallback_search(const fs::path& root,
                                                      const std::regex& compiled) const {
  static const std::regex kDecl(R"(^\s*(?:async\s+)?(?:def|class)\s+([A-Za-z_][A-Za-z0-9_]*))");
  std::vector<EvidenceRef> refs;
  for (const auto& file : list_files(root)) {
    if (file.path.extension() != ".py") continue;
    bool ok = true;
    const auto lines = read_lines(file.path, &ok);
    if (!ok) continue;
    for (std::size_t i = 0; i < lines.size(); ++i) {
      if (lines[i].size() > kMaxScannedLineLength) continue;
      std::smatch m;
      if (!std::regex_search(lines[i], m, kDecl)) continue;
      const std::string name = m[1].str();
      if (!std::regex_search(name, compiled)) continue;
      refs.emplace_back("code", repair_utf8(file.rel), static_cast<uint64_t>(i + 1),
                        "def/class " + name, true);
    }
  }
  return refs;
}

// ---------------------------------------------------------------------------
// MarkdownAdapter
// ---------------------------------------------------------------------------

MarkdownAdapter::MarkdownAdapter(fs::path repo_root)
    : FileScanAdapter(std::move(repo_root), "markdown", {".md", ".markdown", ".rst", ".txt"}) {}

}  // namespace docsync
