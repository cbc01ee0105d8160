#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "docsync/commands.hpp"
#include "docsync/config.hpp"
#include "docsync/errors.hpp"
#include "docsync/hash.hpp"
#include "docsync/manifest.hpp"
#include "docsync/pack_codec.hpp"
#include "docsync/pii_shield_client.hpp"
#include "docsync/runner.hpp"
#include "docsync/types.hpp"
#include "docsync/version.hpp"

namespace {

void print_usage() {
  std::cerr << "usage:\n"
               "  docsync run --manifest <path> [--repo <dir>] [--output <dir>]\n"
               "              [--sanitizer-endpoint <url>] [--sanitizer-api-key <key>]\n"
               "              [--sanitizer-timeout-ms <n>] [--fail-closed] [--salt <label>]\n"
               "              [--hash-algorithm sha256|blake3] [--workers <n>]\n"
               "              [--parallel-evidence] [--stats]\n"
               "  docsync verify --pack <path>\n"
               "  docsync version\n";
}

bool parse_u32(const std::string& text, uint32_t* out) {
  if (text.empty() || text.size() > 9) return false;
  uint32_t v = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<uint32_t>(c - '0');
  }
  *out = v;
  return true;
}

int cmd_run(int argc, char** argv) {
  docsync::RunnerConfig config;
  for (const auto& problem : docsync::apply_env(config)) {
    docsync::log_warning(problem, "config", "ValidationError");
  }

  std::string manifest_path;
  bool print_stats = false;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--manifest" && has_value) {
      manifest_path = argv[++i];
    } else if (arg == "--repo" && has_value) {
      config.repo_root = argv[++i];
    } else if (arg == "--output" && has_value) {
      config.output_dir = argv[++i];
    } else if (arg == "--sanitizer-endpoint" && has_value) {
      config.sanitizer.endpoint = argv[++i];
    } else if (arg == "--sanitizer-api-key" && has_value) {
      config.sanitizer.api_key = argv[++i];
    } else if (arg == "--sanitizer-timeout-ms" && has_value) {
      const std::string v = argv[++i];
      if (!parse_u32(v, &config.sanitizer.timeout_ms) || config.sanitizer.timeout_ms == 0) {
        std::cerr << "invalid --sanitizer-timeout-ms: " << v << "\n";
        return 2;
      }
    } else if (arg == "--fail-closed") {
      config.sanitizer.fail_closed = true;
    } else if (arg == "--salt" && has_value) {
      config.sanitizer.salt_label = argv[++i];
    } else if (arg == "--hash-algorithm" && has_value) {
      const std::string v = argv[++i];
      auto alg = docsync::parse_hash_algorithm(v);
      if (!alg) {
        std::cerr << "unknown hash algorithm: " << v << "\n";
        return 2;
      }
      config.hash_algorithm = *alg;
    } else if (arg == "--workers" && has_value) {
      const std::string v = argv[++i];
      if (!parse_u32(v, &config.max_workers) || config.max_workers == 0) {
        std::cerr << "invalid --workers: " << v << "\n";
        return 2;
      }
    } else if (arg == "--parallel-evidence") {
      config.parallel_evidence = true;
    } else if (arg == "--stats") {
      print_stats = true;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      print_usage();
      return 2;
    }
  }
  if (manifest_path.empty()) {
    print_usage();
    return 2;
  }

  docsync::DocManifest manifest;
  std::string manifest_text;
  try {
    manifest = docsync::load_manifest_file(manifest_path, &manifest_text);
  } catch (const docsync::ValidationError& e) {
    if (e.code() == docsync::ErrorCode::manifest_not_found) {
      std::cerr << "Manifest not found: " << manifest_path << "\n";
      return 1;
    }
    std::cerr << "Manifest validation errors:\n";
    for (const auto& err : e.errors()) std::cerr << "  - " << err << "\n";
    return 1;
  }

  std::shared_ptr<docsync::IRedactionCapability> capability;
  if (config.sanitizer.enabled()) {
    capability = std::make_shared<docsync::PiiShieldClient>(config.sanitizer);
  }

  docsync::NightlyRunner runner(config, capability);
  std::vector<docsync::DocumentOutcome> outcomes;
  try {
    outcomes = runner.run(manifest, manifest_text);
  } catch (const docsync::Error& e) {
    std::cerr << "run failed (" << docsync::to_string(e.code()) << "): " << e.what() << "\n";
    return 1;
  }

  std::error_code ec;
  std::filesystem::create_directories(config.output_dir, ec);
  if (ec) {
    std::cerr << "cannot create output directory " << config.output_dir << ": " << ec.message()
              << "\n";
    return 1;
  }

  uint64_t pass = 0, fail = 0, skip = 0;
  bool aborted = false;
  for (const auto& outcome : outcomes) {
    if (!outcome.ok()) {
      aborted = true;
      std::cerr << "Aborted " << outcome.doc_path << ": " << outcome.error << "\n";
      continue;
    }
    for (const auto& r : outcome.pack->results) {
      if (r.status == docsync::ClaimStatus::pass) ++pass;
      else if (r.status == docsync::ClaimStatus::fail) ++fail;
      else ++skip;
    }
    const auto out_path = (std::filesystem::path(config.output_dir) /
                           ("evidence-pack-" + std::to_string(outcome.doc_index) + ".json"))
                              .string();
    try {
      docsync::write_pack_file(out_path, *outcome.pack);
    } catch (const docsync::IoError& e) {
      std::cerr << e.what() << "\n";
      return 1;
    }
    std::cout << "Wrote " << out_path << "\n";
  }

  std::cout << "Results: " << pass << " pass, " << fail << " fail, " << skip << " skip\n";
  if (print_stats) std::cout << runner.stats().to_json() << "\n";
  return (fail > 0 || aborted) ? 1 : 0;
}

int cmd_verify(int argc, char** argv) {
  std::string pack_path;
  for (int i = 2; i < argc; ++i) {
    if (std::string(argv[i]) == "--pack" && i + 1 < argc) pack_path = argv[++i];
  }
  if (pack_path.empty()) {
    print_usage();
    return 2;
  }

  return docsync::verify_command(pack_path, std::cout, std::cerr);
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 2;
  }
  const std::string cmd = argv[1];

  if (cmd == "run") return cmd_run(argc, argv);
  if (cmd == "verify") return cmd_verify(argc, argv);
  if (cmd == "version") {
    std::cout << docsync::version::manifest_to_json(docsync::version::current_manifest()) << "\n";
    return 0;
  }

  print_usage();
  return 2;
}
