#include "docsync/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. Digests are rendered as "<algorithm>:<hex>". The prefix is part of the
//      pack schema contract and is hashed into the next chain link.
//   2. to_hex() output is lowercase. Uppercase digests never compare equal to
//      recomputed ones, so they fail verification instead of being normalized.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) rather than
// snprintf("%02x"), which avoids format-string parsing per byte.

#include <array>
#include <fstream>
#include <memory>

#include <openssl/evp.h>

extern "C" {
#include <blake3.h>
}

#include "docsync/errors.hpp"

namespace docsync {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";
constexpr std::size_t kHexDigestLength = 64;

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

struct EvpCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

// Incremental hasher over either primitive, so file hashing streams in chunks
// for both algorithms.
class Hasher {
 public:
  explicit Hasher(HashAlgorithm algorithm) : algorithm_(algorithm) {
    if (algorithm_ == HashAlgorithm::blake3) {
      blake3_hasher_init(&blake3_);
      return;
    }
    evp_.reset(EVP_MD_CTX_new());
    if (!evp_ || EVP_DigestInit_ex(evp_.get(), EVP_sha256(), nullptr) != 1) {
      throw Error(ErrorCode::io_error, "EVP sha256 initialization failed");
    }
  }

  void update(const void* data, std::size_t len) {
    if (algorithm_ == HashAlgorithm::blake3) {
      blake3_hasher_update(&blake3_, data, len);
      return;
    }
    if (EVP_DigestUpdate(evp_.get(), data, len) != 1) {
      throw Error(ErrorCode::io_error, "EVP sha256 update failed");
    }
  }

  std::string hex() {
    if (algorithm_ == HashAlgorithm::blake3) {
      std::array<unsigned char, BLAKE3_OUT_LEN> out{};
      blake3_hasher_finalize(&blake3_, out.data(), out.size());
      return to_hex(out.data(), out.size());
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(evp_.get(), out.data(), &len) != 1) {
      throw Error(ErrorCode::io_error, "EVP sha256 finalization failed");
    }
    return to_hex(out.data(), len);
  }

 private:
  HashAlgorithm algorithm_;
  blake3_hasher blake3_{};
  EvpCtxPtr evp_;
};

bool is_lower_hex(std::string_view text) {
  for (char c : text) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) return false;
  }
  return true;
}

}  // namespace

std::string to_string(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::sha256: return "sha256";
    case HashAlgorithm::blake3: return "blake3";
  }
  return "sha256";
}

std::optional<HashAlgorithm> parse_hash_algorithm(std::string_view name) {
  if (name == "sha256") return HashAlgorithm::sha256;
  if (name == "blake3") return HashAlgorithm::blake3;
  return std::nullopt;
}

std::string sha256_hex(std::string_view payload) {
  Hasher h(HashAlgorithm::sha256);
  h.update(payload.data(), payload.size());
  return h.hex();
}

std::string blake3_hex(std::string_view payload) {
  Hasher h(HashAlgorithm::blake3);
  h.update(payload.data(), payload.size());
  return h.hex();
}

std::string hash_text(HashAlgorithm algorithm, std::string_view payload) {
  Hasher h(algorithm);
  h.update(payload.data(), payload.size());
  return to_string(algorithm) + ":" + h.hex();
}

std::string hash_file(const std::string& path, HashAlgorithm algorithm) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return {};
  }

  Hasher h(algorithm);
  constexpr std::size_t buffer_size = 65536;
  std::array<char, buffer_size> buffer{};
  while (file.good()) {
    file.read(buffer.data(), buffer.size());
    const std::streamsize count = file.gcount();
    if (count > 0) {
      h.update(buffer.data(), static_cast<std::size_t>(count));
    }
  }
  if (file.bad()) {
    return {};
  }
  return to_string(algorithm) + ":" + h.hex();
}

std::optional<HashAlgorithm> digest_algorithm(std::string_view prefixed) {
  const auto colon = prefixed.find(':');
  if (colon == std::string_view::npos) return std::nullopt;
  return parse_hash_algorithm(prefixed.substr(0, colon));
}

bool is_prefixed_digest(std::string_view text) {
  const auto colon = text.find(':');
  if (colon == std::string_view::npos) return false;
  if (!parse_hash_algorithm(text.substr(0, colon))) return false;
  const auto hex = text.substr(colon + 1);
  return hex.size() == kHexDigestLength && is_lower_hex(hex);
}

std::string blake3_library_version() {
  const char* v = blake3_version();
  return v ? v : "unknown";
}

}  // namespace docsync
