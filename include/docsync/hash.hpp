#pragma once

// docsync/hash.hpp — Hash authority for every digest stored in a pack.
//
// DESIGN INVARIANTS:
//   1. Every stored digest is self-describing: "<algorithm>:<64 lowercase hex>".
//   2. The algorithm is pinned per artifact. verify() recomputes with the pinned
//      algorithm and never falls back to another one.
//   3. SHA-256 (OpenSSL EVP) is the default primitive because the pack format
//      and the redaction salt fingerprint are specified as "sha256:<hex>".
//      BLAKE3 is selectable per run.
//
// EXTENSION_POINT: hash_algorithm_upgrade
//   Add a HashAlgorithm value, teach parse/to_string about it, and extend
//   hash_text(). Packs pinned to an older algorithm stay verifiable because the
//   choice travels with the artifact.

#include <optional>
#include <string>
#include <string_view>

namespace docsync {

enum class HashAlgorithm { sha256, blake3 };

std::string to_string(HashAlgorithm algorithm);
std::optional<HashAlgorithm> parse_hash_algorithm(std::string_view name);

// Raw primitives: 64-char lowercase hex digests, no prefix.
std::string sha256_hex(std::string_view payload);
std::string blake3_hex(std::string_view payload);

// Prefixed digest "<algorithm>:<hex>" of payload.
std::string hash_text(HashAlgorithm algorithm, std::string_view payload);

// Stream-hash a file into a prefixed digest. Returns "" if the file cannot be read.
std::string hash_file(const std::string& path, HashAlgorithm algorithm);

// Algorithm named by a prefixed digest, or nullopt if the prefix is unknown.
std::optional<HashAlgorithm> digest_algorithm(std::string_view prefixed);

// True for "<known algorithm>:<64 lowercase hex>".
bool is_prefixed_digest(std::string_view text);

// Version string of the linked BLAKE3 library.
std::string blake3_library_version();

}  // namespace docsync
