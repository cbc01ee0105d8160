#pragma once

// docsync/pack_codec.hpp — Evidence pack envelope reader and writer.
//
// ENVELOPE (written):
//   {"version": "0.2.0" | "0.2.1",
//    "manifest_hash", "runner", "runner_version", "timestamp",
//    "items": [{"item_id", "sequence", "content_type", "content", "content_hash"}],
//    "immutability_proof": {"hash_chain": [ChainLink...], "root_hash",
//                           "hash_algorithm", "chain_algorithm_version"},
//    "results": [ClaimResult...],      legacy flat view
//    "hash_chain": ["<digest>"...],    legacy flat view
//    "sanitization": {...}}            only in "0.2.1"
//
// READ STRATEGIES (selected by field presence):
//   version + immutability_proof   current envelope, chain version pinned
//   immutability_proof only        current envelope written without a tag
//   neither                        legacy flat pack, chain version 1
//   version without proof          StructuralDecodeError
//
// Results come from "results" when it is non-empty, otherwise from the
// per-item "content". When "items" is present every item must carry the same
// claim as results[i] and the same sequence, item_id, content_type and
// content_hash as proof link i; any disagreement is a StructuralDecodeError.
// The flat hash_chain view is derived from the proof when the legacy field is
// absent. Every claim dict goes through decode_claim_result(); nothing
// untrusted is coerced.

#include <string>

#include "docsync/jsonlite.hpp"
#include "docsync/types.hpp"

namespace docsync {

jsonlite::Value sanitization_summary_to_value(const SanitizationSummary& summary);
SanitizationSummary decode_sanitization_summary(const jsonlite::Value& value);

// Throws std::logic_error if the pack has not been frozen.
jsonlite::Value pack_to_value(const EvidencePack& pack);

// Pretty-printed envelope text, newline-terminated.
std::string serialize_pack(const EvidencePack& pack);

// Throws StructuralDecodeError on any malformed input.
EvidencePack pack_from_value(const jsonlite::Value& value);
EvidencePack deserialize_pack(const std::string& text);

// File helpers. load_pack_file throws IoError (code pack_not_found) when the
// file is missing; write_pack_file throws IoError when the write fails.
EvidencePack load_pack_file(const std::string& path);
void write_pack_file(const std::string& path, const EvidencePack& pack);

}  // namespace docsync
