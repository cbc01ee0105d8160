#pragma once

// docsync/claims.hpp — Canonical dict shape of a ClaimResult and its strict
// decoder.
//
// DESIGN INVARIANTS:
//   1. claim_result_to_value() is the ONLY producer of the claim dict. The
//      chain content hash, the flat legacy "results" view, the per-item
//      "content" and the bulk sanitization payload all use it.
//   2. decode_claim_result() is the ONLY reader of an untrusted claim dict.
//      PackCodec and the bulk sanitization check share it, so a document that
//      one path rejects is rejected by the other.
//   3. Nothing is coerced: a wrong type, a key outside the canonical set or a
//      snippet longer than kMaxSnippetLength is a StructuralDecodeError, never
//      a default or a truncation.

#include <string>
#include <vector>

#include "docsync/jsonlite.hpp"
#include "docsync/types.hpp"

namespace docsync {

// {claim_id, claim_text, status, evidence:[{source_type, path, line, snippet,
// matched}], message}
jsonlite::Value claim_result_to_value(const ClaimResult& result);
jsonlite::Value evidence_ref_to_value(const EvidenceRef& ref);

// Canonical JSON bytes of one result (the input of content_hash).
std::string canonical_claim_json(const ClaimResult& result);

// Canonical JSON array of all results (the bulk sanitization payload).
std::string canonical_results_json(const std::vector<ClaimResult>& results);

// Throws StructuralDecodeError on any shape violation.
ClaimResult decode_claim_result(const jsonlite::Value& value);
EvidenceRef decode_evidence_ref(const jsonlite::Value& value);

}  // namespace docsync
