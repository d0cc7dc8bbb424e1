#pragma once

// warden/codec.hpp: JSON encoding of every record the engine stores.
//
// INVARIANTS:
//   - Encoders produce jsonlite::Value trees; to_json() on them is canonical,
//     so encode -> to_json is deterministic and byte-stable across a
//     save/load/save cycle.
//   - Decoders validate shape at the system boundary. A boundary definition
//     with an unrecognized enum value still decodes (the field is left
//     unset and the raw text kept in Boundary::unrecognized) so compliance
//     checking can report it; a definition without a boundary_id is rejected.

#include <string>

#include "warden/jsonlite.hpp"
#include "warden/types.hpp"

namespace warden::codec {

jsonlite::Value encode(const Control& c);
jsonlite::Value encode(const Boundary& b);
jsonlite::Value encode(const AuditEvent& e);
jsonlite::Value encode(const ControlResult& r);
jsonlite::Value encode(const ImpactAssessment& i);
jsonlite::Value encode(const CrossingRequest& r);
jsonlite::Value encode(const Violation& v);
jsonlite::Value encode(const Recommendation& r);
jsonlite::Value encode(const VerificationRecord& r);

// Canonical boundary content as sealed by its owner: every field except the
// self-signature.
std::string boundary_content_for_seal(const Boundary& b);

// Canonical verification record content as signed: every field except the
// signature.
std::string verification_content_for_seal(const VerificationRecord& r);

Result<Boundary> decode_boundary(const jsonlite::Object& o);
Result<Boundary> boundary_from_json(const std::string& text);
Result<CrossingRequest> decode_crossing(const jsonlite::Object& o);
Result<VerificationRecord> decode_verification(const jsonlite::Object& o);

}  // namespace warden::codec
