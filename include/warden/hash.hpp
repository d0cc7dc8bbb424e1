#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace warden {

// Core BLAKE3 hashing (64-char lowercase hex)
std::string blake3_hex(std::string_view payload);

// Domain-separated hashing for different contexts
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string ledger_entry_hash(std::string_view canonical_line);
std::string payload_digest(std::string_view payload_bytes);
std::string boundary_state_digest(std::string_view canonical_boundary_json);

// Keyed BLAKE3 (MAC mode). Key is exactly 32 bytes.
using SealKey = std::array<uint8_t, 32>;
std::string keyed_hex(const SealKey& key, std::string_view payload);

// Parse a 64-char hex string into a key. Returns false on malformed input.
bool seal_key_from_hex(SealKey& key, std::string_view hex);

// Constant-time comparison of two digests of equal length.
bool digest_equal(std::string_view a, std::string_view b);

// Collision-resistant record identifier: "<prefix>-<32 hex chars>".
std::string random_id(std::string_view prefix);

}  // namespace warden
