#include "warden/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks, no alternatives.
//   2. Domain separation: "ledger:", "payload:", "boundary:" prefixes prevent
//      cross-context collisions. The prefixes are part of the persisted
//      format; changing one invalidates every stored ledger chain.
//   3. Seals use BLAKE3 keyed mode, never a prefix-keyed plain hash.

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <random>

extern "C" {
#include <blake3.h>
}

namespace warden {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

// Returns 0xFF on invalid character.
inline uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return 0xFF;
}

using Digest = std::array<unsigned char, BLAKE3_OUT_LEN>;

// One BLAKE3 pass over the concatenation of `parts`; keyed when `key` is set.
Digest blake3_digest(std::initializer_list<std::string_view> parts,
                     const SealKey* key = nullptr) {
  blake3_hasher hasher;
  if (key) blake3_hasher_init_keyed(&hasher, key->data());
  else blake3_hasher_init(&hasher);
  for (std::string_view part : parts) blake3_hasher_update(&hasher, part.data(), part.size());
  Digest out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return out;
}

std::string hex_of(const Digest& d) { return to_hex(d.data(), d.size()); }

}  // namespace

std::string blake3_hex(std::string_view payload) { return hex_of(blake3_digest({payload})); }

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return hex_of(blake3_digest({domain, payload}));
}

std::string ledger_entry_hash(std::string_view canonical_line) {
  return hash_domain("ledger:", canonical_line);
}

std::string payload_digest(std::string_view payload_bytes) {
  return hash_domain("payload:", payload_bytes);
}

std::string boundary_state_digest(std::string_view canonical_boundary_json) {
  return hash_domain("boundary:", canonical_boundary_json);
}

std::string keyed_hex(const SealKey& key, std::string_view payload) {
  return hex_of(blake3_digest({payload}, &key));
}

bool seal_key_from_hex(SealKey& key, std::string_view hex) {
  if (hex.size() != key.size() * 2) return false;
  for (std::size_t i = 0; i < key.size(); ++i) {
    const uint8_t hi = hex_nibble(hex[i * 2]);
    const uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return false;
    key[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return true;
}

bool digest_equal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  unsigned char acc = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    acc |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return acc == 0;
}

std::string random_id(std::string_view prefix) {
  // Entropy + process-wide counter + monotonic clock, folded through BLAKE3 so the
  // id never exposes generator state.
  static std::atomic<uint64_t> counter{0};
  static thread_local std::mt19937_64 rng(std::random_device{}());

  const uint64_t seq = counter.fetch_add(1, std::memory_order_relaxed);
  const uint64_t now = static_cast<uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  uint64_t words[4] = {rng(), rng(), seq, now};

  std::string material(reinterpret_cast<const char*>(words), sizeof(words));
  const std::string digest = blake3_hex(material);

  std::string out;
  out.reserve(prefix.size() + 33);
  out.append(prefix.data(), prefix.size());
  out += '-';
  out.append(digest, 0, 32);
  return out;
}

}  // namespace warden
