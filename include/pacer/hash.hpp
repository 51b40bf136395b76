#pragma once

// pacer/hash.hpp — BLAKE3 hashing with domain separation.
//
// BLAKE3-256 is the only hash primitive in the project. Each persisted use
// gets its own domain prefix so digests from different contexts can never be
// confused:
//   "ckpt:" session checkpoint content keys
//   "esc:"  escalation log chain links

#include <string>
#include <string_view>

namespace pacer {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string checkpoint_content_hash(std::string_view raw_bytes);
std::string escalation_chain_hash(std::string_view line);

// True for a 64-char lowercase hex string.
bool is_hex_digest(std::string_view s);

}  // namespace pacer
