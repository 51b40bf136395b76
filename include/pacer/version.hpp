#pragma once

// pacer/version.hpp — Version manifest for every persisted format.
//
// Every component that writes a record which outlives the process (session
// checkpoints, escalation log lines, JSONL events) stamps the matching constant
// below into the record, and readers check it before trusting the payload.
//
// INVARIANT:
//   Bump a constant before any structural change to the format it names.
//   Readers reject records from a NEWER format version than they were built
//   against; older versions are accepted only through explicit migration code.

#include <cstdint>
#include <string>

namespace pacer {
namespace version {

constexpr const char* kSemver = "1.2.0";

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex-encoded to 64 chars, with domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// CHECKPOINT_FORMAT_VERSION
// On-disk layout of session checkpoints:
//   objects/AB/CD/<digest>       zstd-compressed storage state
//   objects/AB/CD/<digest>.meta  JSON sidecar
//   heads/<account_id>.head      digest of the account's latest checkpoint
// ---------------------------------------------------------------------------
constexpr uint32_t CHECKPOINT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// ESCALATION_LOG_VERSION
// NDJSON, one EscalationRecord per line, BLAKE3-chained via "prev".
// ---------------------------------------------------------------------------
constexpr uint32_t ESCALATION_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_SCHEMA_VERSION
// JSONL stream written to PACER_EVENT_LOG.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_SCHEMA_VERSION = 1;

struct VersionManifest {
  std::string semver{kSemver};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t checkpoint_format{CHECKPOINT_FORMAT_VERSION};
  uint32_t escalation_log{ESCALATION_LOG_VERSION};
  uint32_t event_schema{EVENT_SCHEMA_VERSION};
  std::string hash_primitive{"blake3"};
  std::string compression{"zstd"};
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace pacer
