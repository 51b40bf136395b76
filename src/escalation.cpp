#include "pacer/escalation.hpp"

#include <algorithm>
#include <cstdio>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>

#include "pacer/hash.hpp"
#include "pacer/jsonlite.hpp"
#include "pacer/observability.hpp"
#include "pacer/version.hpp"

namespace pacer {

namespace {
const std::string kGenesisDigest(64, '0');
}  // namespace

std::string escalation_to_json(const EscalationRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"v\":" << version::ESCALATION_LOG_VERSION
    << ",\"seq\":" << r.sequence
    << ",\"prev\":\"" << r.previous_digest << "\""
    << ",\"account_id\":" << r.account_id
    << ",\"health_score\":" << r.health_score
    << ",\"login_success_rate\":" << r.breakdown.login_success_rate
    << ",\"post_success_rate\":" << r.breakdown.post_success_rate
    << ",\"engagement_naturalness\":" << r.breakdown.engagement_naturalness_score
    << ",\"freeze_risk\":" << r.breakdown.freeze_risk_score
    << ",\"reason\":\"" << jsonlite::escape(r.reason) << "\""
    << ",\"timestamp_unix_ms\":" << r.timestamp_unix_ms
    << "}";
  return o.str();
}

struct EscalationLog::Impl {
  mutable std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
  std::deque<EscalationRecord> recent;
  EscalationHook hook;
};

EscalationLog::EscalationLog(const std::string& path) : path_(path), impl_(std::make_unique<Impl>()) {
  if (path_.empty()) return;

  // Resume the chain from an existing file so restarts keep one sequence.
  std::ifstream in(path_);
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    const auto obj = jsonlite::parse(line, nullptr);
    impl_->seq = std::max<uint64_t>(impl_->seq, jsonlite::get_u64(obj, "seq", 0));
    impl_->last_digest = escalation_chain_hash(line);
  }

  impl_->file = std::fopen(path_.c_str(), "a");
  if (!impl_->file) {
    log(LogLevel::error, "escalation", "cannot open " + path_ + "; records kept in memory only");
  }
}

EscalationLog::~EscalationLog() {
  if (impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

bool EscalationLog::append(EscalationRecord& record) {
  EscalationHook hook;
  bool written = true;
  {
    std::lock_guard<std::mutex> lk(impl_->mu);
    record.sequence = ++impl_->seq;
    record.previous_digest = impl_->last_digest;

    const std::string line = escalation_to_json(record);
    impl_->last_digest = escalation_chain_hash(line);

    if (impl_->file) {
      const std::string final_line = line + "\n";
      written = std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
      std::fflush(impl_->file);
    } else if (!path_.empty()) {
      written = false;
    }

    if (written) {
      ++impl_->entry_count;
    } else {
      ++impl_->failure_count;
    }

    impl_->recent.push_back(record);
    if (impl_->recent.size() > kMaxRecent) impl_->recent.pop_front();
    hook = impl_->hook;
  }

  if (!written) {
    log(LogLevel::error, "escalation",
        "write failed for account " + std::to_string(record.account_id) + " seq " +
            std::to_string(record.sequence));
  }
  if (hook) hook(record);
  return written;
}

void EscalationLog::set_hook(EscalationHook hook) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  impl_->hook = std::move(hook);
}

uint64_t EscalationLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t EscalationLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

std::vector<EscalationRecord> EscalationLog::recent() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return std::vector<EscalationRecord>(impl_->recent.begin(), impl_->recent.end());
}

ChainVerifyResult verify_escalation_log(const std::string& path) {
  ChainVerifyResult r;
  std::ifstream in(path);
  if (!in) {
    r.error = "cannot open " + path;
    return r;
  }

  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    const uint64_t seq = jsonlite::get_u64(obj, "seq", 0);
    if (err) {
      r.error = "record " + std::to_string(r.records + 1) + ": " + err->message;
      return r;
    }
    if (jsonlite::get_u64(obj, "v", 0) > version::ESCALATION_LOG_VERSION) {
      r.error = "record " + std::to_string(seq) + ": newer log version";
      return r;
    }
    if (expected_seq != 0 && seq != expected_seq + 1) {
      r.error = "sequence gap before " + std::to_string(seq);
      return r;
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      r.error = "chain broken at seq " + std::to_string(seq);
      return r;
    }
    expected_prev = escalation_chain_hash(line);
    expected_seq = seq;
    ++r.records;
  }
  r.ok = true;
  return r;
}

}  // namespace pacer
