#include <pthread.h>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <zstd.h>

#include "pacer/checkpoint.hpp"
#include "pacer/clock.hpp"
#include "pacer/config.hpp"
#include "pacer/escalation.hpp"
#include "pacer/gate.hpp"
#include "pacer/hash.hpp"
#include "pacer/health.hpp"
#include "pacer/health_store.hpp"
#include "pacer/jsonlite.hpp"
#include "pacer/observability.hpp"
#include "pacer/scheduler.hpp"
#include "pacer/supervisor.hpp"
#include "pacer/task_store.hpp"
#include "pacer/version.hpp"

namespace {

std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (pacer::blake3_hex("") != "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (pacer::blake3_hex("hello") != "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

bool verify_zstd_roundtrip() {
  const std::string sample(4096, 'x');
  std::string packed(ZSTD_compressBound(sample.size()), '\0');
  const size_t n = ZSTD_compress(packed.data(), packed.size(), sample.data(), sample.size(), 3);
  if (ZSTD_isError(n)) return false;
  std::string unpacked(sample.size(), '\0');
  const size_t m = ZSTD_decompress(unpacked.data(), unpacked.size(), packed.data(), n);
  return !ZSTD_isError(m) && unpacked == sample;
}

std::string string_array(const std::vector<std::string>& items) {
  std::string out = "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ",";
    out += "\"" + pacer::jsonlite::escape(items[i]) + "\"";
  }
  return out + "]";
}

std::string limits_to_json(const pacer::PacerConfig& cfg) {
  std::ostringstream o;
  o << "{\"hourly_limits\":{";
  bool first_phase = true;
  for (pacer::AccountPhase p : pacer::kAllPhases) {
    if (!first_phase) o << ",";
    first_phase = false;
    o << "\"" << pacer::to_string(p) << "\":{";
    bool first_type = true;
    for (pacer::ActionType t : pacer::kAllActionTypes) {
      if (!first_type) o << ",";
      first_type = false;
      o << "\"" << pacer::to_string(t) << "\":" << pacer::hourly_limit(cfg.hourly, p, t);
    }
    o << "}";
  }
  o << "},\"phase_caps\":{";
  first_phase = true;
  for (pacer::AccountPhase p : pacer::kAllPhases) {
    if (!first_phase) o << ",";
    first_phase = false;
    const pacer::DailyCaps c = pacer::base_caps(cfg.phase_caps, p);
    o << "\"" << pacer::to_string(p) << "\":{\"posts\":" << c.max_posts
      << ",\"actions\":" << c.max_actions << "}";
  }
  o << "}}";
  return o.str();
}

int run_daemon(const std::string& config_path) {
  std::string error;
  const pacer::PacerConfig cfg = pacer::load_config(config_path, &error);
  if (!error.empty()) {
    std::cerr << "{\"error\":\"config_parse_error\",\"detail\":\"" << pacer::jsonlite::escape(error)
              << "\"}\n";
    return 2;
  }

  // Block the stop signals before any worker thread exists so only sigwait
  // below receives them.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  if (pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr) != 0) {
    pacer::log(pacer::LogLevel::error, "daemon", "cannot block stop signals");
    return 2;
  }

  pacer::MemoryHealthStore store;
  pacer::MemoryTaskStore tasks;
  pacer::EscalationLog escalations(cfg.escalation_log_path);
  const pacer::Clock& clock = pacer::system_clock();

  pacer::HealthEngine engine(store, cfg, clock, &escalations);
  pacer::ActionGate gate(store, cfg, clock);
  pacer::EngagementScheduler scheduler(tasks, store, cfg.scheduler, clock);

  pacer::Supervisor supervisor(engine, gate, store, cfg, clock, &scheduler);
  supervisor.start();
  pacer::log(pacer::LogLevel::info, "daemon",
             "running (health every " + std::to_string(cfg.monitor.health_interval_ms / 1000) + "s)");

  int sig = 0;
  if (sigwait(&stop_signals, &sig) != 0) {
    pacer::log(pacer::LogLevel::error, "daemon", "sigwait failed");
  }
  pacer::log(pacer::LogLevel::info, "daemon", "signal " + std::to_string(sig) + ", shutting down");
  supervisor.stop();
  std::cout << pacer::global_core_stats().to_json() << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    std::cerr << "usage: pacer <version|health|config-check FILE|limits|checkpoints DIR|"
                 "verify-escalations FILE|daemon [--config FILE]>\n";
    return 1;
  }

  if (cmd == "version") {
    std::cout << pacer::version::manifest_to_json(pacer::version::current_manifest()) << "\n";
    return 0;
  }

  if (cmd == "health") {
    const auto h = pacer::hash_runtime_info();
    const bool hash_ok = verify_hash_vectors();
    const bool zstd_ok = verify_zstd_roundtrip();
    std::cout << "{\"hash_primitive\":\"" << h.primitive << "\",\"hash_version\":\"" << h.version
              << "\",\"hash_vectors_ok\":" << (hash_ok ? "true" : "false")
              << ",\"compression\":\"zstd\",\"zstd_version\":\"" << ZSTD_versionString()
              << "\",\"zstd_ok\":" << (zstd_ok ? "true" : "false")
              << ",\"checkpoint_format\":" << pacer::version::CHECKPOINT_FORMAT_VERSION << "}\n";
    return hash_ok && zstd_ok ? 0 : 2;
  }

  if (cmd == "config-check") {
    std::string path;
    for (int i = 2; i < argc; ++i) {
      if (std::string(argv[i]).rfind("--", 0) != 0) {
        path = argv[i];
        break;
      }
    }
    if (path.empty()) {
      std::cerr << "usage: pacer config-check FILE\n";
      return 1;
    }
    const auto r = pacer::validate_config(read_file(path));
    std::cout << "{\"ok\":" << (r.ok ? "true" : "false") << ",\"config_version\":\""
              << pacer::jsonlite::escape(r.config_version) << "\",\"errors\":" << string_array(r.errors)
              << ",\"warnings\":" << string_array(r.warnings) << "}\n";
    return r.ok ? 0 : 2;
  }

  if (cmd == "limits") {
    std::string config_path;
    for (int i = 2; i < argc; ++i) {
      if (std::string(argv[i]) == "--config" && i + 1 < argc) config_path = argv[++i];
    }
    std::string error;
    const pacer::PacerConfig cfg = pacer::load_config(config_path, &error);
    if (!error.empty()) {
      std::cerr << "{\"error\":\"config_parse_error\",\"detail\":\"" << pacer::jsonlite::escape(error)
                << "\"}\n";
      return 2;
    }
    std::cout << limits_to_json(cfg) << "\n";
    return 0;
  }

  if (cmd == "checkpoints") {
    std::string dir = pacer::default_config().sessions.checkpoint_dir;
    if (argc > 2) dir = argv[2];
    pacer::FileCheckpointStore store(dir);
    std::cout << "{\"backend\":\"" << store.backend_id() << "\",\"checkpoints\":[";
    bool first = true;
    for (const auto& c : store.list()) {
      if (!first) std::cout << ",";
      first = false;
      std::cout << "{\"account_id\":" << c.account_id << ",\"digest\":\"" << c.digest
                << "\",\"encoding\":\"" << c.encoding << "\",\"original_size\":" << c.original_size
                << ",\"stored_size\":" << c.stored_size << ",\"created_at_unix_ms\":"
                << c.created_at_unix_ms << "}";
    }
    std::cout << "]}\n";
    return 0;
  }

  if (cmd == "verify-escalations") {
    if (argc < 3) {
      std::cerr << "usage: pacer verify-escalations FILE\n";
      return 1;
    }
    const auto r = pacer::verify_escalation_log(argv[2]);
    std::cout << "{\"ok\":" << (r.ok ? "true" : "false") << ",\"records\":" << r.records
              << ",\"error\":\"" << pacer::jsonlite::escape(r.error) << "\"}\n";
    return r.ok ? 0 : 2;
  }

  if (cmd == "daemon") {
    std::string config_path;
    for (int i = 2; i < argc; ++i) {
      if (std::string(argv[i]) == "--config" && i + 1 < argc) config_path = argv[++i];
    }
    return run_daemon(config_path);
  }

  std::cerr << "{\"error\":\"unknown command: " << pacer::jsonlite::escape(cmd) << "\"}\n";
  return 1;
}
