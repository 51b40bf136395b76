#include "pacer/checkpoint.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>

#include <zstd.h>

#include "pacer/hash.hpp"
#include "pacer/jsonlite.hpp"
#include "pacer/observability.hpp"
#include "pacer/version.hpp"

namespace fs = std::filesystem;

namespace pacer {

namespace {

constexpr int kZstdLevel = 3;

std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  const size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), kZstdLevel);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  const size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return std::nullopt;
  return out;
}

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

int64_t unix_now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string meta_to_json(const CheckpointInfo& info) {
  return "{\"v\":" + std::to_string(version::CHECKPOINT_FORMAT_VERSION) +
         ",\"digest\":\"" + info.digest + "\",\"encoding\":\"" + info.encoding +
         "\",\"original_size\":" + std::to_string(info.original_size) +
         ",\"stored_size\":" + std::to_string(info.stored_size) +
         ",\"stored_blob_hash\":\"" + info.stored_blob_hash +
         "\",\"created_at_unix_ms\":" + std::to_string(info.created_at_unix_ms) + "}";
}

}  // namespace

FileCheckpointStore::FileCheckpointStore(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
  fs::create_directories(fs::path(root_) / "heads", ec);
  if (ec) log(LogLevel::error, "checkpoint", "cannot create " + root_ + ": " + ec.message());
}

std::string FileCheckpointStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string FileCheckpointStore::meta_path(const std::string& digest) const {
  return object_path(digest) + ".meta";
}

std::string FileCheckpointStore::head_path(AccountId account_id) const {
  return (fs::path(root_) / "heads" / (std::to_string(account_id) + ".head")).string();
}

std::optional<CheckpointInfo> FileCheckpointStore::info(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  const auto text = read_file(meta_path(digest));
  if (!text) return std::nullopt;

  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;
  if (jsonlite::get_u64(obj, "v", 0) > version::CHECKPOINT_FORMAT_VERSION) return std::nullopt;

  CheckpointInfo inf;
  inf.digest = jsonlite::get_string(obj, "digest");
  inf.encoding = jsonlite::get_string(obj, "encoding", "zstd");
  inf.original_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "original_size"));
  inf.stored_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "stored_size"));
  inf.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  inf.created_at_unix_ms = jsonlite::get_i64(obj, "created_at_unix_ms");
  if (inf.digest != digest) return std::nullopt;
  return inf;
}

std::optional<std::string> FileCheckpointStore::head(AccountId account_id) const {
  auto text = read_file(head_path(account_id));
  if (!text) return std::nullopt;
  while (!text->empty() && (text->back() == '\n' || text->back() == '\r')) text->pop_back();
  if (!is_hex_digest(*text)) return std::nullopt;
  return text;
}

std::optional<std::string> FileCheckpointStore::read_object(const std::string& digest) const {
  const auto meta = info(digest);
  if (!meta) return std::nullopt;
  auto stored = read_file(object_path(digest));
  if (!stored) return std::nullopt;

  if (blake3_hex(*stored) != meta->stored_blob_hash) return std::nullopt;

  std::optional<std::string> data;
  if (meta->encoding == "zstd") {
    data = decompress_zstd(*stored, meta->original_size);
  } else if (meta->encoding == "identity") {
    data = std::move(stored);
  }
  if (!data) return std::nullopt;

  if (checkpoint_content_hash(*data) != digest) return std::nullopt;
  return data;
}

std::string FileCheckpointStore::put(AccountId account_id, const std::string& state) {
  const std::string digest = checkpoint_content_hash(state);
  if (!is_hex_digest(digest)) return {};

  std::lock_guard<std::mutex> lk(mu_);

  const auto existing = read_object(digest);
  if (!existing || *existing != state) {
    std::string stored = compress_zstd(state);
    CheckpointInfo inf;
    inf.account_id = account_id;
    inf.digest = digest;
    inf.encoding = "zstd";
    if (stored.empty()) {
      stored = state;
      inf.encoding = "identity";
    }
    inf.original_size = state.size();
    inf.stored_size = stored.size();
    inf.stored_blob_hash = blake3_hex(stored);
    inf.created_at_unix_ms = unix_now_ms();

    if (!atomic_write(object_path(digest), stored)) {
      log(LogLevel::error, "checkpoint", "blob write failed for account " + std::to_string(account_id));
      return {};
    }
    if (!atomic_write(meta_path(digest), meta_to_json(inf))) {
      std::error_code ec;
      fs::remove(object_path(digest), ec);
      log(LogLevel::error, "checkpoint", "meta write failed for account " + std::to_string(account_id));
      return {};
    }
  }

  const auto previous = head(account_id);
  if (!atomic_write(head_path(account_id), digest + "\n")) {
    log(LogLevel::error, "checkpoint", "head write failed for account " + std::to_string(account_id));
    return {};
  }
  if (previous && *previous != digest && !drop_if_unreferenced(*previous)) {
    log(LogLevel::warn, "checkpoint", "could not remove superseded checkpoint " + previous->substr(0, 12));
  }
  return digest;
}

std::optional<std::string> FileCheckpointStore::get(AccountId account_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto digest = head(account_id);
  if (!digest) return std::nullopt;
  auto data = read_object(*digest);
  if (!data) {
    log(LogLevel::warn, "checkpoint",
        "checkpoint " + digest->substr(0, 12) + " for account " + std::to_string(account_id) +
            " failed verification; ignoring it");
  }
  return data;
}

bool FileCheckpointStore::contains(AccountId account_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto digest = head(account_id);
  return digest && fs::exists(object_path(*digest));
}

bool FileCheckpointStore::remove(AccountId account_id) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto digest = head(account_id);
  std::error_code ec;
  fs::remove(head_path(account_id), ec);
  if (ec) return false;
  if (!digest) return true;
  return drop_if_unreferenced(*digest);
}

bool FileCheckpointStore::drop_if_unreferenced(const std::string& digest) {
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(fs::path(root_) / "heads", ec)) {
    if (entry.path().extension() != ".head") continue;
    const auto other = read_file(entry.path());
    if (other && other->rfind(digest, 0) == 0) return true;
  }
  fs::remove(object_path(digest), ec);
  fs::remove(meta_path(digest), ec);
  return !ec;
}

std::vector<CheckpointInfo> FileCheckpointStore::list() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<CheckpointInfo> out;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(fs::path(root_) / "heads", ec)) {
    if (entry.path().extension() != ".head") continue;
    AccountId account_id = 0;
    try {
      account_id = std::stoll(entry.path().stem().string());
    } catch (const std::exception&) {
      log(LogLevel::warn, "checkpoint", "skipping stray head file " + entry.path().string());
      continue;
    }
    const auto digest = head(account_id);
    if (!digest) continue;
    auto inf = info(*digest);
    if (!inf) continue;
    inf->account_id = account_id;
    out.push_back(std::move(*inf));
  }
  std::sort(out.begin(), out.end(), [](const CheckpointInfo& a, const CheckpointInfo& b) {
    return a.account_id < b.account_id;
  });
  return out;
}

}  // namespace pacer
