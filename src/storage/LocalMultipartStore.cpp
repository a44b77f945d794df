// Repository: MediaForge
// Component: Local multipart object store implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/storage/LocalMultipartStore.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <dirent.h>
#include <unistd.h>

#include "mediaforge/core/Errors.hpp"
#include "mediaforge/util/FileUtil.hpp"
#include "mediaforge/util/Ids.hpp"
#include "mediaforge/util/Logger.hpp"
#include "mediaforge/util/Sha256.hpp"

namespace mediaforge::storage {

namespace {

std::string FileDigest(const std::string& path) {
  util::Sha256 hasher;
  util::ReadFileBlocks(path, [&hasher](const char* data, std::size_t len) {
    hasher.Update(data, len);
  });
  return hasher.FinalHex();
}

// Keys are caller-chosen object names; refuse anything that escapes the root.
bool IsSafeKey(const std::string& key) {
  if (key.empty() || key.front() == '/') return false;
  std::istringstream in(key);
  std::string segment;
  while (std::getline(in, segment, '/')) {
    if (segment.empty() || segment == "." || segment == "..") return false;
  }
  return true;
}

}  // namespace

LocalMultipartStore::LocalMultipartStore(std::string root)
    : root_(std::move(root)),
      objects_dir_(util::JoinPath(root_, "objects")),
      multipart_dir_(util::JoinPath(root_, ".multipart")) {
  util::MakeDirs(objects_dir_);
  util::MakeDirs(multipart_dir_);

  // Re-adopt transactions left open by a previous process.
  DIR* dir = opendir(multipart_dir_.c_str());
  if (dir == nullptr) return;
  while (struct dirent* entry = readdir(dir)) {
    const std::string txn_id = entry->d_name;
    if (txn_id == "." || txn_id == "..") continue;
    const std::string txn_dir = util::JoinPath(multipart_dir_, txn_id);
    std::ifstream manifest(util::JoinPath(txn_dir, "MANIFEST"));
    std::string first_line;
    if (!manifest || !std::getline(manifest, first_line) || first_line.rfind("key=", 0) != 0) {
      util::Logger::Warn("[LocalMultipartStore] ignoring unreadable transaction " + txn_id);
      continue;
    }
    auto txn = std::make_shared<Transaction>();
    txn->key = first_line.substr(4);
    txn->dir = txn_dir;
    transactions_.emplace(txn_id, std::move(txn));
  }
  closedir(dir);
  if (!transactions_.empty()) {
    util::Logger::Info("[LocalMultipartStore] re-adopted " +
                       std::to_string(transactions_.size()) + " open transaction(s)");
  }
}

std::string LocalMultipartStore::OpenMultipartTransaction(
    const std::string& key, const std::map<std::string, std::string>& metadata) {
  if (!IsSafeKey(key)) {
    throw PipelineError(ErrorCode::kInvalidArgument, "invalid object key: " + key);
  }
  auto txn = std::make_shared<Transaction>();
  const std::string txn_id = util::GenerateId("mpu");
  txn->key = key;
  txn->dir = util::JoinPath(multipart_dir_, txn_id);

  try {
    util::MakeDirs(txn->dir);
    std::ostringstream manifest;
    manifest << "key=" << key << "\n";
    for (const auto& [name, value] : metadata) {
      manifest << name << "=" << value << "\n";
    }
    util::WriteFileAtomic(util::JoinPath(txn->dir, "MANIFEST"), manifest.str());
  } catch (const std::exception& e) {
    throw PipelineError(ErrorCode::kBackingStoreUnavailable,
                        std::string("cannot open multipart transaction: ") + e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  transactions_.emplace(txn_id, std::move(txn));
  return txn_id;
}

std::string LocalMultipartStore::PutPart(const std::string& txn_id, int32_t part_number,
                                         const std::string& bytes) {
  if (part_number < 1) {
    throw std::invalid_argument("part number must be >= 1");
  }
  auto txn = Find(txn_id);
  if (!txn) {
    throw std::runtime_error("no such multipart transaction: " + txn_id);
  }
  {
    std::lock_guard<std::mutex> lock(txn->mutex);
    if (txn->closed) {
      throw std::runtime_error("multipart transaction closed: " + txn_id);
    }
    ++txn->in_flight;
  }

  std::string etag;
  std::string error;
  const std::string path = PartPath(*txn, part_number);
  try {
    util::WriteFileAtomic(path, bytes);
    etag = util::Sha256::HexDigest(bytes);
  } catch (const std::exception& e) {
    error = e.what();
  }

  bool closed_meanwhile = false;
  {
    std::lock_guard<std::mutex> lock(txn->mutex);
    --txn->in_flight;
    closed_meanwhile = txn->closed;
    txn->idle_cv.notify_all();
  }
  if (!error.empty()) {
    throw std::runtime_error("part " + std::to_string(part_number) + " write failed: " + error);
  }
  if (closed_meanwhile) {
    unlink(path.c_str());
    throw std::runtime_error("multipart transaction closed: " + txn_id);
  }
  return etag;
}

std::string LocalMultipartStore::CompleteMultipartTransaction(
    const std::string& txn_id, const std::vector<PartRef>& parts) {
  auto txn = Find(txn_id);
  if (!txn) {
    throw std::runtime_error("no such multipart transaction: " + txn_id);
  }
  {
    std::unique_lock<std::mutex> lock(txn->mutex);
    if (txn->closed) {
      throw std::runtime_error("multipart transaction closed: " + txn_id);
    }
    txn->closed = true;
    txn->idle_cv.wait(lock, [&txn] { return txn->in_flight == 0; });
  }

  std::map<int32_t, std::string> ordered;
  for (const auto& part : parts) ordered[part.part_number] = part.etag;

  const std::string final_path = util::JoinPath(objects_dir_, txn->key);
  const std::string tmp_path = final_path + ".assembling";
  try {
    for (const auto& [number, etag] : ordered) {
      const std::string part_path = PartPath(*txn, number);
      if (!util::PathExists(part_path)) {
        throw std::runtime_error("missing part " + std::to_string(number));
      }
      if (FileDigest(part_path) != etag) {
        throw std::runtime_error("integrity token mismatch on part " + std::to_string(number));
      }
    }
    util::MakeDirs(util::ParentDir(final_path));
    {
      std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
      if (!out) throw std::runtime_error("cannot open " + tmp_path);
      for (const auto& [number, etag] : ordered) {
        util::ReadFileBlocks(PartPath(*txn, number), [&out](const char* data, std::size_t len) {
          out.write(data, static_cast<std::streamsize>(len));
        });
      }
      out.flush();
      if (!out) throw std::runtime_error("write failed: " + tmp_path);
    }
    if (std::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
      throw std::runtime_error("cannot publish " + final_path);
    }
  } catch (const std::exception&) {
    unlink(tmp_path.c_str());
    // Leave the parts in place so the caller may abort explicitly.
    std::lock_guard<std::mutex> lock(txn->mutex);
    txn->closed = false;
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    transactions_.erase(txn_id);
  }
  try {
    util::RemoveTree(txn->dir);
  } catch (const std::exception& e) {
    util::Logger::Warn(std::string("[LocalMultipartStore] stale part directory left behind: ") +
                       e.what());
  }
  return final_path;
}

void LocalMultipartStore::AbortMultipartTransaction(const std::string& txn_id) {
  std::shared_ptr<Transaction> txn;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transactions_.find(txn_id);
    if (it == transactions_.end()) return;
    txn = it->second;
    transactions_.erase(it);
  }
  {
    std::unique_lock<std::mutex> lock(txn->mutex);
    txn->closed = true;
    txn->idle_cv.wait(lock, [&txn] { return txn->in_flight == 0; });
  }
  util::RemoveTree(txn->dir);
}

void LocalMultipartStore::ReadObject(const std::string& location,
                                     const std::function<void(const char*, std::size_t)>& sink) {
  util::ReadFileBlocks(location, sink);
}

size_t LocalMultipartStore::OpenTransactionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transactions_.size();
}

std::shared_ptr<LocalMultipartStore::Transaction> LocalMultipartStore::Find(
    const std::string& txn_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transactions_.find(txn_id);
  return it == transactions_.end() ? nullptr : it->second;
}

std::string LocalMultipartStore::PartPath(const Transaction& txn, int32_t part_number) const {
  char name[32];
  std::snprintf(name, sizeof(name), "part-%05d", part_number);
  return util::JoinPath(txn.dir, name);
}

}  // namespace mediaforge::storage
