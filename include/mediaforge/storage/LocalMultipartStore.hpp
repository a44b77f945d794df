// Repository: MediaForge
// Component: Local multipart object store
// Purpose: IChunkStore on a POSIX filesystem.
//          Layout: <root>/.multipart/<txn>/part-NNNNN, <root>/objects/<key>
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_STORAGE_LOCAL_MULTIPART_STORE_HPP_
#define MEDIAFORGE_STORAGE_LOCAL_MULTIPART_STORE_HPP_

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "mediaforge/storage/IChunkStore.hpp"

namespace mediaforge::storage {

class LocalMultipartStore : public IChunkStore {
 public:
  // Creates <root>/objects and <root>/.multipart and re-adopts transactions
  // found on disk. Throws std::runtime_error if the root is not writable.
  explicit LocalMultipartStore(std::string root);
  ~LocalMultipartStore() override = default;

  LocalMultipartStore(const LocalMultipartStore&) = delete;
  LocalMultipartStore& operator=(const LocalMultipartStore&) = delete;

  std::string OpenMultipartTransaction(
      const std::string& key, const std::map<std::string, std::string>& metadata) override;
  std::string PutPart(const std::string& txn_id, int32_t part_number,
                      const std::string& bytes) override;
  std::string CompleteMultipartTransaction(const std::string& txn_id,
                                           const std::vector<PartRef>& parts) override;
  void AbortMultipartTransaction(const std::string& txn_id) override;
  void ReadObject(const std::string& location,
                  const std::function<void(const char*, std::size_t)>& sink) override;

  // Transactions not yet completed or aborted.
  size_t OpenTransactionCount() const;

  const std::string& root() const { return root_; }

 private:
  struct Transaction {
    std::string key;
    std::string dir;
    std::mutex mutex;
    std::condition_variable idle_cv;
    int in_flight = 0;
    bool closed = false;
  };

  std::shared_ptr<Transaction> Find(const std::string& txn_id) const;
  std::string PartPath(const Transaction& txn, int32_t part_number) const;

  std::string root_;
  std::string objects_dir_;
  std::string multipart_dir_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Transaction>> transactions_;
};

}  // namespace mediaforge::storage

#endif  // MEDIAFORGE_STORAGE_LOCAL_MULTIPART_STORE_HPP_
