// Repository: MediaForge
// Component: Chunk Store Interface
// Purpose: Durable multipart object store that chunks land in. Parts may
//          arrive in any order; the object exists only after Complete.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_STORAGE_I_CHUNK_STORE_HPP_
#define MEDIAFORGE_STORAGE_I_CHUNK_STORE_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace mediaforge::storage {

struct PartRef {
  int32_t part_number = 0;  // 1-based
  std::string etag;
};

// All methods may be called concurrently. Failures are reported by throwing;
// callers decide whether a failure is recoverable.
class IChunkStore {
 public:
  virtual ~IChunkStore() = default;

  // Opens a transaction for `key`. Throws PipelineError(kBackingStoreUnavailable).
  virtual std::string OpenMultipartTransaction(
      const std::string& key, const std::map<std::string, std::string>& metadata) = 0;

  // Stores one part and returns its integrity token. Re-putting a part number
  // replaces it. Throws std::runtime_error on failure or unknown/aborted txn.
  virtual std::string PutPart(const std::string& txn_id, int32_t part_number,
                              const std::string& bytes) = 0;

  // Assembles parts (ascending part number) into the final object and returns
  // its location. Throws if a part is missing or its token does not match.
  virtual std::string CompleteMultipartTransaction(const std::string& txn_id,
                                                   const std::vector<PartRef>& parts) = 0;

  // Discards all parts. Idempotent; unknown ids are ignored.
  virtual void AbortMultipartTransaction(const std::string& txn_id) = 0;

  // Streams a completed object. Throws if it cannot be read.
  virtual void ReadObject(const std::string& location,
                          const std::function<void(const char*, std::size_t)>& sink) = 0;
};

}  // namespace mediaforge::storage

#endif  // MEDIAFORGE_STORAGE_I_CHUNK_STORE_HPP_
