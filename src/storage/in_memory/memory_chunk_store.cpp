#include "storage/in_memory/memory_chunk_store.hpp"

#include "storage/chunk_address.hpp"
#include "storage/chunk_store_error.hpp"

namespace csync::storage {

  base::Hash256 MemoryChunkStore::put(const scale::ByteArray &data) {
    auto hash = chunkAddress(data);
    std::shared_ptr<FetchHandle> waiting;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      insert(hash, data);
      auto it = fetches_.find(hash);
      if (it != fetches_.end()) {
        waiting = std::move(it->second);
        fetches_.erase(it);
      }
    }
    if (waiting) {
      waiting->Resolve(outcome::success());
    }
    return hash;
  }

  outcome::result<void> MemoryChunkStore::put(const base::Hash256 &hash,
                                              const scale::ByteArray &data) {
    bool valid = chunkAddress(data) == hash;
    std::shared_ptr<FetchHandle> waiting;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (valid && insert(hash, data)) {
        logger_->debug("Chunk {} stored, {} bytes", hash.toHex(), data.size());
      }
      auto it = fetches_.find(hash);
      if (it != fetches_.end()) {
        waiting = std::move(it->second);
        fetches_.erase(it);
      }
    }

    if (!valid) {
      logger_->warn("Chunk delivered for {} does not match it", hash.toHex());
      if (waiting) {
        waiting->Resolve(outcome::failure(
            make_error_code(ChunkStoreError::INVALID_CHUNK)));
      }
      return ChunkStoreError::INVALID_CHUNK;
    }
    if (waiting) {
      waiting->Resolve(outcome::success());
    }
    return outcome::success();
  }

  outcome::result<scale::ByteArray> MemoryChunkStore::get(
      const base::Hash256 &hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(hash);
    if (it == chunks_.end()) {
      return ChunkStoreError::NOT_FOUND;
    }
    return it->second;
  }

  bool MemoryChunkStore::contains(const base::Hash256 &hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.count(hash) != 0;
  }

  std::shared_ptr<MemoryChunkStore::FetchHandle> MemoryChunkStore::needData(
      const base::Hash256 &hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunks_.count(hash) != 0) {
      return nullptr;
    }
    auto &handle = fetches_[hash];
    if (!handle) {
      handle = std::make_shared<FetchHandle>();
    }
    return handle;
  }

  outcome::result<std::vector<base::Hash256>> MemoryChunkStore::sequence(
      uint64_t first, uint64_t last) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (first == 0 || first > last || last > sequence_.size()) {
      return ChunkStoreError::INVALID_RANGE;
    }
    return std::vector<base::Hash256>(sequence_.begin() + (first - 1),
                                      sequence_.begin() + last);
  }

  uint64_t MemoryChunkStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_.size();
  }

  size_t MemoryChunkStore::pendingFetches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetches_.size();
  }

  void MemoryChunkStore::abortFetches() {
    std::unordered_map<base::Hash256, std::shared_ptr<FetchHandle>> fetches;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      fetches.swap(fetches_);
    }
    for (auto &fetch : fetches) {
      fetch.second->Abort();
    }
  }

  bool MemoryChunkStore::insert(const base::Hash256 &hash,
                                const scale::ByteArray &data) {
    if (!chunks_.emplace(hash, data).second) {
      return false;
    }
    sequence_.push_back(hash);
    return true;
  }

}  // namespace csync::storage
