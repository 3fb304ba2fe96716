#ifndef CHUNKSYNC_STORAGE_IN_MEMORY_MEMORY_CHUNK_STORE_HPP
#define CHUNKSYNC_STORAGE_IN_MEMORY_MEMORY_CHUNK_STORE_HPP

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "base/blob.hpp"
#include "base/logger.hpp"
#include "network/stream/fetch_handle.hpp"
#include "outcome/outcome.hpp"
#include "scale/types.hpp"

namespace csync::storage {

  /**
   * Thread safe chunk store kept in memory.
   * Chunks are addressed by the SHA-256 of their bytes. Every new chunk is
   * appended to a sequence that streams are served from, positions start at 1.
   */
  class MemoryChunkStore {
   public:
    using FetchHandle = network::stream::FetchHandle;

    /**
     * Stores a chunk under its computed address
     * @return address of the chunk
     */
    base::Hash256 put(const scale::ByteArray &data);

    /**
     * Stores a chunk received for an address and resolves the fetches
     * waiting for it
     * @return INVALID_CHUNK when the bytes do not hash to the address, the
     * waiting fetches fail with it as well
     */
    outcome::result<void> put(const base::Hash256 &hash,
                              const scale::ByteArray &data);

    /**
     * @return chunk bytes, NOT_FOUND when absent
     */
    outcome::result<scale::ByteArray> get(const base::Hash256 &hash) const;

    bool contains(const base::Hash256 &hash) const;

    /**
     * @return nullptr when the chunk is present, otherwise the handle shared
     * by everyone waiting for the chunk
     */
    std::shared_ptr<FetchHandle> needData(const base::Hash256 &hash);

    /**
     * Addresses at sequence positions first..last, both inclusive
     * @return INVALID_RANGE when the range is empty or ends beyond the sequence
     */
    outcome::result<std::vector<base::Hash256>> sequence(uint64_t first,
                                                         uint64_t last) const;

    /// Number of chunks in the sequence
    uint64_t size() const;

    /// Chunks requested but not delivered yet
    size_t pendingFetches() const;

    /// Aborts every pending fetch
    void abortFetches();

   private:
    bool insert(const base::Hash256 &hash, const scale::ByteArray &data);

    mutable std::mutex mutex_;
    std::unordered_map<base::Hash256, scale::ByteArray> chunks_;
    std::vector<base::Hash256> sequence_;
    std::unordered_map<base::Hash256, std::shared_ptr<FetchHandle>> fetches_;

    base::Logger logger_ = base::createLogger("MemoryChunkStore");
  };

}  // namespace csync::storage

#endif  // CHUNKSYNC_STORAGE_IN_MEMORY_MEMORY_CHUNK_STORE_HPP
