#ifndef CHUNKSYNC_STORAGE_IN_MEMORY_MEMORY_STREAM_SERVER_HPP
#define CHUNKSYNC_STORAGE_IN_MEMORY_MEMORY_STREAM_SERVER_HPP

#include <atomic>
#include <memory>

#include "network/stream/server.hpp"
#include "storage/in_memory/memory_chunk_store.hpp"

namespace csync::storage {

  /**
   * Serves the sequence of a MemoryChunkStore in batches of at most
   * batch_size hashes. A cursor (from, to) yields positions from + 1 up to
   * min(from + batch_size, size, to), to == 0 leaving the end open.
   */
  class MemoryStreamServer : public network::stream::Server {
   public:
    MemoryStreamServer(std::shared_ptr<MemoryChunkStore> store,
                       size_t batch_size);

    /**
     * @return empty batch when the cursor reached the end of the sequence,
     * INVALID_RANGE when it is beyond it
     */
    outcome::result<network::stream::Batch> SetNextBatch(uint64_t from,
                                                         uint64_t to) override;

    outcome::result<scale::ByteArray> GetData(
        const base::Hash256 &hash) override;

    void Close() override;

    bool isClosed() const {
      return closed_.load();
    }

   private:
    std::shared_ptr<MemoryChunkStore> store_;
    size_t batch_size_;
    std::atomic<bool> closed_{false};
  };

}  // namespace csync::storage

#endif  // CHUNKSYNC_STORAGE_IN_MEMORY_MEMORY_STREAM_SERVER_HPP
