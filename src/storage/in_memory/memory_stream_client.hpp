#ifndef CHUNKSYNC_STORAGE_IN_MEMORY_MEMORY_STREAM_CLIENT_HPP
#define CHUNKSYNC_STORAGE_IN_MEMORY_MEMORY_STREAM_CLIENT_HPP

#include <atomic>
#include <memory>

#include "network/stream/client.hpp"
#include "storage/in_memory/memory_chunk_store.hpp"

namespace csync::storage {

  /**
   * Fetches the chunks a MemoryChunkStore misses. Batches are acknowledged
   * with a takeover proof holding the address of the batch hash buffer.
   */
  class MemoryStreamClient : public network::stream::Client {
   public:
    explicit MemoryStreamClient(std::shared_ptr<MemoryChunkStore> store);

    std::shared_ptr<network::stream::FetchHandle> NeedData(
        const base::Hash256 &hash) override;

    network::stream::TakeoverFunc BatchDone(
        const network::stream::StreamID &stream,
        uint64_t from,
        const scale::ByteArray &hashes,
        const network::stream::HandoverProof &handover) override;

    void Close() override;

    uint64_t batches() const {
      return batches_.load();
    }

    bool isClosed() const {
      return closed_.load();
    }

   private:
    std::shared_ptr<MemoryChunkStore> store_;
    std::atomic<uint64_t> batches_{0};
    std::atomic<bool> closed_{false};
  };

}  // namespace csync::storage

#endif  // CHUNKSYNC_STORAGE_IN_MEMORY_MEMORY_STREAM_CLIENT_HPP
