#include "storage/in_memory/memory_stream_client.hpp"

#include "storage/chunk_address.hpp"

namespace csync::storage {

  MemoryStreamClient::MemoryStreamClient(
      std::shared_ptr<MemoryChunkStore> store)
      : store_(std::move(store)) {}

  std::shared_ptr<network::stream::FetchHandle> MemoryStreamClient::NeedData(
      const base::Hash256 &hash) {
    return store_->needData(hash);
  }

  network::stream::TakeoverFunc MemoryStreamClient::BatchDone(
      const network::stream::StreamID &,
      uint64_t,
      const scale::ByteArray &hashes,
      const network::stream::HandoverProof &) {
    ++batches_;
    auto address = chunkAddress(hashes);
    return [address]() -> outcome::result<network::stream::TakeoverProof> {
      return network::stream::TakeoverProof{
          scale::ByteArray(address.begin(), address.end())};
    };
  }

  void MemoryStreamClient::Close() {
    closed_ = true;
  }

}  // namespace csync::storage
