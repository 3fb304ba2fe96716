#include "storage/in_memory/memory_stream_server.hpp"

#include <algorithm>

#include "scale/scale.hpp"
#include "storage/chunk_store_error.hpp"

namespace csync::storage {

  MemoryStreamServer::MemoryStreamServer(
      std::shared_ptr<MemoryChunkStore> store, size_t batch_size)
      : store_(std::move(store)), batch_size_(std::max<size_t>(1, batch_size)) {}

  outcome::result<network::stream::Batch> MemoryStreamServer::SetNextBatch(
      uint64_t from, uint64_t to) {
    auto size = store_->size();
    if (from > size) {
      return ChunkStoreError::INVALID_RANGE;
    }
    auto last = std::min<uint64_t>(from + batch_size_, size);
    if (to != 0) {
      last = std::min(last, to);
    }

    network::stream::Batch batch;
    if (last <= from) {
      batch.from = from;
      batch.to = from;
      return batch;
    }

    OUTCOME_TRY(hashes, store_->sequence(from + 1, last));
    batch.from = from + 1;
    batch.to = last;
    batch.hashes.reserve(hashes.size() * network::stream::kHashSize);
    for (const auto &hash : hashes) {
      batch.hashes.insert(batch.hashes.end(), hash.begin(), hash.end());
    }
    // the handover proof attests the range served
    OUTCOME_TRY(proof, scale::encode(batch.from, batch.to));
    batch.proof.payload = std::move(proof);
    return batch;
  }

  outcome::result<scale::ByteArray> MemoryStreamServer::GetData(
      const base::Hash256 &hash) {
    return store_->get(hash);
  }

  void MemoryStreamServer::Close() {
    closed_ = true;
  }

}  // namespace csync::storage
