#ifndef CHUNKSYNC_STORAGE_CHUNK_ADDRESS_HPP
#define CHUNKSYNC_STORAGE_CHUNK_ADDRESS_HPP

#include <gsl/span>

#include "base/blob.hpp"

namespace csync::storage {

  /**
   * Content address of a chunk: SHA-256 of its bytes
   */
  base::Hash256 chunkAddress(gsl::span<const uint8_t> data);

}  // namespace csync::storage

#endif  // CHUNKSYNC_STORAGE_CHUNK_ADDRESS_HPP
