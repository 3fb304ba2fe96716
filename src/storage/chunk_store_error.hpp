#ifndef CHUNKSYNC_STORAGE_CHUNK_STORE_ERROR_HPP
#define CHUNKSYNC_STORAGE_CHUNK_STORE_ERROR_HPP

#include "outcome/outcome.hpp"

namespace csync::storage {

  /**
   * @brief errors of the chunk stores
   */
  enum class ChunkStoreError : int {
    NOT_FOUND = 1,  ///< no chunk under the address
    INVALID_RANGE,  ///< sequence range starts beyond the stored sequence
    INVALID_CHUNK   ///< chunk bytes do not hash to the address
  };

}  // namespace csync::storage

OUTCOME_HPP_DECLARE_ERROR_2(csync::storage, ChunkStoreError);

#endif  // CHUNKSYNC_STORAGE_CHUNK_STORE_ERROR_HPP
