#include "storage/chunk_store_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(csync::storage, ChunkStoreError, e) {
  using E = csync::storage::ChunkStoreError;
  switch (e) {
    case E::NOT_FOUND:
      return "chunk not found";
    case E::INVALID_RANGE:
      return "range starts beyond the stored sequence";
    case E::INVALID_CHUNK:
      return "chunk does not match its address";
  }

  return "unknown error";
}
