#ifndef CHUNKSYNC_SCALE_TYPES_HPP
#define CHUNKSYNC_SCALE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace csync::scale {
  /**
   * @brief convenience alias for arrays of bytes
   */
  using ByteArray = std::vector<uint8_t>;
}  // namespace csync::scale

namespace csync::scale::compact {
  /**
   * @brief categories of compact encoding
   */
  struct EncodingCategoryLimits {
    // min integer encoded by 2 bytes
    constexpr static size_t kMinUint16 = (1ul << 6u);
    // min integer encoded by 4 bytes
    constexpr static size_t kMinUint32 = (1ul << 14u);
    // min integer encoded as multibyte
    constexpr static size_t kMinBigInteger = (1ul << 30u);
  };
}  // namespace csync::scale::compact
#endif  // CHUNKSYNC_SCALE_TYPES_HPP
