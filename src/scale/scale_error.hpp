#ifndef CHUNKSYNC_SCALE_ERROR_HPP
#define CHUNKSYNC_SCALE_ERROR_HPP

#include "outcome/outcome.hpp"
#include "scale/types.hpp"

namespace csync::scale {
  /**
   * @brief EncodeError enum provides error codes for Encode methods
   */
  enum class EncodeError {  // 0 is reserved for success
    TOO_MANY_ITEMS = 1,     ///< collection length does not fit into compact
  };

  /**
   * @brief DecoderError enum provides codes of errors for Decoder methods
   */
  enum class DecodeError {  // 0 is reserved for success
    NOT_ENOUGH_DATA = 1,    ///< not enough data to decode value
    UNEXPECTED_VALUE,       ///< unexpected value
    TOO_MANY_ITEMS,         ///< too many items, cannot address them in memory
    TRAILING_DATA,          ///< bytes left after the value was decoded
  };
}  // namespace csync::scale

OUTCOME_HPP_DECLARE_ERROR_2(csync::scale, EncodeError)
OUTCOME_HPP_DECLARE_ERROR_2(csync::scale, DecodeError)

#endif  // CHUNKSYNC_SCALE_ERROR_HPP
