#ifndef CHUNKSYNC_HEXUTIL_HPP
#define CHUNKSYNC_HEXUTIL_HPP

#include <string_view>
#include <vector>

#include <gsl/span>
#include "outcome/outcome.hpp"

namespace csync::base {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    UNKNOWN
  };

  /**
   * @brief Converts bytes to uppercase hex representation
   * @param bytes bytes to convert
   * @return hexstring
   */
  std::string hex_upper(gsl::span<const uint8_t> bytes) noexcept;

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes bytes to convert
   * @return hexstring
   */
  std::string hex_lower(gsl::span<const uint8_t> bytes) noexcept;

  /**
   * @brief Converts hex representation to bytes
   * @param hex hex string of even length, upper or lower case
   * @return result containing array of bytes if input string is hex encoded and
   * has even length
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);
}  // namespace csync::base

OUTCOME_HPP_DECLARE_ERROR_2(csync::base, UnhexError);

#endif  // CHUNKSYNC_HEXUTIL_HPP
