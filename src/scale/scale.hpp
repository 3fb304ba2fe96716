#ifndef CHUNKSYNC_SCALE_SCALE_HPP
#define CHUNKSYNC_SCALE_SCALE_HPP

#include <system_error>

#include <gsl/span>

#include "outcome/outcome.hpp"
#include "scale/scale_decoder_stream.hpp"
#include "scale/scale_encoder_stream.hpp"
#include "scale/scale_error.hpp"

namespace csync::scale {
  /**
   * @brief convenience function for encoding primitives data to stream
   * @tparam Args list of value types
   * @param args values to encode
   * @return encoded data
   */
  template <typename... Args>
  outcome::result<ByteArray> encode(const Args &... args) {
    ScaleEncoderStream s;
    try {
      (s << ... << args);
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
    return s.data();
  }

  /**
   * @brief convenience function for decoding primitives data from stream,
   * the whole span must be consumed
   * @tparam T type of value to decode
   * @param span encoded data
   * @return decoded T
   */
  template <class T>
  outcome::result<T> decode(gsl::span<const uint8_t> span) {
    ScaleDecoderStream s(span);
    T t{};
    try {
      s >> t;
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
    if (s.hasMore(1)) {
      return DecodeError::TRAILING_DATA;
    }
    return outcome::success(std::move(t));
  }
}  // namespace csync::scale

#endif  // CHUNKSYNC_SCALE_SCALE_HPP
