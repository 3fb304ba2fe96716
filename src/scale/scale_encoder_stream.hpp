#ifndef CHUNKSYNC_SCALE_SCALE_ENCODER_STREAM_HPP
#define CHUNKSYNC_SCALE_SCALE_ENCODER_STREAM_HPP

#include <string>
#include <type_traits>

#include <boost/optional.hpp>
#include <gsl/span>

#include "scale/types.hpp"

namespace csync::scale {
  /**
   * @class ScaleEncoderStream designed to scale-encode data to stream
   */
  class ScaleEncoderStream {
   public:
    // special tag to differentiate encoder stream from others
    static constexpr auto is_encoder_stream = true;

    /**
     * @return vector of bytes containing encoded data
     */
    ByteArray data() const;

    /**
     * @brief scale-encodes any integral type except bool, little-endian
     * @tparam T integral type
     * @param v value of integral type
     * @return reference to this stream
     */
    template <typename T,
              typename I = std::decay_t<T>,
              typename = std::enable_if_t<std::is_integral<I>::value
                                          && !std::is_same<I, bool>::value>>
    ScaleEncoderStream &operator<<(T &&v) {
      auto value = static_cast<std::make_unsigned_t<I>>(v);
      for (size_t i = 0; i < sizeof(I); ++i) {
        putByte(static_cast<uint8_t>(value & 0xffu));
        value = static_cast<std::make_unsigned_t<I>>(value >> 7u >> 1u);
      }
      return *this;
    }

    /**
     * @brief scale-encodes bool value as one byte
     */
    ScaleEncoderStream &operator<<(bool v);

    /**
     * @brief scale-encodes string as compact length followed by its bytes
     */
    ScaleEncoderStream &operator<<(const std::string &v);

    /**
     * @brief scale-encodes byte collection as compact length followed by
     * the bytes
     */
    ScaleEncoderStream &operator<<(const ByteArray &v);

    /**
     * @brief scale-encodes optional value as presence byte followed by the
     * value when present
     */
    template <class T>
    ScaleEncoderStream &operator<<(const boost::optional<T> &v) {
      if (!v.has_value()) {
        return putByte(0u);
      }
      putByte(1u);
      return *this << *v;
    }

    /**
     * @brief scale-encodes unsigned integer in compact form
     * @param value length or counter to encode
     * @return reference to this stream
     */
    ScaleEncoderStream &encodeCompact(uint64_t value);

    /**
     * @brief appends raw bytes without any length prefix
     */
    ScaleEncoderStream &putBytes(gsl::span<const uint8_t> bytes);

    /**
     * @brief appends a single byte to the stream
     */
    ScaleEncoderStream &putByte(uint8_t v);

   private:
    ByteArray stream_;
  };

}  // namespace csync::scale

#endif  // CHUNKSYNC_SCALE_SCALE_ENCODER_STREAM_HPP
