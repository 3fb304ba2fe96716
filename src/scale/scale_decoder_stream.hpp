#ifndef CHUNKSYNC_SCALE_SCALE_DECODER_STREAM_HPP
#define CHUNKSYNC_SCALE_SCALE_DECODER_STREAM_HPP

#include <string>
#include <type_traits>

#include <boost/optional.hpp>
#include <gsl/span>

#include "scale/scale_error.hpp"
#include "scale/types.hpp"

namespace csync::scale {
  /**
   * @class ScaleDecoderStream reads scale-encoded values from a byte span.
   * Decoding failures are raised as std::system_error carrying a DecodeError.
   */
  class ScaleDecoderStream {
   public:
    // special tag to differentiate decoder stream from others
    static constexpr auto is_decoder_stream = true;

    explicit ScaleDecoderStream(gsl::span<const uint8_t> span);

    /**
     * @brief scale-decodes any integral type except bool, little-endian
     * @tparam T integral type
     * @param v value to decode into
     * @return reference to this stream
     */
    template <typename T,
              typename I = std::decay_t<T>,
              typename = std::enable_if_t<std::is_integral<I>::value
                                          && !std::is_same<I, bool>::value>>
    ScaleDecoderStream &operator>>(T &v) {
      std::make_unsigned_t<I> value = 0;
      for (size_t i = 0; i < sizeof(I); ++i) {
        value = static_cast<std::make_unsigned_t<I>>(
            value
            | (static_cast<std::make_unsigned_t<I>>(nextByte()) << (8u * i)));
      }
      v = static_cast<I>(value);
      return *this;
    }

    /**
     * @brief scale-decodes bool, only 0 and 1 are accepted
     */
    ScaleDecoderStream &operator>>(bool &v);

    /**
     * @brief scale-decodes compact-length prefixed string
     */
    ScaleDecoderStream &operator>>(std::string &v);

    /**
     * @brief scale-decodes compact-length prefixed byte collection
     */
    ScaleDecoderStream &operator>>(ByteArray &v);

    /**
     * @brief scale-decodes optional value
     */
    template <class T>
    ScaleDecoderStream &operator>>(boost::optional<T> &v) {
      bool present = false;
      *this >> present;
      if (!present) {
        v = boost::none;
        return *this;
      }
      T value{};
      *this >> value;
      v = std::move(value);
      return *this;
    }

    /**
     * @brief decodes unsigned integer in compact form
     */
    uint64_t decodeCompact();

    /**
     * @brief reads exactly `count` raw bytes
     */
    ByteArray takeBytes(size_t count);

    /**
     * @brief checks whether n more bytes are available
     * @param n number of bytes to check
     * @return true if n more bytes are available and false otherwise
     */
    bool hasMore(uint64_t n) const;

    /**
     * @brief takes one byte from stream and advances current byte iterator
     * by one
     * @return current byte
     */
    uint8_t nextByte();

   private:
    gsl::span<const uint8_t> span_;
    size_t current_index_;
  };

}  // namespace csync::scale

#endif  // CHUNKSYNC_SCALE_SCALE_DECODER_STREAM_HPP
