#ifndef CHUNKSYNC_BLOB_HPP
#define CHUNKSYNC_BLOB_HPP

#include <array>
#include <cstddef>
#include <ostream>
#include <string>

#include <boost/functional/hash.hpp>
#include "base/hexutil.hpp"

namespace csync::base {

  using byte_t = uint8_t;

  /**
   * Fixed size byte string. Chunk addresses are Hash256 blobs and travel
   * on the wire as their raw bytes without length prefix.
   */
  template <size_t size_>
  class Blob : public std::array<byte_t, size_> {
   public:
    Blob() {
      this->fill(0);
    }

    constexpr static size_t size() {
      return size_;
    }

    /// lower case hex, the form addresses are logged in
    [[nodiscard]] std::string toHex() const noexcept {
      return hex_lower(gsl::make_span(*this));
    }
  };

  extern template class Blob<32ul>;

  using Hash256 = Blob<32>;

  template <class Stream,
            size_t size,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Blob<size> &blob) {
    for (auto byte : blob) {
      s << byte;
    }
    return s;
  }

  template <class Stream,
            size_t size,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Blob<size> &blob) {
    for (auto &byte : blob) {
      s >> byte;
    }
    return s;
  }

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace csync::base

template <size_t N>
struct std::hash<csync::base::Blob<N>> {
  size_t operator()(const csync::base::Blob<N> &blob) const {
    return boost::hash_range(blob.begin(), blob.end());
  }
};

#endif  // CHUNKSYNC_BLOB_HPP
