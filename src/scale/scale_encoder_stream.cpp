#include "scale/scale_encoder_stream.hpp"

namespace csync::scale {
  namespace {
    void encodeLittleEndian(ScaleEncoderStream &out, uint64_t value, size_t bytes) {
      for (size_t i = 0; i < bytes; ++i) {
        out.putByte(static_cast<uint8_t>(value & 0xffu));
        value >>= 8u;
      }
    }

    size_t countBytes(uint64_t value) {
      size_t counter = 0;
      do {
        ++counter;
        value >>= 8u;
      } while (value != 0);
      return counter;
    }
  }  // namespace

  ByteArray ScaleEncoderStream::data() const {
    return stream_;
  }

  ScaleEncoderStream &ScaleEncoderStream::operator<<(bool v) {
    return putByte(v ? 1u : 0u);
  }

  ScaleEncoderStream &ScaleEncoderStream::operator<<(const std::string &v) {
    encodeCompact(v.size());
    for (char c : v) {
      putByte(static_cast<uint8_t>(c));
    }
    return *this;
  }

  ScaleEncoderStream &ScaleEncoderStream::operator<<(const ByteArray &v) {
    encodeCompact(v.size());
    return putBytes(v);
  }

  ScaleEncoderStream &ScaleEncoderStream::encodeCompact(uint64_t value) {
    using Limits = compact::EncodingCategoryLimits;

    // single-byte mode
    if (value < Limits::kMinUint16) {
      return putByte(static_cast<uint8_t>(value << 2u));
    }

    // two-byte mode
    if (value < Limits::kMinUint32) {
      encodeLittleEndian(*this, (value << 2u) | 0b01u, 2);
      return *this;
    }

    // four-byte mode
    if (value < Limits::kMinBigInteger) {
      encodeLittleEndian(*this, (value << 2u) | 0b10u, 4);
      return *this;
    }

    // big-integer mode, at least four bytes follow the header
    const size_t bytes = countBytes(value);
    putByte(static_cast<uint8_t>(((bytes - 4) << 2u) | 0b11u));
    encodeLittleEndian(*this, value, bytes);
    return *this;
  }

  ScaleEncoderStream &ScaleEncoderStream::putBytes(
      gsl::span<const uint8_t> bytes) {
    stream_.insert(stream_.end(), bytes.begin(), bytes.end());
    return *this;
  }

  ScaleEncoderStream &ScaleEncoderStream::putByte(uint8_t v) {
    stream_.push_back(v);
    return *this;
  }
}  // namespace csync::scale
