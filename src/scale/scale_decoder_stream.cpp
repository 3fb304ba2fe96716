#include "scale/scale_decoder_stream.hpp"

#include <system_error>

namespace csync::scale {
  namespace {
    [[noreturn]] void raise(DecodeError e) {
      throw std::system_error(make_error_code(e));
    }
  }  // namespace

  ScaleDecoderStream::ScaleDecoderStream(gsl::span<const uint8_t> span)
      : span_{span}, current_index_{0} {}

  ScaleDecoderStream &ScaleDecoderStream::operator>>(bool &v) {
    switch (nextByte()) {
      case 0u:
        v = false;
        break;
      case 1u:
        v = true;
        break;
      default:
        raise(DecodeError::UNEXPECTED_VALUE);
    }
    return *this;
  }

  ScaleDecoderStream &ScaleDecoderStream::operator>>(std::string &v) {
    auto bytes = takeBytes(decodeCompact());
    v.assign(bytes.begin(), bytes.end());
    return *this;
  }

  ScaleDecoderStream &ScaleDecoderStream::operator>>(ByteArray &v) {
    v = takeBytes(decodeCompact());
    return *this;
  }

  uint64_t ScaleDecoderStream::decodeCompact() {
    const uint8_t first = nextByte();
    const uint8_t flag = first & 0b11u;

    if (flag == 0b00u) {
      return static_cast<uint64_t>(first >> 2u);
    }

    if (flag == 0b01u) {
      uint64_t value = first;
      value |= static_cast<uint64_t>(nextByte()) << 8u;
      return value >> 2u;
    }

    if (flag == 0b10u) {
      uint64_t value = first;
      for (size_t i = 1; i < 4; ++i) {
        value |= static_cast<uint64_t>(nextByte()) << (8u * i);
      }
      return value >> 2u;
    }

    const size_t bytes = static_cast<size_t>(first >> 2u) + 4;
    if (bytes > sizeof(uint64_t)) {
      raise(DecodeError::TOO_MANY_ITEMS);
    }
    uint64_t value = 0;
    for (size_t i = 0; i < bytes; ++i) {
      value |= static_cast<uint64_t>(nextByte()) << (8u * i);
    }
    return value;
  }

  ByteArray ScaleDecoderStream::takeBytes(size_t count) {
    if (!hasMore(count)) {
      raise(DecodeError::NOT_ENOUGH_DATA);
    }
    auto begin = span_.begin() + static_cast<std::ptrdiff_t>(current_index_);
    ByteArray bytes(begin, begin + static_cast<std::ptrdiff_t>(count));
    current_index_ += count;
    return bytes;
  }

  bool ScaleDecoderStream::hasMore(uint64_t n) const {
    return static_cast<uint64_t>(span_.size()) - current_index_ >= n;
  }

  uint8_t ScaleDecoderStream::nextByte() {
    if (!hasMore(1)) {
      raise(DecodeError::NOT_ENOUGH_DATA);
    }
    return span_[static_cast<std::ptrdiff_t>(current_index_++)];
  }
}  // namespace csync::scale
