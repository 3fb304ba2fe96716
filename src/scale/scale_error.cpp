#include "scale/scale_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(csync::scale, EncodeError, e) {
  using csync::scale::EncodeError;
  switch (e) {
    case EncodeError::TOO_MANY_ITEMS:
      return "collection is too big to be compact-encoded";
  }
  return "unknown EncodeError";
}

OUTCOME_CPP_DEFINE_CATEGORY_3(csync::scale, DecodeError, e) {
  using csync::scale::DecodeError;
  switch (e) {
    case DecodeError::NOT_ENOUGH_DATA:
      return "not enough data to decode";
    case DecodeError::UNEXPECTED_VALUE:
      return "unexpected value occured";
    case DecodeError::TOO_MANY_ITEMS:
      return "collection has too many items, unable to unpack";
    case DecodeError::TRAILING_DATA:
      return "data left after decoding";
  }
  return "unknown DecodeError";
}
