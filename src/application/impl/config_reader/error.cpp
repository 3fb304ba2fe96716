
#include "application/impl/config_reader/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(csync::application,
                              ConfigReaderError,
                              e) {
  using E = csync::application::ConfigReaderError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the provided config file";
    case E::PARSER_ERROR:
      return "Config file could not be parsed";
    case E::INVALID_VALUE:
      return "Config entry has a value outside of the accepted set";
  }
  return "Unknown error";
}
