
#ifndef CHUNKSYNC_APPLICATION_CONFIG_READER_ERROR_HPP
#define CHUNKSYNC_APPLICATION_CONFIG_READER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace csync::application {

  /**
   * Codes for errors that originate in configuration readers
   */
  enum class ConfigReaderError {
    MISSING_ENTRY = 1,
    PARSER_ERROR,
    INVALID_VALUE
  };

}

OUTCOME_HPP_DECLARE_ERROR_2(csync::application, ConfigReaderError);

#endif  // CHUNKSYNC_APPLICATION_CONFIG_READER_ERROR_HPP
