
#ifndef WASMBRIDGE_CONFIG_CONFIG_ERROR_HPP
#define WASMBRIDGE_CONFIG_CONFIG_ERROR_HPP

#include "outcome/outcome.hpp"

namespace wasmbridge::config {

  /**
   * Codes for errors that originate in the runtime configuration reader
   */
  enum class ConfigError { FILE_NOT_FOUND = 1, PARSER_ERROR, INVALID_VALUE };

}  // namespace wasmbridge::config

OUTCOME_HPP_DECLARE_ERROR_2(wasmbridge::config, ConfigError);

#endif  // WASMBRIDGE_CONFIG_CONFIG_ERROR_HPP
