#include "config/config_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(wasmbridge::config, ConfigError, e) {
  using E = wasmbridge::config::ConfigError;
  switch (e) {
    case E::FILE_NOT_FOUND:
      return "The configuration file could not be opened";
    case E::PARSER_ERROR:
      return "The configuration file is not valid JSON";
    case E::INVALID_VALUE:
      return "A configuration entry has an unsupported value";
  }
  return "Unknown error";
}
