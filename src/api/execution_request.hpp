#ifndef WASMBRIDGE_SRC_API_EXECUTION_REQUEST_HPP
#define WASMBRIDGE_SRC_API_EXECUTION_REQUEST_HPP

#include <string>
#include <vector>

#include <gsl/span>

#include "config/runtime_config.hpp"
#include "wasi/wasi_types.hpp"

namespace wasmbridge::api {

  /// host descriptor value that leaves a guest stream at its default
  constexpr int kUnboundDescriptor = -1;

  /**
   * @brief Everything one guest run needs. The binary is borrowed for the
   * duration of the call.
   */
  struct ExecutionRequest {
    gsl::span<const uint8_t> wasm;
    /// guest arguments after argv[0]
    std::vector<std::string> args;
    wasi::Environment environment;
    int stdin_fd = kUnboundDescriptor;
    int stdout_fd = kUnboundDescriptor;
    int stderr_fd = kUnboundDescriptor;
    config::RuntimeConfig config;
  };

}  // namespace wasmbridge::api

#endif  // WASMBRIDGE_SRC_API_EXECUTION_REQUEST_HPP
