#include "capi/wasmbridge.h"

#include <cstdlib>
#include <exception>
#include <mutex>

#include "api/executor.hpp"
#include "base/logger.hpp"
#include "base/utf8.hpp"
#include "base/wasmbridge_version.hpp"
#include "execution/exit_outcome.hpp"

namespace {
  using wasmbridge::api::ExecutionRequest;
  using wasmbridge::execution::kFailureExitCode;

  constexpr auto kConfigEnvironmentVariable = "WASMBRIDGE_CONFIG";

  /**
   * The configuration named by WASMBRIDGE_CONFIG, defaults otherwise. It is
   * loaded by the first call only, which also applies its log level.
   */
  const wasmbridge::config::RuntimeConfig &boundaryConfig(
      const wasmbridge::base::Logger &logger) {
    static std::once_flag once;
    static wasmbridge::config::RuntimeConfig config;
    std::call_once(once, [&logger] {
      const char *path = std::getenv(kConfigEnvironmentVariable);
      if (path == nullptr || *path == '\0') {
        return;
      }
      auto loaded = wasmbridge::config::loadRuntimeConfig(path);
      if (!loaded) {
        logger->warn("Ignoring configuration {}: {}",
                     path,
                     loaded.error().message());
        return;
      }
      config = loaded.value();
      if (auto level = wasmbridge::config::parseLogLevel(config.log_level)) {
        wasmbridge::base::setLogLevel(level.value());
      }
    });
    return config;
  }

  int32_t executeChecked(const uint8_t *wasm_bytes,
                         size_t wasm_len,
                         const char **argv,
                         size_t argc,
                         int32_t stdin_fd,
                         int32_t stdout_fd,
                         int32_t stderr_fd) {
    auto logger = wasmbridge::base::createLogger("WasmBridge");
    if (wasm_bytes == nullptr || argv == nullptr) {
      logger->error("Module bytes and argument array must not be null");
      return kFailureExitCode;
    }

    ExecutionRequest request;
    request.config = boundaryConfig(logger);

    request.wasm = gsl::span<const uint8_t>(wasm_bytes, wasm_len);
    request.args.reserve(argc);
    for (size_t i = 0; i < argc; ++i) {
      auto arg = wasmbridge::base::decodeUtf8(argv[i]);
      if (!arg) {
        logger->debug("Skipping argument {}: null or not UTF-8", i);
        continue;
      }
      request.args.push_back(std::move(*arg));
    }
    if (request.config.inherit_environment) {
      request.environment = wasmbridge::api::captureHostEnvironment();
    }
    request.stdin_fd = stdin_fd;
    request.stdout_fd = stdout_fd;
    request.stderr_fd = stderr_fd;

    auto exit_code = wasmbridge::api::executeWasm(request);
    if (!exit_code) {
      logger->error("Execution failed: {}", exit_code.error().message());
      return kFailureExitCode;
    }
    return exit_code.value();
  }
}  // namespace

int32_t wasmbridge_execute(const uint8_t *wasm_bytes,
                           size_t wasm_len,
                           const char **argv,
                           size_t argc,
                           int32_t stdin_fd,
                           int32_t stdout_fd,
                           int32_t stderr_fd) {
  try {
    return executeChecked(
        wasm_bytes, wasm_len, argv, argc, stdin_fd, stdout_fd, stderr_fd);
  } catch (const std::exception &e) {
    wasmbridge::base::createLogger("WasmBridge")
        ->critical("Execution aborted: {}", e.what());
  } catch (...) {
    wasmbridge::base::createLogger("WasmBridge")
        ->critical("Execution aborted by an unknown exception");
  }
  return kFailureExitCode;
}

int32_t wasmbridge_python_execute(const uint8_t *wasm_bytes,
                                  size_t wasm_len,
                                  const char **argv,
                                  size_t argc,
                                  int32_t stdin_fd,
                                  int32_t stdout_fd,
                                  int32_t stderr_fd) {
  return wasmbridge_execute(
      wasm_bytes, wasm_len, argv, argc, stdin_fd, stdout_fd, stderr_fd);
}

const char *wasmbridge_version(void) {
  return wasmbridge::version::WasmBridgeVersionText();
}
