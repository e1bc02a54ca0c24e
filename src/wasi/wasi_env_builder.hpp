#ifndef WASMBRIDGE_SRC_WASI_WASI_ENV_BUILDER_HPP
#define WASMBRIDGE_SRC_WASI_WASI_ENV_BUILDER_HPP

#include <memory>
#include <string>
#include <vector>

#include "base/logger.hpp"
#include "outcome/outcome.hpp"
#include "wasi/wasi_env.hpp"

namespace wasmbridge::wasi {

  /**
   * @brief Assembles a WasiEnv.
   *
   * Arguments and environment variables are kept in the order they are
   * added. Stream bindings are only recorded here, the host descriptors are
   * duplicated by finalize() after the configuration has been validated, so a
   * rejected configuration never owns a duplicate.
   */
  class WasiEnvBuilder {
   public:
    enum class Error {
      ARGUMENT_CONTAINS_NUL = 1,
      ENVIRONMENT_VARIABLE_FORMAT,
      MISSING_RUNTIME,
      MISSING_MODULE
    };

    static constexpr auto kDefaultProgramName = "wasmbridge";

    WasiEnvBuilder();

    /// guest argv[0]
    WasiEnvBuilder &programName(std::string name);

    WasiEnvBuilder &arg(std::string value);
    WasiEnvBuilder &args(const std::vector<std::string> &values);

    /**
     * Sets a variable. Setting a name again replaces the value and keeps the
     * position of the first assignment.
     */
    WasiEnvBuilder &env(std::string name, std::string value);
    WasiEnvBuilder &envs(const Environment &variables);

    /**
     * Binds a guest standard stream to a duplicate of \arg host_fd. A
     * negative descriptor leaves the stream at its default.
     */
    WasiEnvBuilder &bindStream(StdioStream stream, int host_fd);

    WasiEnvBuilder &runtime(std::shared_ptr<runtime::ExecutionRuntime> rt);
    WasiEnvBuilder &module(
        std::shared_ptr<runtime::binaryen::WasmModule> module);

    /**
     * Validates the configuration and produces the session. A stream whose
     * descriptor cannot be duplicated is logged and left at its default.
     */
    outcome::result<std::shared_ptr<WasiEnv>> finalize();

   private:
    outcome::result<void> validate() const;

    std::string program_name_;
    std::vector<std::string> args_;
    Environment environment_;
    std::array<int, kStdioStreamCount> host_fds_;
    std::shared_ptr<runtime::ExecutionRuntime> runtime_;
    std::shared_ptr<runtime::binaryen::WasmModule> module_;
    base::Logger logger_ = base::createLogger("WasiEnvBuilder");
  };

}  // namespace wasmbridge::wasi

OUTCOME_HPP_DECLARE_ERROR_2(wasmbridge::wasi, WasiEnvBuilder::Error);

#endif  // WASMBRIDGE_SRC_WASI_WASI_ENV_BUILDER_HPP
