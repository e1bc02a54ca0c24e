#ifndef WASMBRIDGE_SRC_EXECUTION_EXECUTION_DRIVER_HPP
#define WASMBRIDGE_SRC_EXECUTION_EXECUTION_DRIVER_HPP

#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "base/logger.hpp"
#include "execution/exit_outcome.hpp"
#include "outcome/outcome.hpp"
#include "runtime/binaryen/module/wasm_module.hpp"
#include "wasi/wasi_env.hpp"
#include "wasi/wasi_host.hpp"

namespace wasmbridge::execution {

  enum class ExecutionState {
    UNINSTANTIATED,
    INSTANTIATED,
    INITIALIZED,
    RUNNING,
    RETURNED,
    TRAPPED,
    FINALIZED
  };

  enum class EntryPointKind { COMMAND, REACTOR };

  struct EntryPoint {
    EntryPointKind kind;
    std::string name;
  };

  /**
   * @brief Runs a session's module from instantiation to exit code.
   *
   * Transitions: UNINSTANTIATED -> instantiate() -> INSTANTIATED (or
   * RETURNED when the start function exits) ->
   * initialize() -> INITIALIZED -> run() -> RETURNED | TRAPPED, and
   * finalize() -> FINALIZED from any state. The session is released by
   * finalize() or, at the latest, by the destructor.
   */
  class ExecutionDriver {
   public:
    enum class Error {
      MISSING_IMPORTS = 1,
      INSTANTIATION_FAILED,
      INITIALIZATION_FAILED,
      ENTRY_POINT_MISSING,
      INVALID_STATE
    };

    static constexpr auto kCommandExport = "_start";
    static constexpr auto kReactorExport = "main";

    /**
     * @param trail_depth number of host calls reported with a trap
     */
    ExecutionDriver(std::shared_ptr<wasi::WasiEnv> env, size_t trail_depth);

    ExecutionDriver(const ExecutionDriver &) = delete;
    ExecutionDriver &operator=(const ExecutionDriver &) = delete;

    ~ExecutionDriver();

    ExecutionState state() const {
      return state_;
    }

    /**
     * Checks that every import is a WASI function and instantiates the
     * module against the session. A start function that calls proc_exit
     * ends the execution here: the state becomes RETURNED with the code in
     * the session's exit-code cell.
     */
    outcome::result<void> instantiate();

    /**
     * Binds the instance memory to the session and resolves the entry point
     */
    outcome::result<EntryPoint> initialize();

    /**
     * Calls the entry point and classifies how it ended
     */
    outcome::result<ExitOutcome> run();

    /**
     * Releases the instance and the session. Idempotent.
     */
    void finalize();

    /**
     * All of the above in order. The session is finalized on every path.
     * @return exit code of the guest, or the structural failure
     */
    outcome::result<int32_t> execute();

    /**
     * "_start" if exported, else "main". Only functions without parameters
     * qualify.
     */
    static boost::optional<EntryPoint> resolveEntryPoint(
        const std::vector<runtime::binaryen::ExportDescriptor> &exports);

   private:
    outcome::result<ExitOutcome> classifyFailure(const std::error_code &error);

    std::shared_ptr<wasi::WasiEnv> env_;
    std::shared_ptr<wasi::WasiHost> host_;
    std::unique_ptr<runtime::binaryen::WasmModuleInstance> instance_;
    boost::optional<EntryPoint> entry_point_;
    ExecutionState state_ = ExecutionState::UNINSTANTIATED;
    base::Logger logger_ = base::createLogger("ExecutionDriver");
  };

}  // namespace wasmbridge::execution

OUTCOME_HPP_DECLARE_ERROR_2(wasmbridge::execution, ExecutionDriver::Error);

#endif  // WASMBRIDGE_SRC_EXECUTION_EXECUTION_DRIVER_HPP
