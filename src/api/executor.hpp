#ifndef WASMBRIDGE_SRC_API_EXECUTOR_HPP
#define WASMBRIDGE_SRC_API_EXECUTOR_HPP

#include "api/execution_request.hpp"
#include "outcome/outcome.hpp"
#include "runtime/binaryen/module/wasm_module_factory.hpp"

namespace wasmbridge::api {

  /**
   * @brief Runs a guest binary on a runtime created for this call
   * @return exit code of the guest, or the failure that kept it from running
   */
  outcome::result<int32_t> executeWasm(const ExecutionRequest &request);

  /**
   * Same as above with modules compiled by \arg factory
   */
  outcome::result<int32_t> executeWasm(
      const ExecutionRequest &request,
      const runtime::binaryen::WasmModuleFactory &factory);

  /**
   * @brief Snapshot of the host process environment. Entries without a name
   * are left out.
   */
  wasi::Environment captureHostEnvironment();

}  // namespace wasmbridge::api

#endif  // WASMBRIDGE_SRC_API_EXECUTOR_HPP
