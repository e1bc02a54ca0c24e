#ifndef WASMBRIDGE_SRC_RUNTIME_WASM_EXECUTOR_IMPL_HPP
#define WASMBRIDGE_SRC_RUNTIME_WASM_EXECUTOR_IMPL_HPP

#include <memory>

#include <binaryen/literal.h>
#include <binaryen/support/name.h>

#include "outcome/outcome.hpp"
#include "runtime/binaryen/runtime_external_interface.hpp"

namespace wasm {
  class ModuleInstance;
}  // namespace wasm

namespace wasmbridge::runtime::binaryen {

  /**
   * @brief WasmExecutor is the helper that turns the interpreter's unwinding
   * into error codes
   * @note This class is implementation detail and should never be used outside
   * this directory
   */
  class WasmExecutor {
   public:
    enum class Error {
      EXECUTION_TRAPPED = 1,
      EXIT_REQUESTED,
      INSTANTIATION_TRAPPED
    };

    static outcome::result<std::unique_ptr<wasm::ModuleInstance>> instantiate(
        wasm::Module &module, RuntimeExternalInterface &rei);

    static outcome::result<wasm::Literal> call(
        wasm::ModuleInstance &instance,
        wasm::Name method_name,
        const std::vector<wasm::Literal> &args);
  };

}  // namespace wasmbridge::runtime::binaryen

OUTCOME_HPP_DECLARE_ERROR_2(wasmbridge::runtime::binaryen, WasmExecutor::Error);

#endif  // WASMBRIDGE_SRC_RUNTIME_WASM_EXECUTOR_IMPL_HPP
