#ifndef WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_INSTANCE
#define WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_INSTANCE

#include <memory>
#include <string>
#include <vector>

#include <binaryen/literal.h>
#include <binaryen/support/name.h>

#include "outcome/outcome.hpp"
#include "runtime/wasm_memory.hpp"

namespace wasmbridge::runtime::binaryen {

  /**
   * Wrapper for wasm::ModuleInstance
   */
  class WasmModuleInstance {
   public:
    virtual ~WasmModuleInstance() = default;

    /**
     * @param name the name of a wasm function to call
     * @param arguments the list of arguments to pass to the function
     * @return whatever the export function returns, WasmExecutor::Error when
     * the guest trapped or called proc_exit
     */
    virtual outcome::result<wasm::Literal> callExport(
        wasm::Name name, const std::vector<wasm::Literal> &arguments) = 0;

    /// linear memory of the instance, empty if the module declares none
    virtual std::shared_ptr<WasmMemory> memory() const = 0;

    /// message of the most recent trap, empty if there was none
    virtual std::string trapMessage() const = 0;
  };
}  // namespace wasmbridge::runtime::binaryen

#endif  // WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_INSTANCE
