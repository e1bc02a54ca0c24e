#ifndef WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_FACTORY
#define WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_FACTORY

#include <gsl/span>

#include "outcome/outcome.hpp"
#include "runtime/binaryen/module/wasm_module.hpp"

namespace wasmbridge::runtime::binaryen {

  /**
   * An abstract factory to produce WasmModules
   */
  class WasmModuleFactory {
   public:
    virtual ~WasmModuleFactory() = default;

    /**
     * A module will be compiled from the provided \arg code
     * @return the module in case of success
     */
    virtual outcome::result<std::unique_ptr<WasmModule>> createModule(
        gsl::span<const uint8_t> code) const = 0;
  };

}  // namespace wasmbridge::runtime::binaryen

#endif  // WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_FACTORY
