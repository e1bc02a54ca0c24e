#ifndef WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_FACTORY_IMPL
#define WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_FACTORY_IMPL

#include "runtime/binaryen/module/wasm_module_factory.hpp"

namespace wasmbridge::runtime::binaryen {

  class WasmModuleFactoryImpl final : public WasmModuleFactory {
   public:
    ~WasmModuleFactoryImpl() override = default;

    outcome::result<std::unique_ptr<WasmModule>> createModule(
        gsl::span<const uint8_t> code) const override;
  };

}  // namespace wasmbridge::runtime::binaryen

#endif  // WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_FACTORY_IMPL
