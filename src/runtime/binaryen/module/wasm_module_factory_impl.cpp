#include "runtime/binaryen/module/wasm_module_factory_impl.hpp"

#include "runtime/binaryen/module/wasm_module_impl.hpp"

namespace wasmbridge::runtime::binaryen {

  outcome::result<std::unique_ptr<WasmModule>>
  WasmModuleFactoryImpl::createModule(gsl::span<const uint8_t> code) const {
    OUTCOME_TRY(module, WasmModuleImpl::createFromCode(code));
    return std::unique_ptr<WasmModule>(std::move(module));
  }

}  // namespace wasmbridge::runtime::binaryen
