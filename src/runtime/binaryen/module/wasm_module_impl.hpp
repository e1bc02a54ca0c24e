#ifndef WASMBRIDGE_SRC_RUNTIME_BINARYEN_WASM_MODULE_IMPL
#define WASMBRIDGE_SRC_RUNTIME_BINARYEN_WASM_MODULE_IMPL

#include <gsl/span>

#include "base/logger.hpp"
#include "runtime/binaryen/module/wasm_module.hpp"

namespace wasm {
  class Module;
}  // namespace wasm

namespace wasmbridge::runtime::binaryen {

  /**
   * Stores a parsed and validated wasm::Module. Every instantiation gets its
   * own wasm::ModuleInstance over the shared module.
   */
  class WasmModuleImpl final : public WasmModule {
   public:
    enum class Error { EMPTY_CODE = 1, INVALID_CODE, VALIDATION_FAILED };

    WasmModuleImpl(WasmModuleImpl &&) = default;
    WasmModuleImpl &operator=(WasmModuleImpl &&) = default;

    WasmModuleImpl(const WasmModuleImpl &) = delete;
    WasmModuleImpl &operator=(const WasmModuleImpl &) = delete;

    ~WasmModuleImpl() override;

    static outcome::result<std::unique_ptr<WasmModuleImpl>> createFromCode(
        gsl::span<const uint8_t> code);

    std::vector<ImportDescriptor> imports() const override;

    std::vector<ExportDescriptor> exports() const override;

    outcome::result<std::unique_ptr<WasmModuleInstance>> instantiate(
        const std::shared_ptr<wasi::WasiHost> &host) const override;

   private:
    explicit WasmModuleImpl(std::unique_ptr<wasm::Module> &&module);

    std::unique_ptr<wasm::Module> module_;
  };

}  // namespace wasmbridge::runtime::binaryen

OUTCOME_HPP_DECLARE_ERROR_2(wasmbridge::runtime::binaryen, WasmModuleImpl::Error);

#endif  // WASMBRIDGE_SRC_RUNTIME_BINARYEN_WASM_MODULE_IMPL
