#ifndef WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_INSTANCE_IMPL
#define WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_INSTANCE_IMPL

#include "runtime/binaryen/module/wasm_module_instance.hpp"
#include "runtime/binaryen/runtime_external_interface.hpp"

namespace wasm {
  class ModuleInstance;
}  // namespace wasm

namespace wasmbridge::runtime::binaryen {

  class WasmModuleInstanceImpl final : public WasmModuleInstance {
   public:
    /**
     * Instantiates \arg module against \arg rei. A trap or proc_exit in the
     * start function is reported as WasmExecutor::Error.
     */
    static outcome::result<std::unique_ptr<WasmModuleInstanceImpl>> create(
        wasm::Module &module, std::shared_ptr<RuntimeExternalInterface> rei);

    WasmModuleInstanceImpl(const WasmModuleInstanceImpl &) = delete;
    WasmModuleInstanceImpl &operator=(const WasmModuleInstanceImpl &) = delete;

    ~WasmModuleInstanceImpl() override;

    outcome::result<wasm::Literal> callExport(
        wasm::Name name, const std::vector<wasm::Literal> &arguments) override;

    std::shared_ptr<WasmMemory> memory() const override;

    std::string trapMessage() const override;

   private:
    WasmModuleInstanceImpl(std::shared_ptr<RuntimeExternalInterface> rei,
                           std::unique_ptr<wasm::ModuleInstance> instance,
                           bool has_memory);

    std::shared_ptr<RuntimeExternalInterface> rei_;
    std::unique_ptr<wasm::ModuleInstance> module_instance_;
    bool has_memory_;
  };

}  // namespace wasmbridge::runtime::binaryen

#endif  // WASMBRIDGE_SRC_RUNTIME_BINARYEN_MODULE_WASM_MODULE_INSTANCE_IMPL
