#include <binaryen/wasm.h>
#include <binaryen/wasm-interpreter.h>
#include "runtime/binaryen/module/wasm_module_instance_impl.hpp"

#include <boost/assert.hpp>

#include "runtime/binaryen/wasm_executor.hpp"

namespace wasmbridge::runtime::binaryen {

  outcome::result<std::unique_ptr<WasmModuleInstanceImpl>>
  WasmModuleInstanceImpl::create(wasm::Module &module,
                                 std::shared_ptr<RuntimeExternalInterface> rei) {
    BOOST_ASSERT(rei);
    OUTCOME_TRY(instance, WasmExecutor::instantiate(module, *rei));
    bool has_memory = module.memory.exists;
    return std::unique_ptr<WasmModuleInstanceImpl>(new WasmModuleInstanceImpl(
        std::move(rei), std::move(instance), has_memory));
  }

  WasmModuleInstanceImpl::WasmModuleInstanceImpl(
      std::shared_ptr<RuntimeExternalInterface> rei,
      std::unique_ptr<wasm::ModuleInstance> instance,
      bool has_memory)
      : rei_{std::move(rei)},
        module_instance_{std::move(instance)},
        has_memory_{has_memory} {
    BOOST_ASSERT(module_instance_);
  }

  WasmModuleInstanceImpl::~WasmModuleInstanceImpl() = default;

  outcome::result<wasm::Literal> WasmModuleInstanceImpl::callExport(
      wasm::Name name, const wasm::LiteralList &arguments) {
    return WasmExecutor::call(*module_instance_, name, arguments);
  }

  std::shared_ptr<WasmMemory> WasmModuleInstanceImpl::memory() const {
    if (!has_memory_) {
      return nullptr;
    }
    return rei_->memory();
  }

  std::string WasmModuleInstanceImpl::trapMessage() const {
    return rei_->lastTrapMessage();
  }
}  // namespace wasmbridge::runtime::binaryen
