#include "runtime/binaryen/wasm_executor.hpp"

#include <binaryen/wasm-interpreter.h>

OUTCOME_CPP_DEFINE_CATEGORY_3(wasmbridge::runtime::binaryen,
                              WasmExecutor::Error,
                              e) {
  using E = wasmbridge::runtime::binaryen::WasmExecutor::Error;
  switch (e) {
    case E::EXECUTION_TRAPPED:
      return "The guest trapped during execution";
    case E::EXIT_REQUESTED:
      return "The guest called proc_exit";
    case E::INSTANTIATION_TRAPPED:
      return "The guest trapped while being instantiated";
  }
  return "Unknown error";
}

namespace wasmbridge::runtime::binaryen {

  outcome::result<std::unique_ptr<wasm::ModuleInstance>>
  WasmExecutor::instantiate(wasm::Module &module,
                            RuntimeExternalInterface &rei) {
    try {
      return std::make_unique<wasm::ModuleInstance>(module, &rei);
    } catch (wasm::TrapException &) {
      return Error::INSTANTIATION_TRAPPED;
    } catch (wasm::ExitException &) {
      return Error::INSTANTIATION_TRAPPED;
    }
  }

  outcome::result<wasm::Literal> WasmExecutor::call(
      wasm::ModuleInstance &instance,
      wasm::Name method_name,
      const std::vector<wasm::Literal> &args) {
    try {
      return instance.callExport(method_name, args);
    } catch (wasm::ExitException &) {
      return Error::EXIT_REQUESTED;
    } catch (wasm::TrapException &) {
      return Error::EXECUTION_TRAPPED;
    }
  }

}  // namespace wasmbridge::runtime::binaryen
