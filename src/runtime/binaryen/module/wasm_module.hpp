#ifndef WASMBRIDGE_SRC_RUNTIME_BINARYEN_WASM_MODULE
#define WASMBRIDGE_SRC_RUNTIME_BINARYEN_WASM_MODULE

#include <memory>
#include <string>
#include <vector>

#include "outcome/outcome.hpp"
#include "runtime/binaryen/module/wasm_module_instance.hpp"

namespace wasmbridge::wasi {
  class WasiHost;
}

namespace wasmbridge::runtime::binaryen {

  enum class ExternalKind { FUNCTION, TABLE, MEMORY, GLOBAL, OTHER };

  struct ImportDescriptor {
    std::string module;
    std::string name;
    ExternalKind kind;
  };

  struct ExportDescriptor {
    std::string name;
    ExternalKind kind;
    /// number of parameters, 0 for anything but functions
    size_t param_count;
  };

  /**
   * A wrapper for binaryen's wasm::Module and wasm::ModuleInstance
   */
  class WasmModule {
   public:
    virtual ~WasmModule() = default;

    /// declared imports, in module order
    virtual std::vector<ImportDescriptor> imports() const = 0;

    /// declared exports, in module order
    virtual std::vector<ExportDescriptor> exports() const = 0;

    /**
     * Creates an instance whose imports are served by \arg host. Runs the
     * module's start function.
     */
    virtual outcome::result<std::unique_ptr<WasmModuleInstance>> instantiate(
        const std::shared_ptr<wasi::WasiHost> &host) const = 0;
  };

}  // namespace wasmbridge::runtime::binaryen

#endif  // WASMBRIDGE_SRC_RUNTIME_BINARYEN_WASM_MODULE
