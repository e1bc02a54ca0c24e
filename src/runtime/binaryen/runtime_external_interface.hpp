#ifndef WASMBRIDGE_SRC_RUNTIME_BINARYEN_RUNTIME_EXTERNAL_INTERFACE_HPP
#define WASMBRIDGE_SRC_RUNTIME_BINARYEN_RUNTIME_EXTERNAL_INTERFACE_HPP

#include <binaryen/shell-interface.h>

#include "base/logger.hpp"
#include "runtime/binaryen/wasm_memory_impl.hpp"
#include "wasi/wasi_host.hpp"

namespace wasmbridge::runtime::binaryen {

  /**
   * Routes the guest's wasi_snapshot_preview1 imports to a WasiHost and keeps
   * the host view of the linear memory in sync with the interpreter
   */
  class RuntimeExternalInterface : public wasm::ShellExternalInterface {
   public:
    explicit RuntimeExternalInterface(std::shared_ptr<wasi::WasiHost> host);

    void init(wasm::Module &wasm, wasm::ModuleInstance &instance) override;

    wasm::Literal callImport(wasm::Function *import,
                             wasm::LiteralList &arguments) override;

    void growMemory(wasm::Address old_size, wasm::Address new_size) override;

    /**
     * Remembers \arg why and unwinds the interpreter with
     * wasm::TrapException
     */
    void trap(const char *why) override;

    std::shared_ptr<WasmMemory> memory() const {
      return memory_;
    }

    const std::string &lastTrapMessage() const {
      return last_trap_message_;
    }

   private:
    /**
     * Checks that the number of arguments is as expected and traps if it is
     * not
     */
    void checkArguments(std::string_view extern_name,
                        size_t expected,
                        size_t actual);

    wasm::Literal callWasi(std::string_view name,
                           wasm::LiteralList &arguments);

    std::shared_ptr<wasi::WasiHost> host_;
    std::shared_ptr<WasmMemoryImpl> memory_;
    std::string last_trap_message_;
    base::Logger logger_ = base::createLogger(kDefaultLoggerTag);

    constexpr static auto kDefaultLoggerTag = "Runtime external interface";
  };

}  // namespace wasmbridge::runtime::binaryen

#endif  // WASMBRIDGE_SRC_RUNTIME_BINARYEN_RUNTIME_EXTERNAL_INTERFACE_HPP
