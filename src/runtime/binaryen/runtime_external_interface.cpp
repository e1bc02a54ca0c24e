#include "runtime/binaryen/runtime_external_interface.hpp"

#include <boost/assert.hpp>

namespace wasmbridge::runtime::binaryen {

  namespace {
    wasm::Literal errnoLiteral(wasi::Errno value) {
      return wasm::Literal(static_cast<int32_t>(value));
    }

    uint32_t u32(const wasm::Literal &literal) {
      return static_cast<uint32_t>(literal.geti32());
    }
  }  // namespace

  RuntimeExternalInterface::RuntimeExternalInterface(
      std::shared_ptr<wasi::WasiHost> host)
      : host_{std::move(host)},
        memory_{std::make_shared<WasmMemoryImpl>(&(ShellExternalInterface::memory))} {
    BOOST_ASSERT(host_);
  }

  void RuntimeExternalInterface::init(wasm::Module &wasm,
                                      wasm::ModuleInstance &instance) {
    ShellExternalInterface::init(wasm, instance);
    memory_->setSize(static_cast<uint64_t>(wasm.memory.initial)
                     * wasm::Memory::kPageSize);
  }

  void RuntimeExternalInterface::growMemory(wasm::Address old_size,
                                            wasm::Address new_size) {
    ShellExternalInterface::growMemory(old_size, new_size);
    memory_->setSize(static_cast<uint64_t>(new_size));
  }

  void RuntimeExternalInterface::trap(const char *why) {
    last_trap_message_ = why;
    logger_->debug("Trap: {}", why);
    throw wasm::TrapException();
  }

  void RuntimeExternalInterface::checkArguments(std::string_view extern_name,
                                                size_t expected,
                                                size_t actual) {
    if (expected != actual) {
      logger_->error(
          "Wrong number of arguments in {}. Expected: {}. Actual: {}",
          extern_name,
          expected,
          actual);
      trap("Invalid number of arguments");
    }
  }

  wasm::Literal RuntimeExternalInterface::callImport(
      wasm::Function *import, wasm::LiteralList &arguments) {
    std::string_view module_name = import->module.c_str();
    std::string_view name = import->base.c_str();
    if (!wasi::WasiHost::isWasiModule(module_name)) {
      // rejected before instantiation, only reachable through a bug
      trap("Call of an unresolved import");
    }
    return callWasi(name, arguments);
  }

  wasm::Literal RuntimeExternalInterface::callWasi(
      std::string_view name, wasm::LiteralList &arguments) {
    const auto &a = arguments;

    if (name == "args_sizes_get") {
      checkArguments(name, 2, a.size());
      return errnoLiteral(host_->argsSizesGet(u32(a[0]), u32(a[1])));
    }
    if (name == "args_get") {
      checkArguments(name, 2, a.size());
      return errnoLiteral(host_->argsGet(u32(a[0]), u32(a[1])));
    }
    if (name == "environ_sizes_get") {
      checkArguments(name, 2, a.size());
      return errnoLiteral(host_->environSizesGet(u32(a[0]), u32(a[1])));
    }
    if (name == "environ_get") {
      checkArguments(name, 2, a.size());
      return errnoLiteral(host_->environGet(u32(a[0]), u32(a[1])));
    }
    if (name == "fd_write") {
      checkArguments(name, 4, a.size());
      return errnoLiteral(
          host_->fdWrite(u32(a[0]), u32(a[1]), u32(a[2]), u32(a[3])));
    }
    if (name == "fd_read") {
      checkArguments(name, 4, a.size());
      return errnoLiteral(
          host_->fdRead(u32(a[0]), u32(a[1]), u32(a[2]), u32(a[3])));
    }
    if (name == "fd_seek") {
      checkArguments(name, 4, a.size());
      return errnoLiteral(
          host_->fdSeek(u32(a[0]), a[1].geti64(), u32(a[2]), u32(a[3])));
    }
    if (name == "fd_tell") {
      checkArguments(name, 2, a.size());
      return errnoLiteral(host_->fdTell(u32(a[0]), u32(a[1])));
    }
    if (name == "fd_close") {
      checkArguments(name, 1, a.size());
      return errnoLiteral(host_->fdClose(u32(a[0])));
    }
    if (name == "fd_sync" || name == "fd_datasync") {
      checkArguments(name, 1, a.size());
      return errnoLiteral(host_->fdSync(u32(a[0])));
    }
    if (name == "fd_fdstat_get") {
      checkArguments(name, 2, a.size());
      return errnoLiteral(host_->fdFdstatGet(u32(a[0]), u32(a[1])));
    }
    if (name == "fd_filestat_get") {
      checkArguments(name, 2, a.size());
      return errnoLiteral(host_->fdFilestatGet(u32(a[0]), u32(a[1])));
    }
    if (name == "fd_filestat_set_size") {
      checkArguments(name, 2, a.size());
      return errnoLiteral(host_->fdFilestatSetSize(
          u32(a[0]), static_cast<uint64_t>(a[1].geti64())));
    }
    if (name == "fd_prestat_get") {
      checkArguments(name, 2, a.size());
      return errnoLiteral(host_->fdPrestatGet(u32(a[0]), u32(a[1])));
    }
    if (name == "fd_prestat_dir_name") {
      checkArguments(name, 3, a.size());
      return errnoLiteral(
          host_->fdPrestatDirName(u32(a[0]), u32(a[1]), u32(a[2])));
    }
    if (name == "sched_yield") {
      checkArguments(name, 0, a.size());
      return errnoLiteral(host_->schedYield());
    }
    if (name == "proc_exit") {
      checkArguments(name, 1, a.size());
      host_->procExit(a[0].geti32());
      throw wasm::ExitException();
    }

    return errnoLiteral(host_->unsupported(name));
  }

}  // namespace wasmbridge::runtime::binaryen
