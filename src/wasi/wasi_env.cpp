#include "wasi/wasi_env.hpp"

#include <boost/assert.hpp>

#include "runtime/binaryen/module/wasm_module.hpp"

namespace wasmbridge::wasi {

  WasiEnv::WasiEnv(std::vector<std::string> args,
                   Environment environment,
                   Files files,
                   BoundFlags bound,
                   std::shared_ptr<runtime::ExecutionRuntime> runtime,
                   std::shared_ptr<runtime::binaryen::WasmModule> module)
      : args_{std::move(args)},
        environment_{std::move(environment)},
        files_{std::move(files)},
        bound_{bound},
        runtime_{std::move(runtime)},
        module_{std::move(module)} {
    BOOST_ASSERT(runtime_);
    BOOST_ASSERT(module_);
  }

  WasiEnv::~WasiEnv() {
    release();
  }

  std::shared_ptr<io::VirtualFile> WasiEnv::file(uint32_t fd) const {
    if (fd >= files_.size()) {
      return nullptr;
    }
    return files_[fd];
  }

  bool WasiEnv::isBound(StdioStream stream) const {
    return bound_[static_cast<size_t>(stream)];
  }

  outcome::result<void> WasiEnv::closeFile(uint32_t fd) {
    if (fd >= files_.size() || !files_[fd]) {
      return io::FsError::BAD_DESCRIPTOR;
    }
    auto file = std::move(files_[fd]);
    files_[fd].reset();
    return file->close();
  }

  void WasiEnv::attachMemory(std::shared_ptr<runtime::WasmMemory> memory) {
    memory_ = std::move(memory);
  }

  void WasiEnv::setExitCode(int32_t code) {
    if (!exit_code_) {
      exit_code_ = code;
    }
  }

  void WasiEnv::release() {
    if (released_) {
      return;
    }
    released_ = true;
    for (size_t fd = 0; fd < files_.size(); ++fd) {
      if (!files_[fd]) {
        continue;
      }
      auto res = files_[fd]->close();
      if (!res) {
        logger_->warn("Failed to release stream {}: {}", fd, res.error().message());
      }
      files_[fd].reset();
    }
    memory_.reset();
  }

}  // namespace wasmbridge::wasi
