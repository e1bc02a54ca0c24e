#include "api/executor.hpp"

#include "execution/execution_driver.hpp"
#include "runtime/binaryen/module/wasm_module_factory_impl.hpp"
#include "runtime/execution_runtime.hpp"
#include "runtime/wasm_header.hpp"
#include "wasi/wasi_env_builder.hpp"

extern char **environ;

namespace wasmbridge::api {

  outcome::result<int32_t> executeWasm(const ExecutionRequest &request) {
    runtime::binaryen::WasmModuleFactoryImpl factory;
    return executeWasm(request, factory);
  }

  outcome::result<int32_t> executeWasm(
      const ExecutionRequest &request,
      const runtime::binaryen::WasmModuleFactory &factory) {
    auto logger = base::createLogger("WasmBridge");
    OUTCOME_TRY(runtime::validateWasmHeader(request.wasm));

    auto rt =
        std::make_shared<runtime::ExecutionRuntime>(request.config.stack_size);
    logger->debug("Running {} byte module on a {} byte stack",
                  request.wasm.size(),
                  rt->stackSize());

    return rt->blockOn<int32_t>([&]() -> outcome::result<int32_t> {
      OUTCOME_TRY(module, factory.createModule(request.wasm));

      wasi::WasiEnvBuilder builder;
      builder.programName(request.config.program_name)
          .args(request.args)
          .envs(request.environment)
          .bindStream(wasi::StdioStream::STDIN, request.stdin_fd)
          .bindStream(wasi::StdioStream::STDOUT, request.stdout_fd)
          .bindStream(wasi::StdioStream::STDERR, request.stderr_fd)
          .runtime(rt)
          .module(std::shared_ptr<runtime::binaryen::WasmModule>(
              std::move(module)));
      OUTCOME_TRY(env, builder.finalize());

      execution::ExecutionDriver driver(std::move(env),
                                        request.config.trap_trail_depth);
      return driver.execute();
    });
  }

  wasi::Environment captureHostEnvironment() {
    wasi::Environment environment;
    if (environ == nullptr) {
      return environment;
    }
    for (char **entry = environ; *entry != nullptr; ++entry) {
      std::string_view pair{*entry};
      auto eq = pair.find('=');
      if (eq == std::string_view::npos || eq == 0) {
        continue;
      }
      environment.emplace_back(std::string{pair.substr(0, eq)},
                               std::string{pair.substr(eq + 1)});
    }
    return environment;
  }

}  // namespace wasmbridge::api
