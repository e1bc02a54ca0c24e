#include "execution/execution_driver.hpp"

#include <boost/algorithm/string/join.hpp>

#include "runtime/binaryen/wasm_executor.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(wasmbridge::execution, ExecutionDriver::Error, e) {
  using E = wasmbridge::execution::ExecutionDriver::Error;
  switch (e) {
    case E::MISSING_IMPORTS:
      return "The module imports something the host does not provide";
    case E::INSTANTIATION_FAILED:
      return "The module could not be instantiated";
    case E::INITIALIZATION_FAILED:
      return "The instance could not be bound to the session";
    case E::ENTRY_POINT_MISSING:
      return "The module exports neither _start nor main";
    case E::INVALID_STATE:
      return "The operation is not allowed in the current execution state";
  }
  return "Unknown error";
}

namespace wasmbridge::execution {

  using runtime::binaryen::ExportDescriptor;
  using runtime::binaryen::ExternalKind;
  using runtime::binaryen::WasmExecutor;

  namespace {
    int32_t resultToExitCode(const wasm::Literal &result) {
      if (result.type == wasm::Type::i32) {
        return result.geti32();
      }
      if (result.type == wasm::Type::i64) {
        return static_cast<int32_t>(result.geti64());
      }
      return 0;
    }
  }  // namespace

  ExecutionDriver::ExecutionDriver(std::shared_ptr<wasi::WasiEnv> env,
                                   size_t trail_depth)
      : env_{std::move(env)},
        host_{std::make_shared<wasi::WasiHost>(env_, trail_depth)} {}

  ExecutionDriver::~ExecutionDriver() {
    finalize();
  }

  boost::optional<EntryPoint> ExecutionDriver::resolveEntryPoint(
      const std::vector<ExportDescriptor> &exports) {
    auto has_callable = [&exports](const std::string &name) {
      for (const auto &exp : exports) {
        if (exp.name == name && exp.kind == ExternalKind::FUNCTION
            && exp.param_count == 0) {
          return true;
        }
      }
      return false;
    };
    if (has_callable(kCommandExport)) {
      return EntryPoint{EntryPointKind::COMMAND, kCommandExport};
    }
    if (has_callable(kReactorExport)) {
      return EntryPoint{EntryPointKind::REACTOR, kReactorExport};
    }
    return boost::none;
  }

  outcome::result<void> ExecutionDriver::instantiate() {
    if (state_ != ExecutionState::UNINSTANTIATED || env_->isReleased()) {
      return Error::INVALID_STATE;
    }

    const auto &module = env_->module();
    bool missing = false;
    for (const auto &import : module->imports()) {
      if (import.kind != ExternalKind::FUNCTION
          || !wasi::WasiHost::isWasiModule(import.module)) {
        logger_->error("Unresolved import {}.{}", import.module, import.name);
        missing = true;
      }
    }
    if (missing) {
      return Error::MISSING_IMPORTS;
    }

    auto instance = module->instantiate(host_);
    if (!instance) {
      if (const auto &code = env_->exitCode()) {
        logger_->debug("Guest exited with {} from its start function", *code);
        state_ = ExecutionState::RETURNED;
        return outcome::success();
      }
      logger_->error("Instantiation failed: {}", instance.error().message());
      return Error::INSTANTIATION_FAILED;
    }
    instance_ = std::move(instance.value());
    state_ = ExecutionState::INSTANTIATED;
    return outcome::success();
  }

  outcome::result<EntryPoint> ExecutionDriver::initialize() {
    if (state_ != ExecutionState::INSTANTIATED) {
      return Error::INVALID_STATE;
    }
    if (!instance_) {
      return Error::INITIALIZATION_FAILED;
    }
    env_->attachMemory(instance_->memory());

    auto exports = env_->module()->exports();
    entry_point_ = resolveEntryPoint(exports);
    if (!entry_point_) {
      std::vector<std::string> names;
      names.reserve(exports.size());
      for (const auto &exp : exports) {
        names.push_back(exp.name);
      }
      logger_->error("No entry point found, expected {} or {}. Exports: [{}]",
                     kCommandExport,
                     kReactorExport,
                     boost::algorithm::join(names, ", "));
      return Error::ENTRY_POINT_MISSING;
    }
    logger_->debug("Entry point: {}", entry_point_->name);
    state_ = ExecutionState::INITIALIZED;
    return *entry_point_;
  }

  outcome::result<ExitOutcome> ExecutionDriver::run() {
    if (state_ != ExecutionState::INITIALIZED) {
      return Error::INVALID_STATE;
    }
    state_ = ExecutionState::RUNNING;

    auto result = instance_->callExport(entry_point_->name.c_str(), {});
    if (!result) {
      state_ = ExecutionState::TRAPPED;
      return classifyFailure(result.error());
    }
    state_ = ExecutionState::RETURNED;

    if (const auto &code = env_->exitCode()) {
      return ExplicitExit{*code};
    }
    if (entry_point_->kind == EntryPointKind::COMMAND) {
      return NormalReturn{0};
    }
    return NormalReturn{resultToExitCode(result.value())};
  }

  outcome::result<ExitOutcome> ExecutionDriver::classifyFailure(
      const std::error_code &error) {
    if (error != WasmExecutor::Error::EXECUTION_TRAPPED
        && error != WasmExecutor::Error::EXIT_REQUESTED) {
      return error;
    }
    if (const auto &code = env_->exitCode()) {
      logger_->debug("Guest exited with {}", *code);
      return ExplicitExit{*code};
    }

    Trap trap{instance_->trapMessage(), host_->callTrail()};
    logger_->error("Guest trapped: {}",
                   trap.message.empty() ? error.message() : trap.message);
    for (auto it = trap.frames.rbegin(); it != trap.frames.rend(); ++it) {
      logger_->error("  after {}", *it);
    }
    return trap;
  }

  void ExecutionDriver::finalize() {
    if (state_ == ExecutionState::FINALIZED) {
      return;
    }
    instance_.reset();
    env_->release();
    state_ = ExecutionState::FINALIZED;
  }

  outcome::result<int32_t> ExecutionDriver::execute() {
    auto result = [this]() -> outcome::result<int32_t> {
      OUTCOME_TRY(instantiate());
      if (state_ == ExecutionState::RETURNED) {
        return toExitCode(ExplicitExit{*env_->exitCode()});
      }
      OUTCOME_TRY(initialize());
      OUTCOME_TRY(exit_outcome, run());
      return toExitCode(exit_outcome);
    }();
    finalize();
    return result;
  }

}  // namespace wasmbridge::execution
