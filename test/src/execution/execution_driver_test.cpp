#include "execution/execution_driver.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <sstream>

#include "mock/src/runtime/binaryen/wasm_module_instance_mock.hpp"
#include "mock/src/runtime/binaryen/wasm_module_mock.hpp"
#include "runtime/binaryen/wasm_executor.hpp"
#include "testutil/outcome.hpp"
#include "testutil/runtime/memory_stub.hpp"
#include "wasi/wasi_env_builder.hpp"

using namespace wasmbridge::execution;
using wasmbridge::runtime::ExecutionRuntime;
using wasmbridge::runtime::binaryen::ExportDescriptor;
using wasmbridge::runtime::binaryen::ExternalKind;
using wasmbridge::runtime::binaryen::ImportDescriptor;
using wasmbridge::runtime::binaryen::WasmExecutor;
using wasmbridge::runtime::binaryen::WasmModuleInstance;
using wasmbridge::runtime::binaryen::WasmModuleInstanceMock;
using wasmbridge::runtime::binaryen::WasmModuleMock;
using wasmbridge::test::MemoryStub;
using wasmbridge::wasi::WasiEnv;
using wasmbridge::wasi::WasiEnvBuilder;
using wasmbridge::wasi::WasiHost;

using testing::_;
using testing::Invoke;
using testing::NiceMock;
using testing::Return;

namespace {
  constexpr size_t kTrailDepth = 8;

  ExportDescriptor function(std::string name, size_t params = 0) {
    return ExportDescriptor{std::move(name), ExternalKind::FUNCTION, params};
  }

  ImportDescriptor wasiImport(std::string name) {
    return ImportDescriptor{
        "wasi_snapshot_preview1", std::move(name), ExternalKind::FUNCTION};
  }
}  // namespace

class ExecutionDriverTest : public ::testing::Test {
 public:
  void SetUp() override {
    instance = new NiceMock<WasmModuleInstanceMock>();
    instance_owner.reset(instance);
    ON_CALL(*instance, memory()).WillByDefault(Return(memory));
    ON_CALL(*module, imports())
        .WillByDefault(Return(std::vector<ImportDescriptor>{
            wasiImport("fd_write"), wasiImport("proc_exit")}));
    ON_CALL(*module, instantiate(_))
        .WillByDefault(Invoke([this](const std::shared_ptr<WasiHost> &)
                                  -> wasmbridge::outcome::result<
                                      std::unique_ptr<WasmModuleInstance>> {
          return std::move(instance_owner);
        }));

    WasiEnvBuilder builder;
    builder.runtime(std::make_shared<ExecutionRuntime>()).module(module);
    auto res = builder.finalize();
    ASSERT_TRUE(res) << res.error().message();
    env = res.value();
  }

  void exportOnly(std::vector<ExportDescriptor> exports) {
    ON_CALL(*module, exports()).WillByDefault(Return(exports));
  }

  std::shared_ptr<NiceMock<WasmModuleMock>> module =
      std::make_shared<NiceMock<WasmModuleMock>>();
  NiceMock<WasmModuleInstanceMock> *instance = nullptr;
  std::unique_ptr<WasmModuleInstance> instance_owner;
  std::shared_ptr<MemoryStub> memory = std::make_shared<MemoryStub>(64);
  std::shared_ptr<WasiEnv> env;
};

/**
 * @given a module exporting _start that returns
 * @when it is executed
 * @then the exit code is 0 and the session is released
 */
TEST_F(ExecutionDriverTest, CommandReturnsZero) {
  exportOnly({function("_start"), function("main")});
  EXPECT_CALL(*instance, callExport(wasm::Name("_start"), _))
      .WillOnce(Return(wasm::Literal()));

  ExecutionDriver driver(env, kTrailDepth);
  EXPECT_OUTCOME_TRUE(code, driver.execute());
  EXPECT_EQ(code, 0);
  EXPECT_EQ(driver.state(), ExecutionState::FINALIZED);
  EXPECT_TRUE(env->isReleased());
}

/**
 * @given a module exporting only main
 * @when main returns various values
 * @then i32 is the exit code, i64 is truncated and anything else is 0
 */
TEST_F(ExecutionDriverTest, ReactorResultConversion) {
  std::vector<std::pair<wasm::Literal, int32_t>> cases{
      {wasm::Literal(int32_t(42)), 42},
      {wasm::Literal(int32_t(-3)), -3},
      {wasm::Literal(int64_t(0x100000005)), 5},
      {wasm::Literal(1.5f), 0},
  };
  for (const auto &[literal, expected] : cases) {
    SetUp();
    exportOnly({function("main")});
    EXPECT_CALL(*instance, callExport(wasm::Name("main"), _))
        .WillOnce(Return(literal));
    ExecutionDriver driver(env, kTrailDepth);
    EXPECT_OUTCOME_TRUE(code, driver.execute());
    EXPECT_EQ(code, expected);
  }
}

/**
 * @given a module exporting neither _start nor a parameterless main
 * @when it is initialized
 * @then ENTRY_POINT_MISSING is returned and nothing is called
 */
TEST_F(ExecutionDriverTest, MissingEntryPoint) {
  exportOnly({function("foo"), function("bar"), function("main", 2)});
  EXPECT_CALL(*instance, callExport(_, _)).Times(0);

  ExecutionDriver driver(env, kTrailDepth);
  EXPECT_OUTCOME_TRUE_1(driver.instantiate());
  EXPECT_OUTCOME_ERROR(driver.initialize(),
                       ExecutionDriver::Error::ENTRY_POINT_MISSING);
  EXPECT_EQ(driver.state(), ExecutionState::INSTANTIATED);
}

/**
 * @given a module exporting foo and bar only
 * @when it is executed
 * @then the diagnostic names both exports
 */
TEST_F(ExecutionDriverTest, MissingEntryPointListsExports) {
  exportOnly({function("foo"), function("bar")});
  std::ostringstream diagnostics;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(diagnostics);
  auto logger = wasmbridge::base::createLogger("ExecutionDriver");
  logger->sinks().push_back(sink);

  auto result = ExecutionDriver(env, kTrailDepth).execute();
  logger->sinks().pop_back();

  EXPECT_OUTCOME_ERROR(result, ExecutionDriver::Error::ENTRY_POINT_MISSING);

  auto text = diagnostics.str();
  EXPECT_NE(text.find("Exports: [foo, bar]"), std::string::npos) << text;
}

/**
 * @given imports the host does not serve
 * @when the module is instantiated
 * @then MISSING_IMPORTS is returned before instantiating
 */
TEST_F(ExecutionDriverTest, MissingImports) {
  std::vector<std::vector<ImportDescriptor>> cases{
      {ImportDescriptor{"env", "foo", ExternalKind::FUNCTION}},
      {ImportDescriptor{"env", "memory", ExternalKind::MEMORY}},
      {wasiImport("fd_write"),
       ImportDescriptor{
           "wasi_snapshot_preview1", "counter", ExternalKind::GLOBAL}},
  };
  for (const auto &imports : cases) {
    SetUp();
    EXPECT_CALL(*module, imports()).WillOnce(Return(imports));
    EXPECT_CALL(*module, instantiate(_)).Times(0);
    ExecutionDriver driver(env, kTrailDepth);
    EXPECT_OUTCOME_ERROR(driver.execute(),
                         ExecutionDriver::Error::MISSING_IMPORTS);
    EXPECT_TRUE(env->isReleased());
  }
}

/**
 * @given imports from the legacy preview1 module name
 * @when the module is instantiated
 * @then they are accepted
 */
TEST_F(ExecutionDriverTest, LegacyWasiImports) {
  EXPECT_CALL(*module, imports())
      .WillOnce(Return(std::vector<ImportDescriptor>{ImportDescriptor{
          "wasi_unstable", "fd_write", ExternalKind::FUNCTION}}));
  ExecutionDriver driver(env, kTrailDepth);
  EXPECT_OUTCOME_TRUE_1(driver.instantiate());
  EXPECT_EQ(driver.state(), ExecutionState::INSTANTIATED);
}

/**
 * @given a start function that traps during instantiation
 * @when the module is instantiated
 * @then INSTANTIATION_FAILED is returned
 */
TEST_F(ExecutionDriverTest, InstantiationFailure) {
  EXPECT_CALL(*module, instantiate(_))
      .WillOnce(Invoke([](const std::shared_ptr<WasiHost> &)
                           -> wasmbridge::outcome::result<
                               std::unique_ptr<WasmModuleInstance>> {
        return WasmExecutor::Error::INSTANTIATION_TRAPPED;
      }));
  ExecutionDriver driver(env, kTrailDepth);
  EXPECT_OUTCOME_ERROR(driver.instantiate(),
                       ExecutionDriver::Error::INSTANTIATION_FAILED);
}

/**
 * @given a start function that calls proc_exit(3) during instantiation
 * @when the module is executed
 * @then the exit code is 3 and no entry point is called
 */
TEST_F(ExecutionDriverTest, ProcExitFromStartFunction) {
  exportOnly({function("_start")});
  EXPECT_CALL(*module, instantiate(_))
      .WillOnce(Invoke([this](const std::shared_ptr<WasiHost> &)
                           -> wasmbridge::outcome::result<
                               std::unique_ptr<WasmModuleInstance>> {
        env->setExitCode(3);
        return WasmExecutor::Error::INSTANTIATION_TRAPPED;
      }));
  EXPECT_CALL(*instance, callExport(_, _)).Times(0);

  ExecutionDriver driver(env, kTrailDepth);
  EXPECT_OUTCOME_TRUE(code, driver.execute());
  EXPECT_EQ(code, 3);
  EXPECT_TRUE(env->isReleased());
}

/**
 * @given an entry point that traps
 * @when it runs
 * @then a Trap carrying the message is reported with exit code 1
 */
TEST_F(ExecutionDriverTest, TrapIsReported) {
  exportOnly({function("_start")});
  EXPECT_CALL(*instance, callExport(wasm::Name("_start"), _))
      .WillOnce(Invoke([](wasm::Name, const std::vector<wasm::Literal> &)
                           -> wasmbridge::outcome::result<wasm::Literal> {
        return WasmExecutor::Error::EXECUTION_TRAPPED;
      }));
  EXPECT_CALL(*instance, trapMessage()).WillOnce(Return("unreachable"));

  ExecutionDriver driver(env, kTrailDepth);
  EXPECT_OUTCOME_TRUE_1(driver.instantiate());
  EXPECT_OUTCOME_TRUE_1(driver.initialize());
  EXPECT_OUTCOME_TRUE(exit_outcome, driver.run());
  EXPECT_EQ(driver.state(), ExecutionState::TRAPPED);

  const auto *trap = boost::get<Trap>(&exit_outcome);
  ASSERT_NE(trap, nullptr);
  EXPECT_EQ(trap->message, "unreachable");
  EXPECT_EQ(toExitCode(exit_outcome), kTrapExitCode);
}

/**
 * @given an entry point that calls proc_exit(7)
 * @when it runs
 * @then the outcome is an explicit exit with code 7
 */
TEST_F(ExecutionDriverTest, ProcExitIsExplicitExit) {
  exportOnly({function("_start")});
  EXPECT_CALL(*instance, callExport(wasm::Name("_start"), _))
      .WillOnce(Invoke([this](wasm::Name, const std::vector<wasm::Literal> &)
                           -> wasmbridge::outcome::result<wasm::Literal> {
        env->setExitCode(7);
        return WasmExecutor::Error::EXIT_REQUESTED;
      }));
  EXPECT_CALL(*instance, trapMessage()).Times(0);

  ExecutionDriver driver(env, kTrailDepth);
  EXPECT_OUTCOME_TRUE_1(driver.instantiate());
  EXPECT_OUTCOME_TRUE_1(driver.initialize());
  EXPECT_OUTCOME_TRUE(exit_outcome, driver.run());
  const auto *explicit_exit = boost::get<ExplicitExit>(&exit_outcome);
  ASSERT_NE(explicit_exit, nullptr);
  EXPECT_EQ(explicit_exit->code, 7);
}

/**
 * @given a main that records proc_exit(0) and then returns 42
 * @when it runs
 * @then the recorded exit code wins
 */
TEST_F(ExecutionDriverTest, RecordedExitWinsOverResult) {
  exportOnly({function("main")});
  EXPECT_CALL(*instance, callExport(wasm::Name("main"), _))
      .WillOnce(Invoke([this](wasm::Name, const std::vector<wasm::Literal> &)
                           -> wasmbridge::outcome::result<wasm::Literal> {
        env->setExitCode(0);
        return wasm::Literal(int32_t(42));
      }));
  ExecutionDriver driver(env, kTrailDepth);
  EXPECT_OUTCOME_TRUE(code, driver.execute());
  EXPECT_EQ(code, 0);
}

/**
 * @given a fresh driver
 * @when its steps are called out of order
 * @then INVALID_STATE is returned
 */
TEST_F(ExecutionDriverTest, StepsOutOfOrder) {
  exportOnly({function("_start")});
  ExecutionDriver driver(env, kTrailDepth);
  EXPECT_OUTCOME_ERROR(driver.initialize(),
                       ExecutionDriver::Error::INVALID_STATE);
  EXPECT_OUTCOME_ERROR(driver.run(), ExecutionDriver::Error::INVALID_STATE);
  EXPECT_OUTCOME_TRUE_1(driver.instantiate());
  EXPECT_OUTCOME_ERROR(driver.instantiate(),
                       ExecutionDriver::Error::INVALID_STATE);

  driver.finalize();
  driver.finalize();
  EXPECT_EQ(driver.state(), ExecutionState::FINALIZED);
  EXPECT_OUTCOME_ERROR(driver.run(), ExecutionDriver::Error::INVALID_STATE);
}

/**
 * @given an instantiated module
 * @when it is initialized
 * @then the instance memory is attached to the session
 */
TEST_F(ExecutionDriverTest, InitializeAttachesMemory) {
  exportOnly({function("_start")});
  ExecutionDriver driver(env, kTrailDepth);
  EXPECT_OUTCOME_TRUE_1(driver.instantiate());
  EXPECT_OUTCOME_TRUE(entry, driver.initialize());
  EXPECT_EQ(entry.kind, EntryPointKind::COMMAND);
  EXPECT_EQ(env->memory(), memory);

  driver.finalize();
  EXPECT_EQ(env->memory(), nullptr);
}

/**
 * @given export lists
 * @when the entry point is resolved
 * @then _start is preferred over main and non-functions are ignored
 */
TEST(ResolveEntryPointTest, Preference) {
  auto entry = ExecutionDriver::resolveEntryPoint(
      {function("main"), function("_start")});
  ASSERT_TRUE(entry);
  EXPECT_EQ(entry->name, "_start");
  EXPECT_EQ(entry->kind, EntryPointKind::COMMAND);

  entry = ExecutionDriver::resolveEntryPoint(
      {ExportDescriptor{"_start", ExternalKind::GLOBAL, 0}, function("main")});
  ASSERT_TRUE(entry);
  EXPECT_EQ(entry->name, "main");
  EXPECT_EQ(entry->kind, EntryPointKind::REACTOR);

  EXPECT_FALSE(ExecutionDriver::resolveEntryPoint({function("_start", 1)}));
  EXPECT_FALSE(ExecutionDriver::resolveEntryPoint({}));
}
