#include "capi/wasmbridge.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "testutil/io/pipe.hpp"
#include "testutil/runtime/wasm_fixtures.hpp"

using wasmbridge::test::Pipe;
namespace fixtures = wasmbridge::test::fixtures;

namespace {
  int32_t run(const std::vector<uint8_t> &wasm,
              std::vector<const char *> argv = {},
              int32_t stdout_fd = -1) {
    return wasmbridge_execute(
        wasm.data(), wasm.size(), argv.data(), argv.size(), -1, stdout_fd, -1);
  }
}  // namespace

/**
 * @given buffers that are not WebAssembly modules
 * @when they are executed
 * @then -1 is returned
 */
TEST(WasmBridgeExecuteTest, RejectsMalformedModules) {
  std::vector<uint8_t> empty;
  std::vector<uint8_t> short_header{0x00, 0x61, 0x73};
  std::vector<uint8_t> bad_magic{0x7f, 0x45, 0x4c, 0x46, 0x01, 0x00, 0x00, 0x00};
  std::vector<uint8_t> truncated{0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00,
                                 0x01, 0x05};
  const char *argv[] = {nullptr};
  EXPECT_EQ(wasmbridge_execute(empty.data(), 0, argv, 0, -1, -1, -1), -1);
  EXPECT_EQ(run(short_header), -1);
  EXPECT_EQ(run(bad_magic), -1);
  EXPECT_EQ(run(truncated), -1);
}

/**
 * @given null module or argument pointers
 * @when they are executed
 * @then -1 is returned
 */
TEST(WasmBridgeExecuteTest, RejectsNullPointers) {
  const char *argv[] = {"x"};
  EXPECT_EQ(wasmbridge_execute(nullptr, 8, argv, 1, -1, -1, -1), -1);
  EXPECT_EQ(wasmbridge_execute(fixtures::kStartOnly.data(),
                               fixtures::kStartOnly.size(),
                               nullptr,
                               0,
                               -1,
                               -1,
                               -1),
            -1);
}

/**
 * @given command and reactor modules
 * @when they are executed
 * @then their exit codes follow the entry point conventions
 */
TEST(WasmBridgeExecuteTest, EntryPoints) {
  EXPECT_EQ(run(fixtures::kStartOnly), 0);
  EXPECT_EQ(run(fixtures::kMainReturns42), 42);
  EXPECT_EQ(run(fixtures::kMainVoid), 0);
  EXPECT_EQ(run(fixtures::kMainReturnsI64), 5);
  EXPECT_EQ(run(fixtures::kStartBeforeMain), 0);
}

/**
 * @given modules without a callable entry point
 * @when they are executed
 * @then -1 is returned
 */
TEST(WasmBridgeExecuteTest, MissingEntryPoint) {
  EXPECT_EQ(run(fixtures::kExportsFooOnly), -1);
  EXPECT_EQ(run(fixtures::kMainWithParam), -1);
}

/**
 * @given guests that trap or call proc_exit
 * @when they are executed
 * @then a trap is 1 and proc_exit codes pass through
 */
TEST(WasmBridgeExecuteTest, TrapsAndExits) {
  EXPECT_EQ(run(fixtures::kStartTraps), 1);
  EXPECT_EQ(run(fixtures::kProcExit7), 7);
  EXPECT_EQ(run(fixtures::kProcExit0), 0);
}

/**
 * @given a module importing from a module other than WASI
 * @when it is executed
 * @then -1 is returned
 */
TEST(WasmBridgeExecuteTest, UnknownImportModule) {
  EXPECT_EQ(run(fixtures::kImportsUnknownModule), -1);
}

/**
 * @given a guest calling a preview1 function that is not emulated
 * @when it is executed
 * @then the call answers NOSYS
 */
TEST(WasmBridgeExecuteTest, UnsupportedWasiCallIsNosys) {
  EXPECT_EQ(run(fixtures::kUnsupportedWasiCall), 52);
}

/**
 * @given a pipe passed as the guest's stdout
 * @when the guest writes to fd 1
 * @then the bytes reach the pipe and the caller's descriptor stays open
 */
TEST(WasmBridgeExecuteTest, StdoutIsBridged) {
  Pipe out;
  ASSERT_TRUE(out.valid());
  EXPECT_EQ(run(fixtures::kWriteHiToStdout, {}, out.writeFd()), 0);
  EXPECT_TRUE(wasmbridge::test::isOpenDescriptor(out.writeFd()));
  out.closeWrite();
  EXPECT_EQ(out.readAll(), "hi\n");
}

/**
 * @given arguments with an invalid UTF-8 entry and a null entry
 * @when the guest exits with its argc
 * @then the program name and the valid arguments are counted
 */
TEST(WasmBridgeExecuteTest, InvalidArgumentsAreSkipped) {
  const char invalid[] = {'\xc3', '\x28', '\0'};
  EXPECT_EQ(run(fixtures::kExitWithArgc, {"one", "two", invalid}), 3);
  EXPECT_EQ(run(fixtures::kExitWithArgc, {"one", nullptr}), 2);
  EXPECT_EQ(run(fixtures::kExitWithArgc), 1);
}

/**
 * @given the same module
 * @when it is executed through the Python entry point
 * @then the results are identical
 */
TEST(WasmBridgeExecuteTest, PythonAlias) {
  std::vector<const char *> argv{"a", "b"};
  for (const auto *wasm : {&fixtures::kMainReturns42,
                           &fixtures::kProcExit7,
                           &fixtures::kExitWithArgc}) {
    EXPECT_EQ(wasmbridge_python_execute(
                  wasm->data(), wasm->size(), argv.data(), argv.size(), -1, -1, -1),
              wasmbridge_execute(
                  wasm->data(), wasm->size(), argv.data(), argv.size(), -1, -1, -1));
  }
}

/**
 * @given no configuration file and a log level chosen by the host
 * @when modules are executed
 * @then the host's log level is left as it was
 */
TEST(WasmBridgeExecuteTest, LogLevelLeftAloneWithoutConfig) {
  ::unsetenv("WASMBRIDGE_CONFIG");
  auto logger = spdlog::get("HostApplication");
  if (logger == nullptr) {
    logger = spdlog::stderr_color_mt("HostApplication");
  }
  spdlog::set_level(spdlog::level::warn);

  EXPECT_EQ(run(fixtures::kStartOnly), 0);
  EXPECT_EQ(run(fixtures::kMainReturns42), 42);
  EXPECT_EQ(logger->level(), spdlog::level::warn);

  spdlog::set_level(spdlog::level::info);
}

/**
 * @given the library
 * @when its version is queried
 * @then the display text is returned and stays stable
 */
TEST(WasmBridgeVersionTest, Text) {
  const char *version = wasmbridge_version();
  ASSERT_NE(version, nullptr);
  EXPECT_EQ(std::string(version).rfind("WasmBridge Runtime v", 0), 0);
  EXPECT_GT(std::strlen(version), std::strlen("WasmBridge Runtime v"));
  EXPECT_EQ(version, wasmbridge_version());
}
