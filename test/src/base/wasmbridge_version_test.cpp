#include "base/wasmbridge_version.hpp"

#include <string>

#include <gtest/gtest.h>

#include "base/wbv.h"

using namespace wasmbridge::version;

/**
 * @given the version generated from the project
 * @when the numbers and strings are queried
 * @then they all describe the same version
 */
TEST(WasmBridgeVersion, ComponentsMatchStrings) {
  EXPECT_EQ(WasmBridgeVersionMajor(), WASMBRIDGE_VERSION_MAJOR);
  EXPECT_EQ(WasmBridgeVersionMinor(), WASMBRIDGE_VERSION_MINOR);
  EXPECT_EQ(WasmBridgeVersionPatch(), WASMBRIDGE_VERSION_PATCH);

  auto expected = std::to_string(WasmBridgeVersionMajor()) + "."
                  + std::to_string(WasmBridgeVersionMinor()) + "."
                  + std::to_string(WasmBridgeVersionPatch());
  EXPECT_EQ(WasmBridgeVersionString(), expected);
  EXPECT_EQ(std::string(WasmBridgeVersionText()),
            "WasmBridge Runtime v" + expected);
}

/**
 * @given the display text
 * @when it is queried twice
 * @then the same static buffer is returned
 */
TEST(WasmBridgeVersion, TextIsStable) {
  EXPECT_EQ(WasmBridgeVersionText(), WasmBridgeVersionText());
}
