#include "runtime/wasm_header.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/runtime/wasm_fixtures.hpp"

using wasmbridge::runtime::validateWasmHeader;
using wasmbridge::runtime::WasmHeaderError;

/**
 * @given binaries shorter than the 8 byte preamble
 * @when the header is validated
 * @then TOO_SMALL is reported
 */
TEST(WasmHeaderTest, TooSmall) {
  std::vector<uint8_t> empty;
  EXPECT_OUTCOME_ERROR(validateWasmHeader(empty), WasmHeaderError::TOO_SMALL);

  std::vector<uint8_t> seven{0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00};
  EXPECT_OUTCOME_ERROR(validateWasmHeader(seven), WasmHeaderError::TOO_SMALL);
}

/**
 * @given an 8 byte binary with a wrong signature
 * @when the header is validated
 * @then BAD_MAGIC is reported
 */
TEST(WasmHeaderTest, BadMagic) {
  std::vector<uint8_t> elf{0x7F, 0x45, 0x4C, 0x46, 0x01, 0x00, 0x00, 0x00};
  EXPECT_OUTCOME_ERROR(validateWasmHeader(elf), WasmHeaderError::BAD_MAGIC);
}

/**
 * @given the wasm signature followed by version 2
 * @when the header is validated
 * @then UNSUPPORTED_VERSION is reported
 */
TEST(WasmHeaderTest, UnsupportedVersion) {
  std::vector<uint8_t> v2{0x00, 0x61, 0x73, 0x6D, 0x02, 0x00, 0x00, 0x00};
  EXPECT_OUTCOME_ERROR(validateWasmHeader(v2),
                       WasmHeaderError::UNSUPPORTED_VERSION);
}

/**
 * @given the bare preamble and a complete module
 * @when the header is validated
 * @then both pass
 */
TEST(WasmHeaderTest, Valid) {
  std::vector<uint8_t> preamble{0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00, 0x00};
  EXPECT_OUTCOME_TRUE_1(validateWasmHeader(preamble));
  EXPECT_OUTCOME_TRUE_1(
      validateWasmHeader(wasmbridge::test::fixtures::kStartOnly));
}
