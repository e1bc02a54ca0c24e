#pragma once

#include <cstdint>
#include <string>

namespace wasmbridge
{
    namespace version
    {
        /**
         * @brief Retrieves the major version of WasmBridge.
         */
        uint32_t WasmBridgeVersionMajor();

        /**
         * @brief Retrieves the minor version of WasmBridge.
         */
        uint32_t WasmBridgeVersionMinor();

        /**
         * @brief Retrieves the patch version of WasmBridge.
         */
        uint32_t WasmBridgeVersionPatch();

        /**
         * @brief Retrieves the short version string of WasmBridge, e.g. "1.0.0".
         */
        std::string WasmBridgeVersionString();

        /**
         * @brief Retrieves the display version text of WasmBridge,
         * "WasmBridge Runtime v" followed by WasmBridgeVersionString().
         *
         * @return NUL-terminated string with static storage duration.
         */
        const char *WasmBridgeVersionText();
    }
}
