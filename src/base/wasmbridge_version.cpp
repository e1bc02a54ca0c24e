/**
 * @file wasmbridge_version.cpp
 * @brief Version retrieval functions for WasmBridge.
 *
 * The version numbers come from base/wbv.h, which CMake generates from
 * project(VERSION).
 */
#include <string>
#include "base/wbv.h"
#include "base/wasmbridge_version.hpp"

uint32_t wasmbridge::version::WasmBridgeVersionMajor()
{
    return WASMBRIDGE_VERSION_MAJOR;
}

uint32_t wasmbridge::version::WasmBridgeVersionMinor()
{
    return WASMBRIDGE_VERSION_MINOR;
}

uint32_t wasmbridge::version::WasmBridgeVersionPatch()
{
    return WASMBRIDGE_VERSION_PATCH;
}

std::string wasmbridge::version::WasmBridgeVersionString()
{
    return std::to_string( WasmBridgeVersionMajor() ) + "." + std::to_string( WasmBridgeVersionMinor() ) + "." +
           std::to_string( WasmBridgeVersionPatch() );
}

const char *wasmbridge::version::WasmBridgeVersionText()
{
    static const std::string text = "WasmBridge Runtime v" + WasmBridgeVersionString();
    return text.c_str();
}
