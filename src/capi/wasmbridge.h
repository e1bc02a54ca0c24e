#ifndef WASMBRIDGE_SRC_CAPI_WASMBRIDGE_H
#define WASMBRIDGE_SRC_CAPI_WASMBRIDGE_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#define WASMBRIDGE_EXPORT __declspec(dllexport)
#else
#define WASMBRIDGE_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Runs a WebAssembly command or reactor module.
 *
 * @param wasm_bytes module binary, must not be null
 * @param wasm_len length of the binary in bytes
 * @param argv guest arguments after argv[0], must not be null. Null entries
 * and entries that are not valid UTF-8 are skipped.
 * @param argc number of entries in argv
 * @param stdin_fd host descriptor duplicated as the guest's stdin, negative
 * for the host's own stdin
 * @param stdout_fd same for stdout
 * @param stderr_fd same for stderr
 * @return exit code of the guest, or -1 if the module could not be run.
 * Diagnostics are written to the host's standard error.
 */
WASMBRIDGE_EXPORT int32_t wasmbridge_execute(const uint8_t *wasm_bytes,
                                             size_t wasm_len,
                                             const char **argv,
                                             size_t argc,
                                             int32_t stdin_fd,
                                             int32_t stdout_fd,
                                             int32_t stderr_fd);

/**
 * @brief Entry point used by the Python bindings, identical to
 * wasmbridge_execute()
 */
WASMBRIDGE_EXPORT int32_t wasmbridge_python_execute(const uint8_t *wasm_bytes,
                                                    size_t wasm_len,
                                                    const char **argv,
                                                    size_t argc,
                                                    int32_t stdin_fd,
                                                    int32_t stdout_fd,
                                                    int32_t stderr_fd);

/**
 * @return "WasmBridge Runtime v<major>.<minor>.<patch>", valid for the
 * lifetime of the process
 */
WASMBRIDGE_EXPORT const char *wasmbridge_version(void);

#ifdef __cplusplus
}
#endif

#endif  // WASMBRIDGE_SRC_CAPI_WASMBRIDGE_H
