#ifndef PAYCALC_WASM_EXPORTS_HPP
#define PAYCALC_WASM_EXPORTS_HPP

// C-compatible interface for JavaScript interop (WebAssembly builds) and
// other FFI callers. Results are kept in module-level buffers that stay
// valid until the next call; not safe for concurrent callers.

#include <cstdint>

#ifdef __EMSCRIPTEN__
#include <emscripten.h>
#define PAYCALC_EXPORT extern "C" EMSCRIPTEN_KEEPALIVE
#else
#define PAYCALC_EXPORT extern "C"
#endif

// Resolve one calculation. mode is "gross", "net" or "total-cost";
// payments 0 uses the country's default; negative counts are an error.
// Returns 0 on success, -1 on error (see paycalc_get_last_error).
PAYCALC_EXPORT int32_t paycalc_calculate(const char* country, const char* profile,
                                         const char* mode, double value, double expenses,
                                         int32_t payments);

// Resolve the same target in every country. Returns 0 / -1.
PAYCALC_EXPORT int32_t paycalc_compare(const char* profile, const char* mode, double value,
                                       double expenses, int32_t payments);

// JSON of the last successful paycalc_calculate / paycalc_compare
PAYCALC_EXPORT const char* paycalc_get_result_json();
PAYCALC_EXPORT int32_t paycalc_get_result_length();

// Message of the last failure, "" if the last call succeeded
PAYCALC_EXPORT const char* paycalc_get_last_error();

// {"jurisdictions": [...], "profiles": [...]}
PAYCALC_EXPORT const char* paycalc_list_json();

PAYCALC_EXPORT const char* paycalc_version();

#endif // PAYCALC_WASM_EXPORTS_HPP
