#pragma once

/**
 * @file hex.hpp
 * @brief Hex rendering for diagnostics, plus an opt-in byte tracer.
 *
 * ToHex is used for public values (nonces, share names, public keys).
 * CHACHAMIR_TRACE_BYTES prints arbitrary buffers and compiles to nothing
 * unless CHACHAMIR_DEBUG_TRACE is defined. Never enable it in release
 * builds: traced buffers may include key shares.
 *
 * Enable via CMake: -DCHACHAMIR_DEBUG_TRACE=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace chachamir::debug {

/**
 * @brief Converts bytes to lowercase hex string.
 */
inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 32) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

}

#ifdef CHACHAMIR_DEBUG_TRACE

#define CHACHAMIR_TRACE_BYTES(operation, label, data) \
    do { \
        fprintf(stderr, "[CCM-TRACE] %s %s: %s\n", \
            operation, \
            label, \
            ::chachamir::debug::ToHexTruncated(data).c_str()); \
    } while (0)

#else

#define CHACHAMIR_TRACE_BYTES(operation, label, data) ((void)0)

#endif
