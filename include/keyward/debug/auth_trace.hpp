#pragma once

/**
 * @file auth_trace.hpp
 * @brief Debug tracing for the identity flows.
 *
 * Traces carry component, operation and outcome. Emails are printed only as
 * their length; passphrases, seeds, private keys and raw device tokens are
 * never passed to these macros.
 *
 * Enable via CMake: -DKEYWARD_DEBUG_TRACE=ON
 */

#include <cstdio>
#include <string>
#include <string_view>

#ifdef KEYWARD_DEBUG_TRACE
#include <fmt/core.h>
#endif

namespace keyward::debug {

// ============================================================================
// Components - always defined so call sites compile in every build
// ============================================================================

enum class Component {
    KeyDerivation,
    Nonce,
    Identity,
    Guard,
    DeviceTrust,
    Module
};

inline const char* ComponentToString(const Component component) {
    switch (component) {
        case Component::KeyDerivation: return "KDF";
        case Component::Nonce: return "NONCE";
        case Component::Identity: return "IDENTITY";
        case Component::Guard: return "GUARD";
        case Component::DeviceTrust: return "TRUST";
        case Component::Module: return "MODULE";
        default: return "UNKNOWN";
    }
}

#ifdef KEYWARD_DEBUG_TRACE

inline void WriteTraceLine(const std::string& line) {
    fprintf(stdout, "[KEYWARD-DEBUG] %s\n", line.c_str());
    fflush(stdout);
}

#define KEYWARD_TRACE(component, operation, ...) \
    do { \
        ::keyward::debug::WriteTraceLine(fmt::format("{} {}: {}", \
            ::keyward::debug::ComponentToString(component), \
            operation, \
            fmt::format(__VA_ARGS__))); \
    } while(0)

#define KEYWARD_TRACE_SECTION(component, section_name) \
    do { \
        ::keyward::debug::WriteTraceLine(fmt::format("{} ========== {} ==========", \
            ::keyward::debug::ComponentToString(component), \
            section_name)); \
    } while(0)

#else

#define KEYWARD_TRACE(component, operation, ...) do {} while(0)
#define KEYWARD_TRACE_SECTION(component, section_name) do {} while(0)

#endif

} // namespace keyward::debug
