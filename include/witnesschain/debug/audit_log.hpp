#pragma once

/**
 * @file audit_log.hpp
 * @brief Compile-time switchable audit trail for vault operations.
 *
 * Logs operation outcomes, DIDs, sizes and error codes to stderr. Secret
 * material (signing keys, passwords, file keys, wrapping keys) is never
 * passed to these helpers.
 *
 * Enable via CMake: -DWITNESSCHAIN_DEBUG_LOG=ON
 */

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace witnesschain::debug {

enum class Component {
    Identity,
    Encryption,
    KeyStore,
    RateLimiter,
    Capability,
    Session
};

#ifdef WITNESSCHAIN_DEBUG_LOG

inline const char* ComponentToString(Component component) {
    switch (component) {
        case Component::Identity: return "IDENTITY";
        case Component::Encryption: return "ENCRYPTION";
        case Component::KeyStore: return "KEYSTORE";
        case Component::RateLimiter: return "RATELIMIT";
        case Component::Capability: return "CAPABILITY";
        case Component::Session: return "SESSION";
        default: return "UNKNOWN";
    }
}

#define WC_LOG_EVENT(component, operation, message) \
    do { \
        fprintf(stderr, "[WC-AUDIT] %s %s %s\n", \
            ::witnesschain::debug::ComponentToString(component), \
            operation, \
            message); \
        fflush(stderr); \
    } while(0)

#define WC_LOG_VALUE(component, operation, name, value) \
    do { \
        fprintf(stderr, "[WC-AUDIT] %s %s %s: %s\n", \
            ::witnesschain::debug::ComponentToString(component), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stderr); \
    } while(0)

#define WC_LOG_SUBJECT(component, operation, did) \
    do { \
        fprintf(stderr, "[WC-AUDIT] %s %s subject: %s\n", \
            ::witnesschain::debug::ComponentToString(component), \
            operation, \
            std::string(did).c_str()); \
        fflush(stderr); \
    } while(0)

#define WC_LOG_SECTION(component, section_name) \
    do { \
        fprintf(stderr, "[WC-AUDIT] %s ========== %s ==========\n", \
            ::witnesschain::debug::ComponentToString(component), \
            section_name); \
        fflush(stderr); \
    } while(0)

inline void LogUnlockFailure(std::string_view did, uint32_t failed_attempts, uint32_t lockout_seconds) {
    WC_LOG_SUBJECT(Component::RateLimiter, "UNLOCK_FAILED", did);
    WC_LOG_VALUE(Component::RateLimiter, "UNLOCK_FAILED", "failed_attempts", failed_attempts);
    if (lockout_seconds > 0) {
        WC_LOG_VALUE(Component::RateLimiter, "LOCKOUT", "seconds", lockout_seconds);
    }
}

inline void LogCapabilityIssued(
    std::string_view issuer,
    std::string_view audience,
    std::string_view action,
    int64_t expiration) {
    WC_LOG_SECTION(Component::Capability, "CAPABILITY ISSUED");
    WC_LOG_SUBJECT(Component::Capability, "ISSUER", issuer);
    WC_LOG_SUBJECT(Component::Capability, "AUDIENCE", audience);
    WC_LOG_EVENT(Component::Capability, "ACTION", std::string(action).c_str());
    WC_LOG_VALUE(Component::Capability, "ISSUE", "expiration", expiration);
}

inline void LogCapabilityDenied(std::string_view reason) {
    WC_LOG_EVENT(Component::Capability, "DENIED", std::string(reason).c_str());
}

inline void LogFailureCode(Component component, const char* operation, std::string_view code) {
    WC_LOG_EVENT(component, operation, std::string(code).c_str());
}

#else // !WITNESSCHAIN_DEBUG_LOG

#define WC_LOG_EVENT(component, operation, message) ((void)0)
#define WC_LOG_VALUE(component, operation, name, value) ((void)0)
#define WC_LOG_SUBJECT(component, operation, did) ((void)0)
#define WC_LOG_SECTION(component, section_name) ((void)0)

inline void LogUnlockFailure(std::string_view, uint32_t, uint32_t) {}
inline void LogCapabilityIssued(std::string_view, std::string_view, std::string_view, int64_t) {}
inline void LogCapabilityDenied(std::string_view) {}
inline void LogFailureCode(Component, const char*, std::string_view) {}

#endif // WITNESSCHAIN_DEBUG_LOG

}
