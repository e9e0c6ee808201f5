#pragma once

/**
 * @file event_logger.hpp
 * @brief Debug logging of key-lifecycle events.
 *
 * Records state transitions, sizes, versions and record identifiers only.
 * Secrets, keys and plaintext are never passed to these macros; nonces and
 * salts are public values and may be logged in hex.
 *
 * Enable via CMake: -DPHIVAULT_DEBUG_EVENTS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace phivault::debug {

enum class Component {
    KeyDerivation,
    Envelope,
    Cipher,
    Session,
    Client,
    Storage
};

#ifdef PHIVAULT_DEBUG_EVENTS

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

inline const char* ComponentToString(Component component) {
    switch (component) {
        case Component::KeyDerivation: return "KDF";
        case Component::Envelope: return "ENVELOPE";
        case Component::Cipher: return "CIPHER";
        case Component::Session: return "SESSION";
        case Component::Client: return "CLIENT";
        case Component::Storage: return "STORAGE";
        default: return "UNKNOWN";
    }
}

#define PV_LOG_EVENT(component, operation, message) \
    do { \
        fprintf(stdout, "[PV-DEBUG] %s %s %s\n", \
            ::phivault::debug::ComponentToString(component), \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define PV_LOG_VALUE(component, operation, name, value) \
    do { \
        fprintf(stdout, "[PV-DEBUG] %s %s %s: %s\n", \
            ::phivault::debug::ComponentToString(component), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define PV_LOG_PUBLIC_BYTES(component, operation, name, data) \
    do { \
        fprintf(stdout, "[PV-DEBUG] %s %s %s: %s\n", \
            ::phivault::debug::ComponentToString(component), \
            operation, \
            name, \
            ::phivault::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#else // !PHIVAULT_DEBUG_EVENTS

#define PV_LOG_EVENT(component, operation, message) ((void)0)
#define PV_LOG_VALUE(component, operation, name, value) ((void)0)
#define PV_LOG_PUBLIC_BYTES(component, operation, name, data) ((void)0)

#endif // PHIVAULT_DEBUG_EVENTS

} // namespace phivault::debug
