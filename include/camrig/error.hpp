#pragma once

#include <string>

namespace camrig {

// What we tried and why it did not work. SDL reports failures as strings,
// so there is no numeric code to carry.
struct Error {
    std::string operation; // e.g. "create window"
    std::string message;   // human-readable cause, usually SDL_GetError()

    // "camrig: <operation> failed: <message>"
    [[nodiscard]] std::string format() const;
};

// Error unwrap hook used by Result<T>::orThrow().
// When CAMRIG_ENABLE_EXCEPTIONS=1, throws std::runtime_error.
// When CAMRIG_ENABLE_EXCEPTIONS=0, prints and aborts.
[[noreturn]] void throwError(const Error& e);

} // namespace camrig
