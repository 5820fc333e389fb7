#include <camrig/error.hpp>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace camrig {

#ifndef CAMRIG_ENABLE_EXCEPTIONS
#define CAMRIG_ENABLE_EXCEPTIONS 1
#endif

std::string Error::format() const {
    std::string out = "camrig: " + operation + " failed";
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

void throwError(const Error& e) {
#if CAMRIG_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

} // namespace camrig
