#include <layerfx/error.hpp>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace layerfx {

#ifndef LAYERFX_ENABLE_EXCEPTIONS
#define LAYERFX_ENABLE_EXCEPTIONS 1
#endif

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Startup: return "startup";
    case ErrorKind::Build:   return "build";
    case ErrorKind::Gpu:     return "gpu";
    case ErrorKind::Io:      return "io";
    }
    return "unknown";
}

std::string Error::format() const {
    std::string out = "layerfx: " + operation + " failed";

    if (vkResult != 0) {
        out += " (VkResult " + std::to_string(vkResult) + ")";
    }

    if (!message.empty()) {
        out += ": " + message;
    }

    return out;
}

void throwError(const Error& e) {
#if LAYERFX_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "[layerfx] fatal (%s): %s\n",
                 errorKindName(e.kind), e.format().c_str());
    std::abort();
#endif
}

} // namespace layerfx
