#pragma once

#include <cstdint>
#include <string>

namespace layerfx {

// Which part of the pipeline an error belongs to.
//   Startup -- document or device problems; the player cannot start.
//   Build   -- a layer or pass could not be built; it is dropped and logged.
//   Gpu     -- a Vulkan call failed.
//   Io      -- a file or image could not be read or decoded.
enum class ErrorKind : std::uint8_t {
    Startup,
    Build,
    Gpu,
    Io,
};

[[nodiscard]] const char* errorKindName(ErrorKind kind);

// What we tried, what Vulkan said (0 when Vulkan was not involved), and a
// human-readable message. VkResult is kept as int32_t so this header does not
// pull in <vulkan/vulkan.h>.
struct Error {
    std::string   operation;            // e.g. "compile fragment shader"
    std::int32_t  vkResult = 0;
    std::string   message;
    ErrorKind     kind     = ErrorKind::Gpu;

    [[nodiscard]] std::string format() const;
};

// Unwrap hook used by Result<T>::orThrow().
// LAYERFX_ENABLE_EXCEPTIONS=1 throws std::runtime_error, 0 prints and aborts.
[[noreturn]] void throwError(const Error& e);

} // namespace layerfx
