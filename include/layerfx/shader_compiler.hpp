#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace layerfx {

enum class ShaderStage : std::uint8_t {
    Vertex,
    Fragment,
};

// GLSL -> SPIR-V for Vulkan 1.3. Failures are Build errors carrying the
// compiler log.
//
// Thread safety: compile() is const and may be called concurrently.
class ShaderCompiler {
public:
    ShaderCompiler();
    ~ShaderCompiler();
    ShaderCompiler(ShaderCompiler&&) noexcept;
    ShaderCompiler& operator=(ShaderCompiler&&) noexcept;
    ShaderCompiler(const ShaderCompiler&) = delete;
    ShaderCompiler& operator=(const ShaderCompiler&) = delete;

    // `name` only labels diagnostics.
    [[nodiscard]] Result<std::vector<std::uint32_t>> compile(std::string_view source,
                                                             ShaderStage stage,
                                                             const std::string& name) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace layerfx
