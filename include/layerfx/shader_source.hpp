#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>
#include <layerfx/uniforms.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace layerfx {

// Guaranteed minimum of maxPushConstantsSize on every Vulkan implementation.
inline constexpr std::uint32_t kMaxUniformBlockBytes = 128;

inline constexpr std::uint32_t kInputImageBinding      = 0;
inline constexpr std::uint32_t kBackgroundImageBinding = 1;
inline constexpr std::uint32_t kFirstCustomBinding     = 2;

struct UniformBlockMember {
    std::string   name;
    UniformType   type   = UniformType::Scalar;
    std::uint32_t offset = 0;
    std::uint32_t size   = 0;
};

// std430 layout of a layer's push-constant block plus the sampler binding
// order of its fragment stage. Derived from a uniform table; two tables with
// the same names and types produce identical layouts.
struct UniformBlockLayout {
    std::vector<UniformBlockMember> members;  // uTime, uResolution, uMousePos, then declared by name
    std::uint32_t                   size = 0; // bytes, multiple of 4
    std::vector<std::string>        customTextures; // binding kFirstCustomBinding + i

    [[nodiscard]] std::uint32_t textureCount() const {
        return kFirstCustomBinding + static_cast<std::uint32_t>(customTextures.size());
    }
};

// Fails with a Build error when the block exceeds kMaxUniformBlockBytes.
[[nodiscard]] Result<UniformBlockLayout> layoutUniformBlock(const UniformTable& table);

// GLSL declarations prepended to every document shader. Both start with
// "#version 450" and declare the same push-constant block.
[[nodiscard]] std::string vertexPrelude(const UniformBlockLayout& layout);
[[nodiscard]] std::string fragmentPrelude(const UniformBlockLayout& layout);

// prelude + body. A #version line in the body is blanked so that compiler
// line numbers still point into the body.
[[nodiscard]] std::string assembleShader(std::string_view prelude, std::string_view body);

// Current scalar/vector values of `table` packed at the offsets of `layout`.
// Members missing from the table (or of a different type) read as zero.
[[nodiscard]] std::vector<std::byte> packUniforms(const UniformBlockLayout& layout,
                                                  const UniformTable& table);

// True when the fragment text mentions the background sampler by name.
[[nodiscard]] bool referencesBackgroundImage(std::string_view fragmentSource);

} // namespace layerfx
