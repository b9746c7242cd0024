#include <layerfx/shader_compiler.hpp>

#include <shaderc/shaderc.hpp>

#include <string>

namespace layerfx {

struct ShaderCompiler::Impl {
    shaderc::Compiler       compiler;
    shaderc::CompileOptions options;
};

ShaderCompiler::ShaderCompiler() : impl_(std::make_unique<Impl>()) {
    impl_->options.SetTargetEnvironment(shaderc_target_env_vulkan,
                                        shaderc_env_version_vulkan_1_3);
    impl_->options.SetOptimizationLevel(shaderc_optimization_level_performance);
}

ShaderCompiler::~ShaderCompiler() = default;
ShaderCompiler::ShaderCompiler(ShaderCompiler&&) noexcept = default;
ShaderCompiler& ShaderCompiler::operator=(ShaderCompiler&&) noexcept = default;

Result<std::vector<std::uint32_t>> ShaderCompiler::compile(std::string_view source,
                                                           ShaderStage stage,
                                                           const std::string& name) const {
    auto buildError = [&](std::string message) {
        Error e{"compile " + name, 0, std::move(message)};
        e.kind = ErrorKind::Build;
        return e;
    };

    if (!impl_) return buildError("compiler was moved from");
    if (!impl_->compiler.IsValid()) return buildError("shaderc compiler is not available");

    shaderc_shader_kind kind = (stage == ShaderStage::Vertex)
                                   ? shaderc_vertex_shader
                                   : shaderc_fragment_shader;

    auto result = impl_->compiler.CompileGlslToSpv(source.data(), source.size(), kind,
                                                   name.c_str(), impl_->options);
    if (result.GetCompilationStatus() != shaderc_compilation_status_success) {
        return buildError(result.GetErrorMessage());
    }

    std::vector<std::uint32_t> spirv(result.cbegin(), result.cend());
    if (spirv.empty()) {
        return buildError("compiled to empty SPIR-V");
    }
    return spirv;
}

} // namespace layerfx
