#include <layerfx/shader_compiler.hpp>
#include <layerfx/shader_source.hpp>

#include <cassert>
#include <cstdio>
#include <string>
#include <utility>

using namespace layerfx;

static constexpr std::uint32_t kSpirvMagic = 0x07230203;

static const char* kVertexBody = R"(
layout(location = 0) out vec2 vUv;

void main() {
    vUv = uv;
    gl_Position = vec4(position, 1.0);
}
)";

static const char* kFragmentBody = R"(
layout(location = 0) in vec2 vUv;
layout(location = 0) out vec4 outColor;

void main() {
    vec4 src = texture(uTexture, vUv);
    vec4 bg  = texture(uBgTexture, vUv);
    float wave = 0.5 + 0.5 * sin(uTime * uSpeed + vUv.x * uResolution.x);
    outColor = mix(src, bg, wave) * texture(uNoise, vUv + uMousePos);
}
)";

int main() {
    ShaderCompiler compiler;

    UniformTable table = UniformTable::withDefaults({640.0f, 480.0f});
    table.declare("uSpeed", 2.0f);
    table.bindTexture("uNoise", TextureHandle::pending());
    auto layout = layoutUniformBlock(table);
    assert(layout.ok());

    // A generated program compiles for both stages
    {
        auto vs = compiler.compile(assembleShader(vertexPrelude(layout.value()), kVertexBody),
                                   ShaderStage::Vertex, "test.vert");
        if (!vs.ok()) std::fprintf(stderr, "%s\n", vs.error().format().c_str());
        assert(vs.ok());
        assert(vs.value().size() > 5);
        assert(vs.value()[0] == kSpirvMagic);

        auto fs = compiler.compile(assembleShader(fragmentPrelude(layout.value()), kFragmentBody),
                                   ShaderStage::Fragment, "test.frag");
        if (!fs.ok()) std::fprintf(stderr, "%s\n", fs.error().format().c_str());
        assert(fs.ok());
        assert(fs.value()[0] == kSpirvMagic);
    }

    // A body that brings its own #version still compiles
    {
        std::string body = std::string("#version 300 es\n") + kVertexBody;
        auto vs = compiler.compile(assembleShader(vertexPrelude(layout.value()), body),
                                   ShaderStage::Vertex, "versioned.vert");
        assert(vs.ok());
    }

    // Errors are Build errors with the compiler log, pointing into the body
    {
        auto bad = compiler.compile(assembleShader(fragmentPrelude(layout.value()),
                                                   "void main() {\n    undefinedThing();\n}\n"),
                                    ShaderStage::Fragment, "broken.frag");
        assert(!bad.ok());
        assert(bad.error().kind == ErrorKind::Build);
        assert(bad.error().operation.find("broken.frag") != std::string::npos);
        assert(bad.error().message.find("undefinedThing") != std::string::npos);
        assert(bad.error().message.find(":2:") != std::string::npos);
    }

    // Moved-from compiler fails cleanly
    {
        ShaderCompiler moved = std::move(compiler);
        auto r = compiler.compile("void main() {}", ShaderStage::Vertex, "x.vert"); // NOLINT(bugprone-use-after-move)
        assert(!r.ok());
        auto ok = moved.compile(assembleShader(vertexPrelude(layout.value()), kVertexBody),
                                ShaderStage::Vertex, "moved.vert");
        assert(ok.ok());
    }

    std::printf("shader compiler tests passed\n");
    return 0;
}
