#include <layerfx/shader_source.hpp>

#include <cassert>
#include <cstdio>
#include <cstring>
#include <string>

using namespace layerfx;

static const UniformBlockMember* member(const UniformBlockLayout& l, const std::string& name) {
    for (const auto& m : l.members) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

static float floatAt(const std::vector<std::byte>& bytes, std::uint32_t offset) {
    float f = 0.0f;
    std::memcpy(&f, bytes.data() + offset, sizeof(float));
    return f;
}

int main() {
    // Reserved members lead the block
    {
        UniformTable t = UniformTable::withDefaults({640.0f, 480.0f});
        auto r = layoutUniformBlock(t);
        assert(r.ok());
        const UniformBlockLayout& l = r.value();
        assert(l.members.size() == 3);
        assert(l.members[0].name == "uTime"       && l.members[0].offset == 0);
        assert(l.members[1].name == "uResolution" && l.members[1].offset == 8);
        assert(l.members[2].name == "uMousePos"   && l.members[2].offset == 16);
        assert(l.size == 24);
        assert(l.customTextures.empty());
        assert(l.textureCount() == 2);
    }

    // Declared members follow in name order with std430 alignment
    {
        UniformTable t = UniformTable::withDefaults({1.0f, 1.0f});
        t.declare("uSpeed", 1.0f);
        t.declare("uColor", Vec3{1.0f, 0.5f, 0.25f});
        t.declare("uAmount", 0.5f);
        t.declare("uTint", Vec4{});
        t.declare("uMatrix", OpaqueValue{"mat4", "[]"});
        t.bindTexture("uNoise", TextureHandle::pending());
        t.bindTexture("uDetail", TextureHandle::pending());

        auto r = layoutUniformBlock(t);
        assert(r.ok());
        const UniformBlockLayout& l = r.value();

        // uAmount(float) 24, uColor(vec3) 32, uSpeed(float) 44, uTint(vec4) 48
        assert(member(l, "uAmount")->offset == 24);
        assert(member(l, "uColor")->offset == 32);
        assert(member(l, "uColor")->size == 12);
        assert(member(l, "uSpeed")->offset == 44);
        assert(member(l, "uTint")->offset == 48);
        assert(l.size == 64);
        assert(member(l, "uMatrix") == nullptr);

        assert(l.customTextures.size() == 2);
        assert(l.customTextures[0] == "uDetail");
        assert(l.customTextures[1] == "uNoise");
        assert(l.textureCount() == 4);
    }

    // Same names and types, same layout
    {
        UniformTable a = UniformTable::withDefaults({1.0f, 1.0f});
        UniformTable b = UniformTable::withDefaults({9.0f, 9.0f});
        a.declare("uX", 1.0f);
        b.declare("uX", 7.0f);
        auto la = layoutUniformBlock(a).value();
        auto lb = layoutUniformBlock(b).value();
        assert(la.size == lb.size);
        assert(member(la, "uX")->offset == member(lb, "uX")->offset);
    }

    // Block over the push-constant limit
    {
        UniformTable t = UniformTable::withDefaults({1.0f, 1.0f});
        for (int i = 0; i < 7; ++i) {
            t.declare("uV" + std::to_string(i), Vec4{});
        }
        auto r = layoutUniformBlock(t);
        assert(!r.ok());
        assert(r.error().kind == ErrorKind::Build);

        UniformTable fits = UniformTable::withDefaults({1.0f, 1.0f});
        for (int i = 0; i < 6; ++i) {
            fits.declare("uV" + std::to_string(i), Vec4{});
        }
        auto ok = layoutUniformBlock(fits);
        assert(ok.ok());
        assert(ok.value().size == 128);
    }

    // Preludes
    {
        UniformTable t = UniformTable::withDefaults({1.0f, 1.0f});
        t.declare("uSpeed", 1.0f);
        t.bindTexture("uNoise", TextureHandle::pending());
        auto l = layoutUniformBlock(t).value();

        std::string vs = vertexPrelude(l);
        std::string fs = fragmentPrelude(l);
        assert(vs.rfind("#version 450\n", 0) == 0);
        assert(fs.rfind("#version 450\n", 0) == 0);
        assert(vs.find("layout(push_constant) uniform LayerUniforms") != std::string::npos);
        assert(fs.find("layout(push_constant) uniform LayerUniforms") != std::string::npos);
        assert(vs.find("layout(offset = 24) float uSpeed;") != std::string::npos);
        assert(vs.find("layout(location = 0) in vec3 position;") != std::string::npos);
        assert(vs.find("layout(location = 1) in vec2 uv;") != std::string::npos);
        assert(vs.find("sampler2D") == std::string::npos);

        assert(fs.find("layout(set = 0, binding = 0) uniform sampler2D uTexture;") != std::string::npos);
        assert(fs.find("layout(set = 0, binding = 1) uniform sampler2D uBgTexture;") != std::string::npos);
        assert(fs.find("layout(set = 0, binding = 2) uniform sampler2D uNoise;") != std::string::npos);
        assert(fs.find("in vec3 position") == std::string::npos);
    }

    // Assembly blanks #version lines in the body and keeps line numbers
    {
        std::string out = assembleShader("PRELUDE\n", "  #version 300 es\nvoid main() {}\n");
        assert(out.rfind("PRELUDE\n#line 1\n", 0) == 0);
        assert(out.find("300 es") == std::string::npos);
        assert(out.find("\nvoid main() {}\n") != std::string::npos);

        std::string plain = assembleShader("P\n", "a\nb");
        assert(plain == "P\n#line 1\na\nb\n");
    }

    // Packing
    {
        UniformTable t = UniformTable::withDefaults({800.0f, 600.0f});
        t.declare("uSpeed", 0.42f);
        t.setTime(2.5f);
        t.setPointer({0.25f, 0.75f});
        auto l = layoutUniformBlock(t).value();
        auto bytes = packUniforms(l, t);
        assert(bytes.size() == l.size);
        assert(floatAt(bytes, 0) == 2.5f);
        assert(floatAt(bytes, 8) == 800.0f);
        assert(floatAt(bytes, 12) == 600.0f);
        assert(floatAt(bytes, 16) == 0.25f);
        assert(floatAt(bytes, 20) == 0.75f);
        assert(floatAt(bytes, 24) == 0.42f);

        // A member the table lacks reads as zero
        UniformTable other = UniformTable::withDefaults({1.0f, 1.0f});
        auto zeros = packUniforms(l, other);
        assert(floatAt(zeros, 24) == 0.0f);
    }

    // Background detection
    {
        assert(referencesBackgroundImage("vec4 c = texture(uBgTexture, vUv);"));
        assert(!referencesBackgroundImage("vec4 c = texture(uTexture, vUv);"));
        assert(!referencesBackgroundImage(""));
    }

    std::printf("shader source tests passed\n");
    return 0;
}
