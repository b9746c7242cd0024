#include <layerfx/uniforms.hpp>

#include <cassert>
#include <cstdio>
#include <string>

using namespace layerfx;

int main() {
    // Defaults: every reserved entry present
    {
        UniformTable t = UniformTable::withDefaults({800.0f, 600.0f});
        assert(t.size() == 5);
        assert(t.time() == 0.0f);
        assert((t.resolution() == Vec2{800.0f, 600.0f}));
        assert((t.pointer() == Vec2{0.5f, 0.5f}));
        assert(t.inputImage().state() == TextureHandle::State::Empty);
        assert(t.backgroundImage().state() == TextureHandle::State::Empty);
        assert(t.contains("uTexture"));
        assert(t.contains("uBgTexture"));
    }

    // Reserved names
    {
        assert(isReservedUniform("uTime"));
        assert(isReservedUniform("uResolution"));
        assert(isReservedUniform("uMousePos"));
        assert(isReservedUniform("uTexture"));
        assert(isReservedUniform("uBgTexture"));
        assert(!isReservedUniform("uCustomTexture"));
        assert(!isReservedUniform("uSpeed"));
    }

    // A declaration never overwrites a reserved uniform
    {
        UniformTable t = UniformTable::withDefaults({100.0f, 100.0f});
        assert(!t.declare("uTime", 5.0f));
        assert(!t.declare("uResolution", Vec2{1.0f, 1.0f}));
        assert(!t.bindTexture("uTexture", TextureHandle::pending()));
        assert(t.time() == 0.0f);
        assert((t.resolution() == Vec2{100.0f, 100.0f}));
        assert(t.inputImage().state() == TextureHandle::State::Empty);
    }

    // Scalar declaration
    {
        UniformTable t = UniformTable::withDefaults({100.0f, 100.0f});
        assert(t.declare("uSpeed", 0.42f));
        const float* speed = t.get<float>("uSpeed");
        assert(speed && *speed == 0.42f);
        assert(t.get<Vec2>("uSpeed") == nullptr);
        assert(uniformType(*t.find("uSpeed")) == UniformType::Scalar);
        assert(t.size() == 6);
    }

    // Later declaration of the same name wins
    {
        UniformTable t = UniformTable::withDefaults({1.0f, 1.0f});
        t.declare("uCenter", Vec2{0.1f, 0.2f});
        t.declare("uCenter", Vec2{0.3f, 0.4f});
        assert((*t.get<Vec2>("uCenter") == Vec2{0.3f, 0.4f}));
    }

    // Texture binding replaces a declared uniform of the same name
    {
        UniformTable t = UniformTable::withDefaults({1.0f, 1.0f});
        t.declare("uNoise", 1.0f);
        assert(t.bindTexture("uNoise", TextureHandle::pending()));
        assert(t.get<float>("uNoise") == nullptr);
        const TextureHandle* h = t.get<TextureHandle>("uNoise");
        assert(h && h->state() == TextureHandle::State::Pending);
    }

    // Opaque values are kept
    {
        UniformTable t = UniformTable::withDefaults({1.0f, 1.0f});
        t.declare("uMatrix", OpaqueValue{"mat4", "[1,0,0,1]"});
        const OpaqueValue* v = t.get<OpaqueValue>("uMatrix");
        assert(v && v->typeTag == "mat4" && v->json == "[1,0,0,1]");
        assert(uniformType(*t.find("uMatrix")) == UniformType::Opaque);
    }

    // Per-frame setters touch only their entry
    {
        UniformTable t = UniformTable::withDefaults({640.0f, 480.0f});
        t.declare("uSpeed", 2.0f);
        t.setTime(3.5f);
        t.setPointer({0.25f, 0.75f});
        assert(t.time() == 3.5f);
        assert((t.pointer() == Vec2{0.25f, 0.75f}));
        assert((t.resolution() == Vec2{640.0f, 480.0f}));
        assert(*t.get<float>("uSpeed") == 2.0f);

        t.setResolution({1024.0f, 768.0f});
        assert((t.resolution() == Vec2{1024.0f, 768.0f}));
    }

    // Tables are values: copies are independent
    {
        UniformTable a = UniformTable::withDefaults({1.0f, 1.0f});
        UniformTable b = a;
        b.declare("uOnlyB", 1.0f);
        b.setTime(9.0f);
        assert(!a.contains("uOnlyB"));
        assert(a.time() == 0.0f);
    }

    // Iteration is ordered by name
    {
        UniformTable t = UniformTable::withDefaults({1.0f, 1.0f});
        t.declare("uB", 1.0f);
        t.declare("uA", 1.0f);
        std::string prev;
        for (const auto& [name, value] : t) {
            assert(prev < name);
            prev = name;
        }
    }

    // Type names
    {
        assert(std::string(uniformTypeName(UniformType::Vector3)) == "vec3");
        assert(std::string(uniformTypeName(UniformType::Texture)) == "sampler2D");
    }

    std::printf("uniform tests passed\n");
    return 0;
}
