#include <layerfx/shader_source.hpp>

#include <cstring>
#include <string>

namespace layerfx {

namespace {

struct TypeLayout {
    std::uint32_t align;
    std::uint32_t size;
};

// std430 base alignment and size. Textures and opaque values never reach the block.
TypeLayout std430(UniformType type) {
    switch (type) {
    case UniformType::Scalar:  return {4, 4};
    case UniformType::Vector2: return {8, 8};
    case UniformType::Vector3: return {16, 12};
    case UniformType::Vector4: return {16, 16};
    case UniformType::Texture:
    case UniformType::Opaque:  break;
    }
    return {0, 0};
}

std::uint32_t alignUp(std::uint32_t v, std::uint32_t a) {
    return (v + a - 1) & ~(a - 1);
}

void appendBlock(std::string& out, const UniformBlockLayout& layout) {
    out += "layout(push_constant) uniform LayerUniforms {\n";
    for (const auto& m : layout.members) {
        out += "    layout(offset = ";
        out += std::to_string(m.offset);
        out += ") ";
        out += uniformTypeName(m.type);
        out += ' ';
        out += m.name;
        out += ";\n";
    }
    out += "};\n";
}

void appendSampler(std::string& out, std::uint32_t binding, std::string_view name) {
    out += "layout(set = 0, binding = ";
    out += std::to_string(binding);
    out += ") uniform sampler2D ";
    out += name;
    out += ";\n";
}

bool isVersionLine(std::string_view line) {
    std::size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    return line.substr(i).starts_with("#version");
}

} // anonymous namespace

Result<UniformBlockLayout> layoutUniformBlock(const UniformTable& table) {
    UniformBlockLayout layout;
    std::uint32_t cursor = 0;

    auto place = [&](std::string name, UniformType type) {
        TypeLayout tl = std430(type);
        cursor = alignUp(cursor, tl.align);
        layout.members.push_back({std::move(name), type, cursor, tl.size});
        cursor += tl.size;
    };

    place(std::string(uniform_names::Time),       UniformType::Scalar);
    place(std::string(uniform_names::Resolution), UniformType::Vector2);
    place(std::string(uniform_names::Pointer),    UniformType::Vector2);

    for (const auto& [name, value] : table) {
        if (isReservedUniform(name)) continue;
        UniformType type = uniformType(value);
        if (type == UniformType::Texture) {
            layout.customTextures.push_back(name);
        } else if (type != UniformType::Opaque) {
            place(name, type);
        }
    }

    layout.size = alignUp(cursor, 4);

    if (layout.size > kMaxUniformBlockBytes) {
        Error e{"layout uniform block", 0,
                "uniform block needs " + std::to_string(layout.size) +
                " bytes, push constants hold at most " +
                std::to_string(kMaxUniformBlockBytes)};
        e.kind = ErrorKind::Build;
        return e;
    }

    return layout;
}

std::string vertexPrelude(const UniformBlockLayout& layout) {
    std::string out = "#version 450\n";
    appendBlock(out, layout);
    out += "layout(location = 0) in vec3 position;\n";
    out += "layout(location = 1) in vec2 uv;\n";
    return out;
}

std::string fragmentPrelude(const UniformBlockLayout& layout) {
    std::string out = "#version 450\n";
    appendBlock(out, layout);
    appendSampler(out, kInputImageBinding,      uniform_names::InputImage);
    appendSampler(out, kBackgroundImageBinding, uniform_names::BackgroundImage);
    for (std::size_t i = 0; i < layout.customTextures.size(); ++i) {
        appendSampler(out, kFirstCustomBinding + static_cast<std::uint32_t>(i),
                      layout.customTextures[i]);
    }
    return out;
}

std::string assembleShader(std::string_view prelude, std::string_view body) {
    std::string out;
    out.reserve(prelude.size() + body.size() + 16);
    out += prelude;
    out += "#line 1\n";

    std::size_t pos = 0;
    while (pos < body.size()) {
        std::size_t end = body.find('\n', pos);
        if (end == std::string_view::npos) end = body.size();
        std::string_view line = body.substr(pos, end - pos);
        if (!isVersionLine(line)) {
            out += line;
        }
        out += '\n';
        pos = end + 1;
    }
    return out;
}

std::vector<std::byte> packUniforms(const UniformBlockLayout& layout,
                                    const UniformTable& table) {
    std::vector<std::byte> bytes(layout.size, std::byte{0});

    for (const auto& m : layout.members) {
        const UniformValue* v = table.find(m.name);
        if (!v || uniformType(*v) != m.type) continue;

        const float* src = nullptr;
        switch (m.type) {
        case UniformType::Scalar:  src = &std::get<float>(*v);  break;
        case UniformType::Vector2: src = &std::get<Vec2>(*v).x; break;
        case UniformType::Vector3: src = &std::get<Vec3>(*v).x; break;
        case UniformType::Vector4: src = &std::get<Vec4>(*v).x; break;
        case UniformType::Texture:
        case UniformType::Opaque:  break;
        }
        if (src) std::memcpy(bytes.data() + m.offset, src, m.size);
    }

    return bytes;
}

bool referencesBackgroundImage(std::string_view fragmentSource) {
    return fragmentSource.find(uniform_names::BackgroundImage) != std::string_view::npos;
}

} // namespace layerfx
