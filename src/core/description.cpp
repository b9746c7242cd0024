#include <layerfx/description.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

namespace layerfx {

using json = nlohmann::json;

namespace {

// Type tag recorded for a declaration whose "type" is not a string.
constexpr const char* kNonStringTag = "<non-string>";

Error startupError(std::string operation, std::string message) {
    Error e{std::move(operation), 0, std::move(message)};
    e.kind = ErrorKind::Startup;
    return e;
}

// A source string is present only when it is a non-empty JSON string.
std::string sourceText(const json& value) {
    if (!value.is_string()) return {};
    return value.get<std::string>();
}

// Member `key` when it is a JSON string, `fallback` for anything else.
std::string stringOr(const json& object, const char* key, std::string fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

bool readFloat(const json& value, float& out) {
    if (!value.is_number()) return false;
    out = value.get<float>();
    return true;
}

// Reads `count` components from either [a, b, ...] or {"_x":a, "_y":b, ...}.
// Extra array elements are ignored.
bool readComponents(const json& value, float* out, std::size_t count) {
    static constexpr const char* keys[] = {"_x", "_y", "_z", "_w"};

    if (value.is_array()) {
        if (value.size() < count) return false;
        for (std::size_t i = 0; i < count; ++i) {
            if (!readFloat(value[i], out[i])) return false;
        }
        return true;
    }

    if (value.is_object()) {
        for (std::size_t i = 0; i < count; ++i) {
            auto it = value.find(keys[i]);
            if (it == value.end() || !readFloat(*it, out[i])) return false;
        }
        return true;
    }

    return false;
}

UniformValue convertUniform(const std::string& name, const std::string& tag,
                            const json& value) {
    if (tag == "1f") {
        float f = 0.0f;
        if (readFloat(value, f)) return f;
    } else if (tag == "2f") {
        float c[2] = {};
        if (readComponents(value, c, 2)) return Vec2{c[0], c[1]};
    } else if (tag == "3f") {
        float c[3] = {};
        if (readComponents(value, c, 3)) return Vec3{c[0], c[1], c[2]};
    } else if (tag == "4f") {
        float c[4] = {};
        if (readComponents(value, c, 4)) return Vec4{c[0], c[1], c[2], c[3]};
    }

    std::fprintf(stderr,
                 "[layerfx] warning: uniform '%s' has unhandled type '%s', "
                 "passing value through\n",
                 name.c_str(), tag.c_str());
    return OpaqueValue{tag, value.dump()};
}

void parseUniforms(const json& uniforms, LayerDescription& layer) {
    if (!uniforms.is_object()) return;

    for (auto it = uniforms.begin(); it != uniforms.end(); ++it) {
        const json& entry = it.value();
        if (!entry.is_object()) {
            std::fprintf(stderr,
                         "[layerfx] warning: uniform entry '%s' is not an object, skipped\n",
                         it.key().c_str());
            continue;
        }

        UniformDeclaration decl;
        decl.name = stringOr(entry, "name", it.key());
        if (decl.name.empty()) decl.name = it.key();

        auto type = entry.find("type");
        if (type == entry.end() || type->is_string()) {
            decl.typeTag = stringOr(entry, "type", {});
        } else {
            decl.typeTag = kNonStringTag;
        }

        json value = entry.contains("value") ? entry["value"] : json{};
        decl.value = convertUniform(decl.name, decl.typeTag, value);
        layer.uniforms.push_back(std::move(decl));
    }
}

LayerDescription parseLayer(const json& entry) {
    LayerDescription layer;
    layer.kind = stringOr(entry, "type", {});

    auto vis = entry.find("visible");
    layer.visible = !(vis != entry.end() && vis->is_boolean() && !vis->get<bool>());

    auto data = entry.find("data");
    if (data != entry.end() && data->is_object()) {
        auto passes = data->find("passes");
        if (passes != data->end() && passes->is_array()) {
            layer.passCount = passes->size();
        }
        auto uniforms = data->find("uniforms");
        if (uniforms != data->end()) {
            parseUniforms(*uniforms, layer);
        }
    }

    auto vertex = entry.find("compiledVertexShaders");
    if (vertex != entry.end() && vertex->is_array() && !vertex->empty()) {
        layer.vertexSource = sourceText((*vertex)[0]);
    }

    auto fragments = entry.find("compiledFragmentShaders");
    if (fragments != entry.end() && fragments->is_array()) {
        for (const auto& frag : *fragments) {
            layer.fragmentSources.push_back(sourceText(frag));
        }
    }

    auto tex = entry.find("texture");
    if (tex != entry.end() && tex->is_object()) {
        std::string src = stringOr(*tex, "src", {});
        if (!src.empty()) {
            TextureDescriptor td;
            td.source = std::move(src);
            std::string sampler = stringOr(*tex, "sampler", {});
            if (!sampler.empty()) td.sampler = std::move(sampler);
            layer.texture = std::move(td);
        }
    }

    return layer;
}

} // anonymous namespace

Result<Description> parseDescription(std::string_view text) {
    if (text.empty()) {
        return startupError("parse description", "document is empty");
    }

    json root;
    try {
        root = json::parse(text.begin(), text.end());
    } catch (const json::exception& e) {
        return startupError("parse description", e.what());
    }

    if (!root.is_object()) {
        return startupError("parse description", "top-level value is not an object");
    }

    auto history = root.find("history");
    if (history == root.end() || !history->is_array()) {
        return startupError("parse description", "missing 'history' array");
    }

    Description desc;
    std::size_t index = 0;
    for (const auto& entry : *history) {
        if (!entry.is_object()) {
            std::fprintf(stderr,
                         "[layerfx] warning: history entry %zu is not an object, skipped\n",
                         index);
        } else {
            try {
                desc.history.push_back(parseLayer(entry));
            } catch (const json::exception& e) {
                std::fprintf(stderr,
                             "[layerfx] warning: history entry %zu is malformed (%s), skipped\n",
                             index, e.what());
            }
        }
        ++index;
    }

    return desc;
}

Result<Description> loadDescriptionFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return startupError("load description",
                            "cannot open '" + path.string() + "'");
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    if (file.bad()) {
        return startupError("load description",
                            "error reading '" + path.string() + "'");
    }

    auto parsed = parseDescription(content);
    if (!parsed.ok()) {
        Error e = parsed.error();
        e.message = path.string() + ": " + e.message;
        return e;
    }

    Description desc = std::move(parsed).value();
    desc.baseDir = path.parent_path();

    for (auto& layer : desc.history) {
        if (!layer.texture) continue;
        std::filesystem::path src(layer.texture->source);
        if (src.is_relative() && !desc.baseDir.empty()) {
            layer.texture->source = (desc.baseDir / src).lexically_normal().string();
        }
    }

    return desc;
}

} // namespace layerfx
