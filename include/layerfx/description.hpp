#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>
#include <layerfx/uniforms.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace layerfx {

// One entry of data.uniforms, already converted to a typed value.
// Unknown type tags arrive here as OpaqueValue.
struct UniformDeclaration {
    std::string  name;
    std::string  typeTag; // "1f", "2f", ... as written in the document
    UniformValue value;
};

struct TextureDescriptor {
    std::string source;                                        // locator, resolved against the document
    std::string sampler = std::string(uniform_names::DefaultCustomTexture);
};

// Immutable description of one compositing stage, as loaded from the
// document's history list. An empty source string means "missing".
struct LayerDescription {
    std::string                     kind;
    bool                            visible = true;
    std::size_t                     passCount = 0;  // entries in data.passes
    std::vector<UniformDeclaration> uniforms;
    std::string                     vertexSource;
    std::vector<std::string>        fragmentSources; // one per pass, in order
    std::optional<TextureDescriptor> texture;
};

struct Description {
    std::vector<LayerDescription> history;
    std::filesystem::path         baseDir; // where relative texture locators resolve
};

// Parse a document from memory. Empty text, invalid JSON, a non-object root,
// or a missing/non-array "history" is a Startup error. Malformed history
// entries are skipped with a warning.
[[nodiscard]] Result<Description> parseDescription(std::string_view text);

// Read and parse a document file. Relative texture locators are resolved
// against the file's directory.
[[nodiscard]] Result<Description> loadDescriptionFile(const std::filesystem::path& path);

} // namespace layerfx
