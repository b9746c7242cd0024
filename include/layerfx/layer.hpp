#pragma once

#include <layerfx/description.hpp>
#include <layerfx/result.hpp>
#include <layerfx/uniforms.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace layerfx {

// Index into a ProgramStore. Layers refer to programs by id so that frame
// planning stays GPU-free.
using ProgramId = std::uint32_t;

// Runtime layer. Owned by the compositor's layer list.
struct Layer {
    std::string            kind;
    bool                   visible = true;
    UniformTable           uniforms;
    std::vector<ProgramId> programs;             // one per surviving pass, in pass order
    bool                   needsBackgroundImage = false;
    std::size_t            sourceIndex = 0;      // position in Description::history
};

// Build-time collaborators. `compile` turns one vertex/fragment body pair into
// a program bound to `uniforms`. `requestTexture` starts an asynchronous load
// and returns its handle right away; when unset, custom textures stay Pending.
struct LayerBuildHooks {
    std::function<Result<ProgramId>(const UniformTable& uniforms,
                                    std::string_view vertexSource,
                                    std::string_view fragmentSource,
                                    const std::string& label)> compile;
    std::function<TextureHandle(const std::string& source)> requestTexture;
};

// Descriptions -> runtime layers, in order. Never fails: a description
// without a vertex source, or with no pass that compiles, is logged and
// left out. Missing or failing passes are logged and dropped.
[[nodiscard]] std::vector<Layer> buildLayers(const std::vector<LayerDescription>& descriptions,
                                             Vec2 resolution,
                                             const LayerBuildHooks& hooks);

} // namespace layerfx
