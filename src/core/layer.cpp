#include <layerfx/layer.hpp>
#include <layerfx/shader_source.hpp>

#include <cstdio>
#include <string>
#include <utility>

namespace layerfx {

namespace {

std::string layerLabel(const LayerDescription& desc, std::size_t index) {
    std::string label = "layer " + std::to_string(index);
    if (!desc.kind.empty()) {
        label += " (" + desc.kind + ")";
    }
    return label;
}

UniformTable buildTable(const LayerDescription& desc, Vec2 resolution,
                        const LayerBuildHooks& hooks, const std::string& label) {
    UniformTable table = UniformTable::withDefaults(resolution);

    for (const auto& decl : desc.uniforms) {
        if (!table.declare(decl.name, decl.value)) {
            std::fprintf(stderr,
                         "[layerfx] warning: %s declares reserved uniform '%s', ignored\n",
                         label.c_str(), decl.name.c_str());
        }
    }

    if (desc.texture) {
        TextureHandle handle = hooks.requestTexture
                                   ? hooks.requestTexture(desc.texture->source)
                                   : TextureHandle::pending();
        if (!table.bindTexture(desc.texture->sampler, std::move(handle))) {
            std::fprintf(stderr,
                         "[layerfx] warning: %s binds its texture to reserved name '%s', ignored\n",
                         label.c_str(), desc.texture->sampler.c_str());
        }
    }

    return table;
}

} // anonymous namespace

std::vector<Layer> buildLayers(const std::vector<LayerDescription>& descriptions,
                               Vec2 resolution,
                               const LayerBuildHooks& hooks) {
    std::vector<Layer> layers;
    layers.reserve(descriptions.size());

    for (std::size_t i = 0; i < descriptions.size(); ++i) {
        const LayerDescription& desc = descriptions[i];
        const std::string label = layerLabel(desc, i);

        if (desc.vertexSource.empty()) {
            std::fprintf(stderr, "[layerfx] error: %s has no vertex shader, dropped\n",
                         label.c_str());
            continue;
        }

        Layer layer;
        layer.kind        = desc.kind;
        layer.visible     = desc.visible;
        layer.sourceIndex = i;
        layer.uniforms    = buildTable(desc, resolution, hooks, label);

        for (std::size_t p = 0; p < desc.fragmentSources.size(); ++p) {
            const std::string& fragment = desc.fragmentSources[p];
            const std::string passLabel = label + " pass " + std::to_string(p);

            if (fragment.empty()) {
                std::fprintf(stderr, "[layerfx] warning: %s has no fragment shader, skipped\n",
                             passLabel.c_str());
                continue;
            }

            if (!hooks.compile) {
                std::fprintf(stderr, "[layerfx] warning: %s: no shader compiler, skipped\n",
                             passLabel.c_str());
                continue;
            }

            auto program = hooks.compile(layer.uniforms, desc.vertexSource, fragment, passLabel);
            if (!program.ok()) {
                std::fprintf(stderr, "[layerfx] warning: %s skipped: %s\n",
                             passLabel.c_str(), program.error().format().c_str());
                continue;
            }

            layer.programs.push_back(program.value());
            if (referencesBackgroundImage(fragment)) {
                layer.needsBackgroundImage = true;
            }
        }

        if (layer.programs.empty()) {
            std::fprintf(stderr, "[layerfx] error: %s has no usable passes, dropped\n",
                         label.c_str());
            continue;
        }

        std::fprintf(stderr, "[layerfx] built %s: %zu pass(es)%s%s\n",
                     label.c_str(), layer.programs.size(),
                     layer.visible ? "" : ", hidden",
                     layer.needsBackgroundImage ? ", reads background" : "");
        layers.push_back(std::move(layer));
    }

    return layers;
}

} // namespace layerfx
