#include <layerfx/texture_loader.hpp>
#include <layerfx/allocator.hpp>
#include <layerfx/device.hpp>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <string>
#include <utility>

namespace layerfx {

TextureLoader::TextureLoader(const Device& device, const Allocator& allocator)
    : device_(&device), allocator_(&allocator) {}

TextureLoader::~TextureLoader() {
    // Futures from std::async join in their destructors; nothing to upload.
    inFlight_.clear();
}

TextureHandle TextureLoader::request(const std::string& source) {
    auto it = bySource_.find(source);
    if (it != bySource_.end()) return it->second;

    std::filesystem::path path(source);

    TextureHandle handle = TextureHandle::pending();
    bySource_.emplace(source, handle);

    InFlight job;
    job.source  = source;
    job.handle  = handle;
    job.decoded = std::async(std::launch::async, [path] { return loadImage(path); });
    inFlight_.push_back(std::move(job));
    return handle;
}

void TextureLoader::complete(InFlight& job) {
    auto data = job.decoded.get();
    if (!data.ok()) {
        std::fprintf(stderr, "[layerfx] error: texture '%s': %s\n",
                     job.source.c_str(), data.error().format().c_str());
        job.handle.fail();
        return;
    }

    auto image = uploadTexture(*allocator_, *device_, data.value());
    if (!image.ok()) {
        std::fprintf(stderr, "[layerfx] error: texture '%s': %s\n",
                     job.source.c_str(), image.error().format().c_str());
        job.handle.fail();
        return;
    }

    job.handle.resolve(image.value().vkImageView());
    std::fprintf(stderr, "[layerfx] texture '%s' loaded (%ux%u)\n",
                 job.source.c_str(), data.value().width, data.value().height);
    images_.push_back(std::move(image).value());
}

std::size_t TextureLoader::poll() {
    std::size_t changed = 0;
    for (auto it = inFlight_.begin(); it != inFlight_.end();) {
        if (it->decoded.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }
        complete(*it);
        ++changed;
        it = inFlight_.erase(it);
    }
    return changed;
}

std::size_t TextureLoader::finish() {
    for (auto& job : inFlight_) job.decoded.wait();
    return poll();
}

} // namespace layerfx
