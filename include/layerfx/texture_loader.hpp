#pragma once

#include <layerfx/image.hpp>
#include <layerfx/result.hpp>
#include <layerfx/texture.hpp>
#include <layerfx/uniforms.hpp>

#include <cstddef>
#include <future>
#include <string>
#include <unordered_map>
#include <vector>

namespace layerfx {

class Allocator;
class Device;

// Asynchronous custom-texture loading. request() hands out a Pending handle
// immediately and decodes the file on a worker thread. poll(), called once per
// frame on the render thread, uploads finished decodes and resolves their
// handles. Requests for the same source share one handle and one image.
// Sources are file paths, used as given.
//
// Thread safety: thread-confined (render thread). Decoding runs on
// std::async workers that touch nothing but the file.
class TextureLoader {
public:
    TextureLoader(const Device& device, const Allocator& allocator);
    ~TextureLoader();

    TextureLoader(const TextureLoader&) = delete;
    TextureLoader& operator=(const TextureLoader&) = delete;

    [[nodiscard]] TextureHandle request(const std::string& source);

    // Returns the number of handles that changed state.
    std::size_t poll();

    // Block until every in-flight decode has finished, then poll().
    std::size_t finish();

    [[nodiscard]] std::size_t pendingCount() const { return inFlight_.size(); }
    [[nodiscard]] std::size_t loadedCount()  const { return images_.size(); }

private:
    struct InFlight {
        std::string                    source;
        TextureHandle                  handle;
        std::future<Result<ImageData>> decoded;
    };

    void complete(InFlight& job);

    const Device*                                  device_;
    const Allocator*                               allocator_;
    std::unordered_map<std::string, TextureHandle> bySource_;
    std::vector<InFlight>                          inFlight_;
    std::vector<Image>                             images_;
};

} // namespace layerfx
