#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace layerfx {

// GLSL identifiers of the pipeline-managed uniforms. Every layer table holds
// all five; layer declarations never overwrite them.
namespace uniform_names {
inline constexpr std::string_view Time              = "uTime";
inline constexpr std::string_view Resolution        = "uResolution";
inline constexpr std::string_view Pointer           = "uMousePos";
inline constexpr std::string_view InputImage        = "uTexture";
inline constexpr std::string_view BackgroundImage   = "uBgTexture";
inline constexpr std::string_view DefaultCustomTexture = "uCustomTexture";
} // namespace uniform_names

[[nodiscard]] bool isReservedUniform(std::string_view name);

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
    bool operator==(const Vec2&) const = default;
};

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    bool operator==(const Vec3&) const = default;
};

struct Vec4 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 0.0f;
    bool operator==(const Vec4&) const = default;
};

// Shared slot for a texture that may not exist yet. Copies refer to the same
// slot, so a loader resolving it is seen by every uniform table holding it.
// view() never blocks: it is VK_NULL_HANDLE unless the slot is Ready, and
// callers bind a default texture in that case.
//
// Thread safety: thread-confined (render thread). Decoding happens elsewhere;
// only the render thread resolves or fails a slot.
class TextureHandle {
public:
    enum class State : std::uint8_t {
        Empty,   // no texture requested
        Pending, // load in flight
        Ready,
        Failed,
    };

    TextureHandle() = default;

    [[nodiscard]] static TextureHandle pending();
    [[nodiscard]] static TextureHandle ready(VkImageView view);

    // Pending -> Ready / Failed. No-op on an empty handle.
    void resolve(VkImageView view);
    void fail();

    [[nodiscard]] State       state() const;
    [[nodiscard]] VkImageView view()  const;
    [[nodiscard]] bool        isReady() const { return state() == State::Ready; }

    [[nodiscard]] bool sharesSlotWith(const TextureHandle& other) const {
        return slot_ != nullptr && slot_ == other.slot_;
    }

private:
    struct Slot {
        State       state = State::Pending;
        VkImageView view  = VK_NULL_HANDLE;
    };

    std::shared_ptr<Slot> slot_;
};

// A declared uniform whose type tag layerfx does not understand. The raw value
// is kept as JSON text so nothing is lost; it is never sent to a shader.
struct OpaqueValue {
    std::string typeTag;
    std::string json;
    bool operator==(const OpaqueValue&) const = default;
};

enum class UniformType : std::uint8_t {
    Scalar,
    Vector2,
    Vector3,
    Vector4,
    Texture,
    Opaque,
};

using UniformValue = std::variant<float, Vec2, Vec3, Vec4, TextureHandle, OpaqueValue>;

[[nodiscard]] UniformType  uniformType(const UniformValue& value);
[[nodiscard]] const char*  uniformTypeName(UniformType type);

// Per-layer uniform table, ordered by name. Built by value for every layer;
// never shared between layers.
class UniformTable {
public:
    // Reserved entries: uTime = 0, uResolution = resolution,
    // uMousePos = (0.5, 0.5), uTexture and uBgTexture empty.
    [[nodiscard]] static UniformTable withDefaults(Vec2 resolution);

    // Merge a layer declaration. Returns false (and leaves the table alone)
    // when the name is reserved.
    bool declare(const std::string& name, UniformValue value);

    // Bind a custom texture under `name`, replacing any declared uniform of
    // that name. Returns false when the name is reserved.
    bool bindTexture(const std::string& name, TextureHandle texture);

    void setTime(float seconds);
    void setResolution(Vec2 resolution);
    void setPointer(Vec2 normalized);
    void setInputImage(TextureHandle texture);
    void setBackgroundImage(TextureHandle texture);

    [[nodiscard]] float         time()            const;
    [[nodiscard]] Vec2          resolution()      const;
    [[nodiscard]] Vec2          pointer()         const;
    [[nodiscard]] TextureHandle inputImage()      const;
    [[nodiscard]] TextureHandle backgroundImage() const;

    [[nodiscard]] const UniformValue* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    template <typename T>
    [[nodiscard]] const T* get(std::string_view name) const {
        const UniformValue* v = find(name);
        return v ? std::get_if<T>(v) : nullptr;
    }

    [[nodiscard]] std::size_t size() const { return entries_.size(); }

    using Entries = std::map<std::string, UniformValue, std::less<>>;
    [[nodiscard]] Entries::const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] Entries::const_iterator end()   const { return entries_.end(); }

private:
    void setReserved(std::string_view name, UniformValue value);

    Entries entries_;
};

} // namespace layerfx
