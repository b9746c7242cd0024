#include <layerfx/uniforms.hpp>

#include <string>

namespace layerfx {

bool isReservedUniform(std::string_view name) {
    return name == uniform_names::Time ||
           name == uniform_names::Resolution ||
           name == uniform_names::Pointer ||
           name == uniform_names::InputImage ||
           name == uniform_names::BackgroundImage;
}

TextureHandle TextureHandle::pending() {
    TextureHandle h;
    h.slot_ = std::make_shared<Slot>();
    return h;
}

TextureHandle TextureHandle::ready(VkImageView view) {
    TextureHandle h;
    h.slot_ = std::make_shared<Slot>();
    h.slot_->state = State::Ready;
    h.slot_->view  = view;
    return h;
}

void TextureHandle::resolve(VkImageView view) {
    if (!slot_) return;
    slot_->state = State::Ready;
    slot_->view  = view;
}

void TextureHandle::fail() {
    if (!slot_) return;
    slot_->state = State::Failed;
    slot_->view  = VK_NULL_HANDLE;
}

TextureHandle::State TextureHandle::state() const {
    return slot_ ? slot_->state : State::Empty;
}

VkImageView TextureHandle::view() const {
    if (!slot_ || slot_->state != State::Ready) return VK_NULL_HANDLE;
    return slot_->view;
}

UniformType uniformType(const UniformValue& value) {
    switch (value.index()) {
    case 0: return UniformType::Scalar;
    case 1: return UniformType::Vector2;
    case 2: return UniformType::Vector3;
    case 3: return UniformType::Vector4;
    case 4: return UniformType::Texture;
    default: return UniformType::Opaque;
    }
}

const char* uniformTypeName(UniformType type) {
    switch (type) {
    case UniformType::Scalar:  return "float";
    case UniformType::Vector2: return "vec2";
    case UniformType::Vector3: return "vec3";
    case UniformType::Vector4: return "vec4";
    case UniformType::Texture: return "sampler2D";
    case UniformType::Opaque:  return "opaque";
    }
    return "opaque";
}

UniformTable UniformTable::withDefaults(Vec2 resolution) {
    UniformTable t;
    t.setReserved(uniform_names::Time, 0.0f);
    t.setReserved(uniform_names::Resolution, resolution);
    t.setReserved(uniform_names::Pointer, Vec2{0.5f, 0.5f});
    t.setReserved(uniform_names::InputImage, TextureHandle{});
    t.setReserved(uniform_names::BackgroundImage, TextureHandle{});
    return t;
}

bool UniformTable::declare(const std::string& name, UniformValue value) {
    if (isReservedUniform(name)) return false;
    entries_.insert_or_assign(name, std::move(value));
    return true;
}

bool UniformTable::bindTexture(const std::string& name, TextureHandle texture) {
    if (isReservedUniform(name)) return false;
    entries_.insert_or_assign(name, UniformValue{std::move(texture)});
    return true;
}

void UniformTable::setReserved(std::string_view name, UniformValue value) {
    auto it = entries_.find(name);
    if (it != entries_.end()) {
        it->second = std::move(value);
    } else {
        entries_.emplace(std::string(name), std::move(value));
    }
}

void UniformTable::setTime(float seconds)             { setReserved(uniform_names::Time, seconds); }
void UniformTable::setResolution(Vec2 resolution)     { setReserved(uniform_names::Resolution, resolution); }
void UniformTable::setPointer(Vec2 normalized)        { setReserved(uniform_names::Pointer, normalized); }
void UniformTable::setInputImage(TextureHandle t)     { setReserved(uniform_names::InputImage, std::move(t)); }
void UniformTable::setBackgroundImage(TextureHandle t) { setReserved(uniform_names::BackgroundImage, std::move(t)); }

float UniformTable::time() const {
    const float* v = get<float>(uniform_names::Time);
    return v ? *v : 0.0f;
}

Vec2 UniformTable::resolution() const {
    const Vec2* v = get<Vec2>(uniform_names::Resolution);
    return v ? *v : Vec2{};
}

Vec2 UniformTable::pointer() const {
    const Vec2* v = get<Vec2>(uniform_names::Pointer);
    return v ? *v : Vec2{0.5f, 0.5f};
}

TextureHandle UniformTable::inputImage() const {
    const TextureHandle* v = get<TextureHandle>(uniform_names::InputImage);
    return v ? *v : TextureHandle{};
}

TextureHandle UniformTable::backgroundImage() const {
    const TextureHandle* v = get<TextureHandle>(uniform_names::BackgroundImage);
    return v ? *v : TextureHandle{};
}

const UniformValue* UniformTable::find(std::string_view name) const {
    auto it = entries_.find(name);
    return it != entries_.end() ? &it->second : nullptr;
}

} // namespace layerfx
