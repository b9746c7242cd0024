#pragma once

#include <vector>

namespace layerfx::wsi {

// Instance extensions the windowing system needs for surface creation.
// Valid once SDL video is initialized; no window required.
[[nodiscard]] std::vector<const char*> requiredInstanceExtensions();

} // namespace layerfx::wsi
