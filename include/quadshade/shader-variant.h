#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace quadshade {

enum class ShaderVariant : uint32_t {
    Panel = 0,
    Sprite = 1,
    Quad = 2,
    Glyph = 3
};

inline constexpr ShaderVariant ALL_VARIANTS[] = {
    ShaderVariant::Panel, ShaderVariant::Sprite, ShaderVariant::Quad, ShaderVariant::Glyph
};

//-----------------------------------------------------------------------------
// Capabilities - what a variant's program does, chosen at pipeline creation
//-----------------------------------------------------------------------------
enum Capability : uint32_t {
    CAP_NONE = 0,
    CAP_TEXTURE = 1u << 0,          // samples a bound texture
    CAP_PANEL_SELECTION = 1u << 1,  // two-color selection range test
    CAP_PACKED_COLOR = 1u << 2,     // instance color is a packed u32
    CAP_EXPLICIT_GEOMETRY = 1u << 3 // corners come from a vertex buffer
};

uint32_t capabilities(ShaderVariant variant);

inline bool hasCapability(ShaderVariant variant, Capability cap) {
    return (capabilities(variant) & cap) != 0;
}

const char* toString(ShaderVariant variant);
std::optional<ShaderVariant> parseShaderVariant(std::string_view name);

//-----------------------------------------------------------------------------
// DrawShape - what the host issues per draw: a 4-vertex strip per quad,
// instanced. A panel is always a single instance.
//-----------------------------------------------------------------------------
struct DrawShape {
    uint32_t vertexCount;
    uint32_t instanceCount;
};

DrawShape drawShape(ShaderVariant variant, uint32_t instanceCount);

} // namespace quadshade
