#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstddef>
#include <cstdint>

namespace quadshade {

//-----------------------------------------------------------------------------
// Uniform records
//
// Layouts match what the WGSL programs declare (std140-compatible), so the
// host can upload these structs byte-for-byte.
//-----------------------------------------------------------------------------

// Group 0, binding 0 of every variant. Bound once per frame.
struct CameraUniform {
    glm::mat4 projection{1.0f}; // 64 bytes, offset 0
    glm::vec3 position{0.0f};   // 12 bytes, offset 64
    uint32_t _pad = 0;          //  4 bytes, offset 76
};

// The entity's model transform ("Position" uniform). One per drawable.
struct ModelUniform {
    glm::mat4 transform{1.0f};
};

// Per-panel draw state ("Ui" uniform). Only size.xy and selectionRangeY.xy
// are read; the rest is padding to 16-byte boundaries.
struct PanelUniform {
    glm::vec4 size{1.0f, 1.0f, 0.0f, 0.0f};
    glm::vec4 menuColor{1.0f, 1.0f, 1.0f, 1.0f};
    glm::vec4 selectionColor{1.0f, 0.0f, 0.0f, 1.0f};
    glm::vec4 selectionRangeY{0.0f};

    static PanelUniform make(glm::vec2 size, glm::vec4 menuColor,
                             glm::vec4 selectionColor, glm::vec2 rangeY) {
        PanelUniform u;
        u.size = glm::vec4(size, 0.0f, 0.0f);
        u.menuColor = menuColor;
        u.selectionColor = selectionColor;
        u.selectionRangeY = glm::vec4(rangeY, 0.0f, 0.0f);
        return u;
    }
};

//-----------------------------------------------------------------------------
// Vertex / instance records
//-----------------------------------------------------------------------------

// Explicit per-vertex record of the Quad variant
struct QuadVertex {
    glm::vec2 position; // offset 0
    glm::vec2 uv;       // offset 8
};

// Per-instance record of the Sprite and Quad variants. The transform is
// stored as four column vectors.
struct SpriteInstance {
    glm::vec2 size{1.0f};       // offset 0
    glm::vec2 _pad{0.0f};       // offset 8
    glm::mat4 transform{1.0f};  // offset 16
    glm::vec4 color{1.0f};      // offset 80
};

using QuadInstance = SpriteInstance;

// Per-instance record of the Glyph variant. color is packed 0xAARRGGBB.
struct GlyphInstance {
    glm::vec2 glyphPos{0.0f};   // offset 0, top-left placement
    glm::vec2 glyphSize{0.0f};  // offset 8
    glm::vec2 uvStart{0.0f};    // offset 16
    glm::vec2 uvEnd{0.0f};      // offset 24
    uint32_t color = 0;         // offset 32
};

static_assert(sizeof(CameraUniform) == 80, "CameraUniform must be 80 bytes");
static_assert(sizeof(ModelUniform) == 64, "ModelUniform must be 64 bytes");
static_assert(sizeof(PanelUniform) == 64, "PanelUniform must be 64 bytes");
static_assert(sizeof(QuadVertex) == 16, "QuadVertex must be 16 bytes");
static_assert(sizeof(SpriteInstance) == 96, "SpriteInstance must be 96 bytes");
static_assert(sizeof(GlyphInstance) == 36, "GlyphInstance must be 36 bytes");
static_assert(offsetof(SpriteInstance, transform) == 16);
static_assert(offsetof(SpriteInstance, color) == 80);
static_assert(offsetof(GlyphInstance, color) == 32);

//-----------------------------------------------------------------------------
// Unit quad
//-----------------------------------------------------------------------------

// Vertex buffer contents for the Quad variant, in ordinal order
inline const std::array<QuadVertex, 4> UNIT_QUAD_VERTICES = {{
    {{-0.5f,  0.5f}, {0.0f, 0.0f}},  // top-left
    {{-0.5f, -0.5f}, {0.0f, 1.0f}},  // bottom-left
    {{ 0.5f,  0.5f}, {1.0f, 0.0f}},  // top-right
    {{ 0.5f, -0.5f}, {1.0f, 1.0f}},  // bottom-right
}};

// Index list for hosts that submit the quad as an indexed triangle list
inline constexpr std::array<uint16_t, 6> UNIT_QUAD_INDICES = {0, 1, 3, 0, 3, 2};

// Vertices per quad for strip-topology draws
inline constexpr uint32_t QUAD_VERTEX_COUNT = 4;

} // namespace quadshade
