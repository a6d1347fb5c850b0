#pragma once

#include <quadshade/quad-geometry.h>
#include <quadshade/shader-types.h>
#include <quadshade/shading-options.h>
#include <glm/glm.hpp>
#include <cstdint>

namespace quadshade {

//-----------------------------------------------------------------------------
// Varyings - what the vertex stage hands to rasterization
//
// Panel:         uv, selectionRangeY
// Sprite / Quad: uv, color
// Glyph:         uv, packedColor (flat, not interpolated)
//-----------------------------------------------------------------------------
struct Varyings {
    glm::vec4 clipPosition{0.0f};
    glm::vec2 uv{0.0f};
    glm::vec4 color{0.0f};
    glm::vec2 selectionRangeY{0.0f};
    uint32_t packedColor = 0;
};

// clip = projection * model * vec4(local, 1, 1). z and w are both fed 1;
// this is a 2D convention, not a perspective depth.
glm::vec4 toClip(const CameraUniform& camera, const glm::mat4& model, glm::vec2 local);

//-----------------------------------------------------------------------------
// Per-variant vertex programs. vertexIndex selects the corner from the
// geometry; the procedural overloads use the built-in ordinal (0..3).
//-----------------------------------------------------------------------------

// local = corner * panel.size.xy + anchor.offset(panel.size.xy)
Varyings panelVertex(const CameraUniform& camera, const PanelUniform& panel,
                     const ModelUniform& position, uint32_t ordinal,
                     const PanelAnchor& anchor = {});

// local = corner * instance.size, model = instance.transform.
// Serves both Sprite (ProceduralQuad) and Quad (ExplicitQuad).
Varyings texturedVertex(const CameraUniform& camera, const SpriteInstance& instance,
                        const QuadGeometry& geometry, uint32_t vertexIndex);

Varyings spriteVertex(const CameraUniform& camera, const SpriteInstance& instance,
                      uint32_t ordinal);

// local = corner * glyphSize + glyphPos, model = entity Position
Varyings glyphVertex(const CameraUniform& camera, const ModelUniform& position,
                     const GlyphInstance& glyph, uint32_t ordinal);

} // namespace quadshade
