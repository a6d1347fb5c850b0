#pragma once

#include <quadshade/packed-color.h>
#include <quadshade/shader-types.h>
#include <quadshade/texture.h>
#include <quadshade/vertex-stage.h>
#include <glm/glm.hpp>

namespace quadshade {

// Strict on both ends: a fragment exactly on start or end is not selected
inline bool insideSelection(float y, glm::vec2 rangeY) {
    return rangeY.x < y && y < rangeY.y;
}

// selectionColor inside the range, menuColor elsewhere. No sampling.
glm::vec4 panelFragment(const PanelUniform& panel, const Varyings& in);

// textureSample(uv) * color, alpha included
glm::vec4 texturedFragment(const TextureSampler& texture, const Varyings& in);

// rgb from the packed instance color, alpha = color.a * coverage.r
glm::vec4 glyphFragment(const TextureSampler& atlas, const Varyings& in,
                        ColorDecode decode = ColorDecode::Conventional);

} // namespace quadshade
