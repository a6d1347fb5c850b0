#include <quadshade/fragment-stage.h>

namespace quadshade {

glm::vec4 panelFragment(const PanelUniform& panel, const Varyings& in) {
    if (insideSelection(in.uv.y, in.selectionRangeY)) {
        return panel.selectionColor;
    }
    return panel.menuColor;
}

glm::vec4 texturedFragment(const TextureSampler& texture, const Varyings& in) {
    return texture.sample(in.uv) * in.color;
}

glm::vec4 glyphFragment(const TextureSampler& atlas, const Varyings& in, ColorDecode decode) {
    glm::vec4 color = unpackColor(in.packedColor, decode);
    float coverage = atlas.sample(in.uv).r;
    return {color.r, color.g, color.b, color.a * coverage};
}

} // namespace quadshade
