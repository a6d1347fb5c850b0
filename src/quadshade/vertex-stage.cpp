#include <quadshade/vertex-stage.h>

namespace quadshade {

glm::vec4 toClip(const CameraUniform& camera, const glm::mat4& model, glm::vec2 local) {
    return camera.projection * model * glm::vec4(local, 1.0f, 1.0f);
}

Varyings panelVertex(const CameraUniform& camera, const PanelUniform& panel,
                     const ModelUniform& position, uint32_t ordinal,
                     const PanelAnchor& anchor) {
    Corner corner = quadCorner(ordinal);
    glm::vec2 size(panel.size);

    Varyings out;
    out.clipPosition = toClip(camera, position.transform,
                              corner.position * size + anchor.offset(size));
    out.uv = corner.uv;
    out.selectionRangeY = glm::vec2(panel.selectionRangeY);
    return out;
}

Varyings texturedVertex(const CameraUniform& camera, const SpriteInstance& instance,
                        const QuadGeometry& geometry, uint32_t vertexIndex) {
    Corner corner = geometry.corner(vertexIndex);

    Varyings out;
    out.clipPosition = toClip(camera, instance.transform, corner.position * instance.size);
    out.uv = corner.uv;
    out.color = instance.color;
    return out;
}

Varyings spriteVertex(const CameraUniform& camera, const SpriteInstance& instance,
                      uint32_t ordinal) {
    return texturedVertex(camera, instance, ProceduralQuad{}, ordinal);
}

Varyings glyphVertex(const CameraUniform& camera, const ModelUniform& position,
                     const GlyphInstance& glyph, uint32_t ordinal) {
    Corner corner = atlasCorner(ordinal, glyph.uvStart, glyph.uvEnd);

    Varyings out;
    out.clipPosition = toClip(camera, position.transform,
                              corner.position * glyph.glyphSize + glyph.glyphPos);
    out.uv = corner.uv;
    out.packedColor = glyph.color;
    return out;
}

} // namespace quadshade
