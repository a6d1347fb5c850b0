#include <quadshade/shader-variant.h>
#include <quadshade/shader-types.h>

namespace quadshade {

uint32_t capabilities(ShaderVariant variant) {
    switch (variant) {
        case ShaderVariant::Panel:
            return CAP_PANEL_SELECTION;
        case ShaderVariant::Sprite:
            return CAP_TEXTURE;
        case ShaderVariant::Quad:
            return CAP_TEXTURE | CAP_EXPLICIT_GEOMETRY;
        case ShaderVariant::Glyph:
            return CAP_TEXTURE | CAP_PACKED_COLOR;
    }
    return CAP_NONE;
}

const char* toString(ShaderVariant variant) {
    switch (variant) {
        case ShaderVariant::Panel: return "panel";
        case ShaderVariant::Sprite: return "sprite";
        case ShaderVariant::Quad: return "quad";
        case ShaderVariant::Glyph: return "glyph";
    }
    return "unknown";
}

std::optional<ShaderVariant> parseShaderVariant(std::string_view name) {
    for (ShaderVariant v : ALL_VARIANTS) {
        if (name == toString(v)) return v;
    }
    return std::nullopt;
}

DrawShape drawShape(ShaderVariant variant, uint32_t instanceCount) {
    if (variant == ShaderVariant::Panel) {
        return {QUAD_VERTEX_COUNT, 1};
    }
    return {QUAD_VERTEX_COUNT, instanceCount};
}

} // namespace quadshade
