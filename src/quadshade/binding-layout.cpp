#include <quadshade/binding-layout.h>
#include <quadshade/shader-types.h>

#include <cstddef>
#include <string>
#include <vector>

namespace quadshade {

namespace {

constexpr uint32_t VERTEX_FRAGMENT = STAGE_VERTEX | STAGE_FRAGMENT;

//-----------------------------------------------------------------------------
// Bind group layouts
//-----------------------------------------------------------------------------
const BindingSlot PANEL_BINDINGS[] = {
    {0, 0, ResourceKind::UniformBuffer, VERTEX_FRAGMENT, sizeof(CameraUniform), "camera"},
    {1, 0, ResourceKind::UniformBuffer, STAGE_VERTEX, sizeof(PanelUniform), "panel"},
    {2, 0, ResourceKind::UniformBuffer, STAGE_VERTEX, sizeof(ModelUniform), "position"},
};

const BindingSlot TEXTURED_BINDINGS[] = {
    {0, 0, ResourceKind::UniformBuffer, VERTEX_FRAGMENT, sizeof(CameraUniform), "camera"},
    {1, 0, ResourceKind::Texture, STAGE_FRAGMENT, 0, "texture"},
    {1, 1, ResourceKind::Sampler, STAGE_FRAGMENT, 0, "sampler"},
};

const BindingSlot GLYPH_BINDINGS[] = {
    {0, 0, ResourceKind::UniformBuffer, VERTEX_FRAGMENT, sizeof(CameraUniform), "camera"},
    {1, 0, ResourceKind::Texture, STAGE_FRAGMENT, 0, "atlas"},
    {1, 1, ResourceKind::Sampler, STAGE_FRAGMENT, 0, "sampler"},
    {2, 0, ResourceKind::UniformBuffer, STAGE_VERTEX, sizeof(ModelUniform), "position"},
};

//-----------------------------------------------------------------------------
// Vertex buffer layouts
//
// Instance attributes follow the SpriteInstance / GlyphInstance field
// offsets; the transform is consumed as four column vectors.
//-----------------------------------------------------------------------------
constexpr uint64_t TRANSFORM_OFFSET = offsetof(SpriteInstance, transform);
constexpr uint64_t COLUMN_SIZE = sizeof(glm::vec4);

const VertexAttribute QUAD_VERTEX_ATTRIBUTES[] = {
    {VertexFormat::Float32x2, offsetof(QuadVertex, position), 0},
    {VertexFormat::Float32x2, offsetof(QuadVertex, uv), 1},
};

const VertexAttribute QUAD_INSTANCE_ATTRIBUTES[] = {
    {VertexFormat::Float32x4, TRANSFORM_OFFSET + 0 * COLUMN_SIZE, 2},
    {VertexFormat::Float32x4, TRANSFORM_OFFSET + 1 * COLUMN_SIZE, 3},
    {VertexFormat::Float32x4, TRANSFORM_OFFSET + 2 * COLUMN_SIZE, 4},
    {VertexFormat::Float32x4, TRANSFORM_OFFSET + 3 * COLUMN_SIZE, 5},
    {VertexFormat::Float32x4, offsetof(SpriteInstance, color), 6},
    {VertexFormat::Float32x4, offsetof(SpriteInstance, size), 7},
};

const VertexAttribute SPRITE_INSTANCE_ATTRIBUTES[] = {
    {VertexFormat::Float32x4, TRANSFORM_OFFSET + 0 * COLUMN_SIZE, 0},
    {VertexFormat::Float32x4, TRANSFORM_OFFSET + 1 * COLUMN_SIZE, 1},
    {VertexFormat::Float32x4, TRANSFORM_OFFSET + 2 * COLUMN_SIZE, 2},
    {VertexFormat::Float32x4, TRANSFORM_OFFSET + 3 * COLUMN_SIZE, 3},
    {VertexFormat::Float32x4, offsetof(SpriteInstance, color), 4},
    {VertexFormat::Float32x4, offsetof(SpriteInstance, size), 5},
};

const VertexAttribute GLYPH_INSTANCE_ATTRIBUTES[] = {
    {VertexFormat::Float32x2, offsetof(GlyphInstance, glyphPos), 0},
    {VertexFormat::Float32x2, offsetof(GlyphInstance, glyphSize), 1},
    {VertexFormat::Float32x2, offsetof(GlyphInstance, uvStart), 2},
    {VertexFormat::Float32x2, offsetof(GlyphInstance, uvEnd), 3},
    {VertexFormat::Uint32, offsetof(GlyphInstance, color), 4},
};

const VertexBufferLayout QUAD_BUFFERS[] = {
    {sizeof(QuadVertex), StepMode::Vertex, QUAD_VERTEX_ATTRIBUTES},
    {sizeof(SpriteInstance), StepMode::Instance, QUAD_INSTANCE_ATTRIBUTES},
};

const VertexBufferLayout SPRITE_BUFFERS[] = {
    {sizeof(SpriteInstance), StepMode::Instance, SPRITE_INSTANCE_ATTRIBUTES},
};

const VertexBufferLayout GLYPH_BUFFERS[] = {
    {sizeof(GlyphInstance), StepMode::Instance, GLYPH_INSTANCE_ATTRIBUTES},
};

std::string slotName(uint32_t group, uint32_t binding) {
    return "group " + std::to_string(group) + " binding " + std::to_string(binding);
}

} // anonymous namespace

std::span<const BindingSlot> bindingLayout(ShaderVariant variant) {
    switch (variant) {
        case ShaderVariant::Panel: return PANEL_BINDINGS;
        case ShaderVariant::Sprite:
        case ShaderVariant::Quad: return TEXTURED_BINDINGS;
        case ShaderVariant::Glyph: return GLYPH_BINDINGS;
    }
    return {};
}

uint32_t bindGroupCount(ShaderVariant variant) {
    uint32_t count = 0;
    for (const auto& slot : bindingLayout(variant)) {
        if (slot.group + 1 > count) count = slot.group + 1;
    }
    return count;
}

const char* toString(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::UniformBuffer: return "uniform buffer";
        case ResourceKind::Texture: return "texture";
        case ResourceKind::Sampler: return "sampler";
    }
    return "unknown";
}

std::span<const VertexBufferLayout> vertexBuffers(ShaderVariant variant) {
    switch (variant) {
        case ShaderVariant::Panel: return {};
        case ShaderVariant::Sprite: return SPRITE_BUFFERS;
        case ShaderVariant::Quad: return QUAD_BUFFERS;
        case ShaderVariant::Glyph: return GLYPH_BUFFERS;
    }
    return {};
}

uint64_t formatSize(VertexFormat format) {
    switch (format) {
        case VertexFormat::Float32x2: return 8;
        case VertexFormat::Float32x4: return 16;
        case VertexFormat::Uint32: return 4;
    }
    return 0;
}

Result<void> validateBindings(ShaderVariant variant, std::span<const BoundResource> bound) {
    auto layout = bindingLayout(variant);
    std::vector<bool> seen(layout.size(), false);

    for (const auto& res : bound) {
        size_t index = layout.size();
        for (size_t i = 0; i < layout.size(); ++i) {
            if (layout[i].group == res.group && layout[i].binding == res.binding) {
                index = i;
                break;
            }
        }
        std::string where = std::string(toString(variant)) + ": " + slotName(res.group, res.binding);

        if (index == layout.size()) {
            return Err(where + " is not declared by the pipeline layout");
        }
        const BindingSlot& slot = layout[index];
        if (seen[index]) {
            return Err(where + " (" + slot.label + ") is bound more than once");
        }
        seen[index] = true;

        if (res.kind != slot.kind) {
            return Err(where + " (" + slot.label + ") expects a " + toString(slot.kind) +
                       ", got a " + toString(res.kind));
        }
        if (slot.kind == ResourceKind::UniformBuffer && res.size < slot.minSize) {
            return Err(where + " (" + slot.label + ") needs " + std::to_string(slot.minSize) +
                       " bytes, buffer has " + std::to_string(res.size));
        }
    }

    for (size_t i = 0; i < layout.size(); ++i) {
        if (!seen[i]) {
            return Err(std::string(toString(variant)) + ": " +
                       slotName(layout[i].group, layout[i].binding) +
                       " (" + layout[i].label + ") is not bound");
        }
    }
    return Ok();
}

} // namespace quadshade
