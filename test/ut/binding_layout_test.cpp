//=============================================================================
// Shader Variant / Binding Layout Tests
//
// Capability flags, draw shape, the per-variant binding contract,
// vertex attribute layouts and binding validation
//=============================================================================

#include <boost/ut.hpp>
#include <quadshade/binding-layout.h>
#include <quadshade/shader-types.h>

#include <string>
#include <vector>

using namespace boost::ut;
using namespace quadshade;

namespace {

const BindingSlot* findSlot(ShaderVariant variant, uint32_t group, uint32_t binding) {
    for (const auto& slot : bindingLayout(variant)) {
        if (slot.group == group && slot.binding == binding) return &slot;
    }
    return nullptr;
}

std::vector<BoundResource> completeBinding(ShaderVariant variant) {
    std::vector<BoundResource> bound;
    for (const auto& slot : bindingLayout(variant)) {
        bound.push_back({slot.group, slot.binding, slot.kind, slot.minSize});
    }
    return bound;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

suite shader_variant_tests = [] {
    "capabilities per variant"_test = [] {
        expect(hasCapability(ShaderVariant::Panel, CAP_PANEL_SELECTION));
        expect(!hasCapability(ShaderVariant::Panel, CAP_TEXTURE));
        expect(hasCapability(ShaderVariant::Sprite, CAP_TEXTURE));
        expect(!hasCapability(ShaderVariant::Sprite, CAP_EXPLICIT_GEOMETRY));
        expect(hasCapability(ShaderVariant::Quad, CAP_EXPLICIT_GEOMETRY));
        expect(hasCapability(ShaderVariant::Glyph, CAP_PACKED_COLOR));
        expect(hasCapability(ShaderVariant::Glyph, CAP_TEXTURE));
    };

    "variant names round-trip"_test = [] {
        for (ShaderVariant v : ALL_VARIANTS) {
            expect(parseShaderVariant(toString(v)) == v);
        }
        expect(!parseShaderVariant("text").has_value());
    };

    "draws are 4-vertex strips, panels single-instance"_test = [] {
        DrawShape sprite = drawShape(ShaderVariant::Sprite, 12);
        expect(sprite.vertexCount == 4_u);
        expect(sprite.instanceCount == 12_u);

        DrawShape panel = drawShape(ShaderVariant::Panel, 12);
        expect(panel.vertexCount == 4_u);
        expect(panel.instanceCount == 1_u);

        expect(drawShape(ShaderVariant::Glyph, 0).instanceCount == 0_u);
    };
};

suite binding_layout_tests = [] {
    "camera is group 0 for every variant"_test = [] {
        for (ShaderVariant v : ALL_VARIANTS) {
            const BindingSlot* camera = findSlot(v, 0, 0);
            expect(camera != nullptr) << toString(v);
            expect(camera->kind == ResourceKind::UniformBuffer);
            expect(camera->visibility == (STAGE_VERTEX | STAGE_FRAGMENT));
            expect(camera->minSize == sizeof(CameraUniform));
        }
    };

    "panel binds its uniform and position"_test = [] {
        const BindingSlot* panel = findSlot(ShaderVariant::Panel, 1, 0);
        const BindingSlot* position = findSlot(ShaderVariant::Panel, 2, 0);
        expect(panel != nullptr && panel->minSize == sizeof(PanelUniform));
        expect(position != nullptr && position->minSize == sizeof(ModelUniform));
        expect(panel->visibility == STAGE_VERTEX);
        expect(bindGroupCount(ShaderVariant::Panel) == 3_u);
    };

    "sprite and quad bind texture and sampler only"_test = [] {
        for (ShaderVariant v : {ShaderVariant::Sprite, ShaderVariant::Quad}) {
            expect(bindingLayout(v).size() == 3_ul);
            expect(findSlot(v, 1, 0)->kind == ResourceKind::Texture);
            expect(findSlot(v, 1, 1)->kind == ResourceKind::Sampler);
            expect(findSlot(v, 1, 0)->visibility == STAGE_FRAGMENT);
            expect(bindGroupCount(v) == 2_u);
        }
    };

    "glyph binds atlas, sampler and position"_test = [] {
        expect(findSlot(ShaderVariant::Glyph, 1, 0)->kind == ResourceKind::Texture);
        expect(findSlot(ShaderVariant::Glyph, 1, 1)->kind == ResourceKind::Sampler);
        expect(findSlot(ShaderVariant::Glyph, 2, 0)->kind == ResourceKind::UniformBuffer);
        expect(bindGroupCount(ShaderVariant::Glyph) == 3_u);
    };

    "panel has no vertex buffers"_test = [] {
        expect(vertexBuffers(ShaderVariant::Panel).empty());
    };

    "quad vertex and instance buffers"_test = [] {
        auto buffers = vertexBuffers(ShaderVariant::Quad);
        expect(buffers.size() == 2_ul);

        expect(buffers[0].arrayStride == 16_ul);
        expect(buffers[0].stepMode == StepMode::Vertex);
        expect(buffers[0].attributes.size() == 2_ul);
        expect(buffers[0].attributes[1].offset == 8_ul);

        expect(buffers[1].arrayStride == 96_ul);
        expect(buffers[1].stepMode == StepMode::Instance);
        const auto& attrs = buffers[1].attributes;
        expect(attrs.size() == 6_ul);
        expect(attrs[0].location == 2_u && attrs[0].offset == 16_ul);
        expect(attrs[3].location == 5_u && attrs[3].offset == 64_ul);
        expect(attrs[4].location == 6_u && attrs[4].offset == 80_ul) << "color";
        expect(attrs[5].location == 7_u && attrs[5].offset == 0_ul) << "size";
    };

    "sprite instance attributes follow the record layout"_test = [] {
        auto buffers = vertexBuffers(ShaderVariant::Sprite);
        expect(buffers.size() == 1_ul);
        const auto& attrs = buffers[0].attributes;
        expect(attrs[0].location == 0_u && attrs[0].offset == 16_ul);
        expect(attrs[4].location == 4_u && attrs[4].offset == 80_ul);
        expect(attrs[5].location == 5_u && attrs[5].offset == 0_ul);
    };

    "attributes fit inside their stride"_test = [] {
        for (ShaderVariant v : ALL_VARIANTS) {
            for (const auto& buffer : vertexBuffers(v)) {
                for (const auto& attr : buffer.attributes) {
                    expect(attr.offset + formatSize(attr.format) <= buffer.arrayStride)
                        << toString(v) << "location" << attr.location;
                }
            }
        }
    };

    "glyph color is a u32 at offset 32"_test = [] {
        auto buffers = vertexBuffers(ShaderVariant::Glyph);
        expect(buffers[0].arrayStride == 36_ul);
        const auto& color = buffers[0].attributes[4];
        expect(color.format == VertexFormat::Uint32);
        expect(color.offset == 32_ul);
    };
};

suite binding_validation_tests = [] {
    "complete binding validates"_test = [] {
        for (ShaderVariant v : ALL_VARIANTS) {
            auto res = validateBindings(v, completeBinding(v));
            expect(res.has_value()) << toString(v) << error_msg(res);
        }
    };

    "missing slot is reported"_test = [] {
        auto bound = completeBinding(ShaderVariant::Glyph);
        bound.pop_back();
        auto res = validateBindings(ShaderVariant::Glyph, bound);
        expect(!res.has_value());
        expect(contains(res.error().message(), "group 2 binding 0")) << res.error().message();
        expect(contains(res.error().message(), "not bound"));
    };

    "wrong kind is reported"_test = [] {
        auto bound = completeBinding(ShaderVariant::Sprite);
        bound[1].kind = ResourceKind::Sampler;
        auto res = validateBindings(ShaderVariant::Sprite, bound);
        expect(!res.has_value());
        expect(contains(res.error().message(), "group 1 binding 0"));
    };

    "short uniform buffer is reported"_test = [] {
        auto bound = completeBinding(ShaderVariant::Panel);
        bound[1].size = 32;
        auto res = validateBindings(ShaderVariant::Panel, bound);
        expect(!res.has_value());
        expect(contains(res.error().message(), "64 bytes"));
    };

    "larger uniform buffer is accepted"_test = [] {
        auto bound = completeBinding(ShaderVariant::Panel);
        bound[0].size = 256;
        expect(validateBindings(ShaderVariant::Panel, bound).has_value());
    };

    "undeclared binding is rejected"_test = [] {
        auto bound = completeBinding(ShaderVariant::Sprite);
        bound.push_back({2, 0, ResourceKind::UniformBuffer, 64});
        auto res = validateBindings(ShaderVariant::Sprite, bound);
        expect(!res.has_value());
        expect(contains(res.error().message(), "not declared"));
    };

    "duplicate binding is rejected"_test = [] {
        auto bound = completeBinding(ShaderVariant::Quad);
        bound.push_back(bound.front());
        expect(!validateBindings(ShaderVariant::Quad, bound).has_value());
    };

    "nothing bound fails on the camera"_test = [] {
        auto res = validateBindings(ShaderVariant::Panel, {});
        expect(!res.has_value());
        expect(contains(res.error().message(), "camera"));
    };
};
