//=============================================================================
// Vertex Stage Tests
//
// Panel anchor offset, sprite/quad instance transform, glyph placement,
// the z = w = 1 local convention and projection * model ordering
//=============================================================================

#include <boost/ut.hpp>
#include <quadshade/vertex-stage.h>
#include <glm/gtc/matrix_transform.hpp>
#include "test_helpers.h"

using namespace boost::ut;
using namespace quadshade;
using quadshade::test::near;

namespace {

glm::mat4 translation(float x, float y) {
    return glm::translate(glm::mat4(1.0f), glm::vec3(x, y, 0.0f));
}

glm::mat4 scaling(float x, float y) {
    return glm::scale(glm::mat4(1.0f), glm::vec3(x, y, 1.0f));
}

} // namespace

suite vertex_stage_tests = [] {
    "toClip feeds z = w = 1"_test = [] {
        CameraUniform camera;
        glm::vec4 clip = toClip(camera, glm::mat4(1.0f), {3.0f, 4.0f});
        expect(near(clip, {3.0f, 4.0f, 1.0f, 1.0f}));
    };

    "model applies before projection"_test = [] {
        CameraUniform camera;
        camera.projection = scaling(2.0f, 2.0f);
        glm::vec4 clip = toClip(camera, translation(1.0f, 0.0f), {1.0f, 1.0f});
        // (1,1) moved to (2,1), then scaled to (4,2)
        expect(near(clip, {4.0f, 2.0f, 1.0f, 1.0f}));
    };

    "panel corners carry the anchor offset"_test = [] {
        CameraUniform camera;
        ModelUniform position;
        PanelUniform panel = PanelUniform::make({200.0f, 100.0f}, glm::vec4(1.0f),
                                                glm::vec4(1.0f), {0.3f, 0.6f});

        // offset = (200 / 2, -100 / 2.5) = (100, -40)
        Varyings topLeft = panelVertex(camera, panel, position, 0);
        expect(near(glm::vec2(topLeft.clipPosition), {0.0f, 10.0f}));

        Varyings bottomRight = panelVertex(camera, panel, position, 3);
        expect(near(glm::vec2(bottomRight.clipPosition), {200.0f, -90.0f}));
        expect(near(bottomRight.uv, {1.0f, 1.0f}));
        expect(near(bottomRight.selectionRangeY, {0.3f, 0.6f}));
    };

    "panel follows the Position transform"_test = [] {
        CameraUniform camera;
        ModelUniform position{translation(10.0f, 20.0f)};
        PanelUniform panel = PanelUniform::make({2.0f, 5.0f}, glm::vec4(1.0f), glm::vec4(1.0f), {0, 0});

        // local (-1, 2.5) + offset (1, -2) = (0, 0.5), then translated
        Varyings v = panelVertex(camera, panel, position, 0);
        expect(near(v.clipPosition, {10.0f, 20.5f, 1.0f, 1.0f}));
    };

    "panel anchor divisors are configurable"_test = [] {
        CameraUniform camera;
        ModelUniform position;
        PanelUniform panel = PanelUniform::make({4.0f, 4.0f}, glm::vec4(1.0f), glm::vec4(1.0f), {0, 0});
        PanelAnchor centered{1e30f, 1e30f};

        Varyings v = panelVertex(camera, panel, position, 0, centered);
        expect(near(glm::vec2(v.clipPosition), {-2.0f, 2.0f}));
    };

    "sprite scales the unit quad then applies its transform"_test = [] {
        CameraUniform camera;
        SpriteInstance instance;
        instance.size = {10.0f, 4.0f};
        instance.transform = translation(100.0f, 50.0f);
        instance.color = {0.2f, 0.4f, 0.6f, 0.8f};

        Varyings v = spriteVertex(camera, instance, 1);
        expect(near(glm::vec2(v.clipPosition), {95.0f, 48.0f}));
        expect(near(v.uv, {0.0f, 1.0f}));
        expect(near(v.color, instance.color));
    };

    "quad takes its corner from the vertex buffer"_test = [] {
        CameraUniform camera;
        SpriteInstance instance;
        instance.size = {2.0f, 2.0f};
        const QuadVertex vertices[] = {
            {{0.0f, 0.0f}, {0.5f, 0.5f}},
            {{1.0f, 0.0f}, {1.0f, 0.5f}},
            {{0.0f, 1.0f}, {0.5f, 1.0f}},
            {{1.0f, 1.0f}, {1.0f, 1.0f}},
        };
        ExplicitQuad geometry(vertices);

        Varyings v = texturedVertex(camera, instance, geometry, 2);
        expect(near(glm::vec2(v.clipPosition), {0.0f, 2.0f}));
        expect(near(v.uv, {0.5f, 1.0f}));
    };

    "sprite rotation comes from the instance transform"_test = [] {
        CameraUniform camera;
        SpriteInstance instance;
        instance.size = {2.0f, 2.0f};
        instance.transform = glm::rotate(glm::mat4(1.0f), glm::radians(90.0f), glm::vec3(0, 0, 1));

        // top-right (1, 1) rotates to (-1, 1)
        Varyings v = spriteVertex(camera, instance, 2);
        expect(near(glm::vec2(v.clipPosition), {-1.0f, 1.0f}));
    };

    "glyph is placed at glyphPos in the entity frame"_test = [] {
        CameraUniform camera;
        ModelUniform position{translation(5.0f, 0.0f)};
        GlyphInstance glyph;
        glyph.glyphPos = {10.0f, 20.0f};
        glyph.glyphSize = {8.0f, 16.0f};
        glyph.uvStart = {0.1f, 0.2f};
        glyph.uvEnd = {0.3f, 0.4f};
        glyph.color = 0xFF00FF00u;

        Varyings v = glyphVertex(camera, position, glyph, 0);
        // (-0.5 * 8 + 10 + 5, 0.5 * 16 + 20)
        expect(near(glm::vec2(v.clipPosition), {11.0f, 28.0f}));
        expect(near(v.uv, {0.1f, 0.2f}));
        expect(v.packedColor == 0xFF00FF00u);

        Varyings corner3 = glyphVertex(camera, position, glyph, 3);
        expect(near(corner3.uv, {0.3f, 0.4f}));
    };

    "camera projection maps to clip space"_test = [] {
        CameraUniform camera;
        camera.projection = glm::ortho(0.0f, 100.0f, 0.0f, 100.0f);
        SpriteInstance instance;
        instance.size = {100.0f, 100.0f};
        instance.transform = translation(50.0f, 50.0f);

        Varyings v = spriteVertex(camera, instance, 3);
        expect(near(glm::vec2(v.clipPosition), {1.0f, -1.0f}));
        expect(near(v.clipPosition.w, 1.0f));
    };
};
