//=============================================================================
// Quad Geometry Tests
//
// Procedural corner table, atlas UV sub-rectangles, explicit vertex records
//=============================================================================

#include <boost/ut.hpp>
#include <quadshade/quad-geometry.h>
#include <quadshade/shader-types.h>
#include "test_helpers.h"

using namespace boost::ut;
using namespace quadshade;
using quadshade::test::near;

suite quad_geometry_tests = [] {
    "procedural corners follow the strip order"_test = [] {
        const glm::vec2 positions[] = {{-0.5f, 0.5f}, {-0.5f, -0.5f}, {0.5f, 0.5f}, {0.5f, -0.5f}};
        const glm::vec2 uvs[] = {{0, 0}, {0, 1}, {1, 0}, {1, 1}};

        for (uint32_t i = 0; i < 4; ++i) {
            Corner c = quadCorner(i);
            expect(near(c.position, positions[i])) << "position of ordinal" << i;
            expect(near(c.uv, uvs[i])) << "uv of ordinal" << i;
        }
    };

    "top of the quad samples v = 0"_test = [] {
        expect(quadCorner(0).position.y > quadCorner(1).position.y);
        expect(quadCorner(0).uv.y == 0.0_f);
        expect(quadCorner(1).uv.y == 1.0_f);
    };

    "out-of-range ordinal yields a degenerate corner"_test = [] {
        Corner c = quadCorner(4);
        expect(c.position.x == 0.0_f && c.position.y == 0.0_f);
        expect(c.uv.x == 0.0_f && c.uv.y == 0.0_f);

        Corner far = quadCorner(1000);
        expect(far.position.x == 0.0_f && far.uv.y == 0.0_f);
    };

    "atlas corners map onto the sub-rectangle"_test = [] {
        glm::vec2 start(0.25f, 0.5f);
        glm::vec2 end(0.5f, 0.75f);

        expect(near(atlasCorner(0, start, end).uv, {0.25f, 0.5f}));
        expect(near(atlasCorner(1, start, end).uv, {0.25f, 0.75f}));
        expect(near(atlasCorner(2, start, end).uv, {0.5f, 0.5f}));
        expect(near(atlasCorner(3, start, end).uv, {0.5f, 0.75f}));

        // Positions are the same unit quad as sprites
        for (uint32_t i = 0; i < 4; ++i) {
            expect(near(atlasCorner(i, start, end).position, quadCorner(i).position));
        }
    };

    "AtlasQuad and ProceduralQuad agree with the free functions"_test = [] {
        ProceduralQuad procedural;
        AtlasQuad atlas({0.1f, 0.2f}, {0.3f, 0.4f});
        for (uint32_t i = 0; i < 5; ++i) {
            expect(near(procedural.corner(i).uv, quadCorner(i).uv));
            expect(near(atlas.corner(i).uv, atlasCorner(i, {0.1f, 0.2f}, {0.3f, 0.4f}).uv));
        }
    };

    "ExplicitQuad reads the vertex records"_test = [] {
        ExplicitQuad quad(UNIT_QUAD_VERTICES);

        expect(quad.vertexCount() == 4_ul);
        for (uint32_t i = 0; i < 4; ++i) {
            expect(near(quad.corner(i).position, UNIT_QUAD_VERTICES[i].position));
            expect(near(quad.corner(i).uv, UNIT_QUAD_VERTICES[i].uv));
        }
    };

    "ExplicitQuad past the end is degenerate"_test = [] {
        ExplicitQuad quad(UNIT_QUAD_VERTICES);
        Corner c = quad.corner(7);
        expect(c.position.x == 0.0_f && c.position.y == 0.0_f);
    };

    "unit quad buffer matches the procedural table"_test = [] {
        for (uint32_t i = 0; i < 4; ++i) {
            expect(near(UNIT_QUAD_VERTICES[i].position, quadCorner(i).position));
            expect(near(UNIT_QUAD_VERTICES[i].uv, quadCorner(i).uv));
        }
    };

    "index list covers both triangles"_test = [] {
        expect(UNIT_QUAD_INDICES.size() == 6_ul);
        expect(UNIT_QUAD_INDICES[0] == 0 && UNIT_QUAD_INDICES[1] == 1 && UNIT_QUAD_INDICES[2] == 3);
        expect(UNIT_QUAD_INDICES[3] == 0 && UNIT_QUAD_INDICES[4] == 3 && UNIT_QUAD_INDICES[5] == 2);
    };
};
