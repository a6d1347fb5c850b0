#pragma once

#include <quadshade/shader-types.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <span>

namespace quadshade {

// Local corner position (in the unit quad, half-extent 0.5) and its UV
struct Corner {
    glm::vec2 position{0.0f};
    glm::vec2 uv{0.0f};
};

//-----------------------------------------------------------------------------
// Procedural corners
//
// Ordinal order is top-left, bottom-left, top-right, bottom-right, which is
// the triangle-strip order of a quad drawn without an index buffer.
//
// Precondition: ordinal < 4. Anything else yields a zero Corner (a
// degenerate vertex at the local origin); it is not reported.
//-----------------------------------------------------------------------------
Corner quadCorner(uint32_t ordinal);

// Same positions, UVs taken from an atlas sub-rectangle
Corner atlasCorner(uint32_t ordinal, glm::vec2 uvStart, glm::vec2 uvEnd);

//-----------------------------------------------------------------------------
// QuadGeometry - where the vertex stage gets its corners from
//-----------------------------------------------------------------------------
class QuadGeometry {
public:
    virtual ~QuadGeometry() = default;

    virtual Corner corner(uint32_t vertexIndex) const = 0;
};

// Unit quad with full [0,1] UVs (Panel, Sprite)
class ProceduralQuad : public QuadGeometry {
public:
    Corner corner(uint32_t vertexIndex) const override { return quadCorner(vertexIndex); }
};

// Unit quad addressing an atlas sub-rectangle (Glyph)
class AtlasQuad : public QuadGeometry {
public:
    AtlasQuad(glm::vec2 uvStart, glm::vec2 uvEnd) : _uvStart(uvStart), _uvEnd(uvEnd) {}

    Corner corner(uint32_t vertexIndex) const override {
        return atlasCorner(vertexIndex, _uvStart, _uvEnd);
    }

private:
    glm::vec2 _uvStart;
    glm::vec2 _uvEnd;
};

// Host-supplied vertex buffer (Quad). The mapping is the caller's; the
// standard buffer is UNIT_QUAD_VERTICES. The span must outlive this object.
class ExplicitQuad : public QuadGeometry {
public:
    explicit ExplicitQuad(std::span<const QuadVertex> vertices) : _vertices(vertices) {}

    Corner corner(uint32_t vertexIndex) const override;

    size_t vertexCount() const { return _vertices.size(); }

private:
    std::span<const QuadVertex> _vertices;
};

} // namespace quadshade
