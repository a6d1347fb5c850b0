#include <quadshade/quad-geometry.h>

namespace quadshade {

Corner quadCorner(uint32_t ordinal) {
    Corner c;
    switch (ordinal) {
        case 0:
            c.position = {-0.5f, 0.5f};
            c.uv = {0.0f, 0.0f};
            break;
        case 1:
            c.position = {-0.5f, -0.5f};
            c.uv = {0.0f, 1.0f};
            break;
        case 2:
            c.position = {0.5f, 0.5f};
            c.uv = {1.0f, 0.0f};
            break;
        case 3:
            c.position = {0.5f, -0.5f};
            c.uv = {1.0f, 1.0f};
            break;
        default:
            break;
    }
    return c;
}

Corner atlasCorner(uint32_t ordinal, glm::vec2 uvStart, glm::vec2 uvEnd) {
    Corner c;
    switch (ordinal) {
        case 0:
            c.position = {-0.5f, 0.5f};
            c.uv = uvStart;
            break;
        case 1:
            c.position = {-0.5f, -0.5f};
            c.uv = {uvStart.x, uvEnd.y};
            break;
        case 2:
            c.position = {0.5f, 0.5f};
            c.uv = {uvEnd.x, uvStart.y};
            break;
        case 3:
            c.position = {0.5f, -0.5f};
            c.uv = uvEnd;
            break;
        default:
            break;
    }
    return c;
}

Corner ExplicitQuad::corner(uint32_t vertexIndex) const {
    if (vertexIndex >= _vertices.size()) {
        return {};
    }
    const QuadVertex& v = _vertices[vertexIndex];
    return {v.position, v.uv};
}

} // namespace quadshade
