#include <quadshade/software-rasterizer.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace quadshade {

//-----------------------------------------------------------------------------
// Framebuffer
//-----------------------------------------------------------------------------

void Framebuffer::clear(const glm::vec4& color) {
    std::fill(_pixels.begin(), _pixels.end(), color);
}

std::vector<uint8_t> Framebuffer::toRgba8() const {
    std::vector<uint8_t> out;
    out.reserve(_pixels.size() * 4);
    for (const auto& p : _pixels) {
        for (int c = 0; c < 4; ++c) {
            float v = std::clamp(p[c], 0.0f, 1.0f);
            out.push_back(static_cast<uint8_t>(std::lround(v * 255.0f)));
        }
    }
    return out;
}

//-----------------------------------------------------------------------------
// Triangle setup helpers
//-----------------------------------------------------------------------------
namespace {

// Screen-space setup runs in double
struct ScreenVertex {
    glm::dvec2 p;     // pixel coordinates, y down
    float invW;
    const Varyings* in;
};

// edge(b, a, p) == -edge(a, b, p) exactly, so a pixel on an edge shared
// by two triangles is owned by one of them even after rounding.
double edge(glm::dvec2 a, glm::dvec2 b, glm::dvec2 p) {
    if (b.x < a.x || (b.x == a.x && b.y < a.y)) {
        return -((a.x - b.x) * (p.y - b.y) - (a.y - b.y) * (p.x - b.x));
    }
    return (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
}

// With positive area (clockwise on a y-down target), a top edge runs
// right along a horizontal line and a left edge runs up.
bool isTopLeft(glm::dvec2 a, glm::dvec2 b) {
    double dx = b.x - a.x;
    double dy = b.y - a.y;
    return (dy == 0.0 && dx > 0.0) || dy < 0.0;
}

bool covers(double w, bool topLeft) {
    return w > 0.0 || (w == 0.0 && topLeft);
}

// Pixel index range [first, last] touched by [lo, hi], limited to the
// target. Clamped in floating point so the int conversion is always defined.
bool pixelSpan(double lo, double hi, uint32_t extent, int& first, int& last) {
    double maxIndex = double(extent) - 1.0;
    if (!(hi >= 0.0) || !(lo <= maxIndex + 1.0)) {
        return false;
    }
    first = int(std::clamp(std::floor(lo), 0.0, maxIndex));
    last = int(std::clamp(std::ceil(hi), 0.0, maxIndex));
    return first <= last;
}

} // anonymous namespace

//-----------------------------------------------------------------------------
// SoftwareRasterizer
//-----------------------------------------------------------------------------

Result<SoftwareRasterizer::Ptr> SoftwareRasterizer::create(const RasterOptions& raster,
                                                           const ShadingOptions& shading) {
    if (raster.width == 0 || raster.height == 0) {
        return Err<Ptr>("SoftwareRasterizer: empty target " + std::to_string(raster.width) +
                        "x" + std::to_string(raster.height));
    }
    yinfo("SoftwareRasterizer: {}x{} blend={} decode={}", raster.width, raster.height,
          raster.blend == BlendMode::Alpha ? "alpha" : "replace",
          toString(shading.colorDecode));
    return Ok(Ptr(new SoftwareRasterizer(raster, shading)));
}

void SoftwareRasterizer::beginFrame(const CameraUniform& camera, const glm::vec4& clearColor) {
    _camera = camera;
    _framebuffer.clear(clearColor);
    _stats = {};
}

void SoftwareRasterizer::drawPanel(const PanelUniform& panel, const ModelUniform& position) {
    std::array<Varyings, 4> strip;
    for (uint32_t i = 0; i < QUAD_VERTEX_COUNT; ++i) {
        strip[i] = panelVertex(_camera, panel, position, i, _shading.panelAnchor);
    }
    _stats.draws++;
    _stats.instances++;
    drawStrip(strip, [&panel](const Varyings& in) { return panelFragment(panel, in); });
}

void SoftwareRasterizer::drawSprites(const TextureSampler& texture,
                                     std::span<const SpriteInstance> instances) {
    _stats.draws++;
    for (const auto& instance : instances) {
        std::array<Varyings, 4> strip;
        for (uint32_t i = 0; i < QUAD_VERTEX_COUNT; ++i) {
            strip[i] = spriteVertex(_camera, instance, i);
        }
        _stats.instances++;
        drawStrip(strip, [&texture](const Varyings& in) { return texturedFragment(texture, in); });
    }
}

Result<void> SoftwareRasterizer::drawQuads(const TextureSampler& texture,
                                           std::span<const QuadVertex> vertices,
                                           std::span<const QuadInstance> instances) {
    if (vertices.size() < QUAD_VERTEX_COUNT) {
        return Err("SoftwareRasterizer::drawQuads: need " + std::to_string(QUAD_VERTEX_COUNT) +
                   " vertices, got " + std::to_string(vertices.size()));
    }
    if (vertices.size() > QUAD_VERTEX_COUNT) {
        ydebug("SoftwareRasterizer::drawQuads: using the first {} of {} vertices",
               QUAD_VERTEX_COUNT, vertices.size());
    }

    ExplicitQuad geometry(vertices);
    _stats.draws++;
    for (const auto& instance : instances) {
        std::array<Varyings, 4> strip;
        for (uint32_t i = 0; i < QUAD_VERTEX_COUNT; ++i) {
            strip[i] = texturedVertex(_camera, instance, geometry, i);
        }
        _stats.instances++;
        drawStrip(strip, [&texture](const Varyings& in) { return texturedFragment(texture, in); });
    }
    return Ok();
}

void SoftwareRasterizer::drawGlyphs(const TextureSampler& atlas, const ModelUniform& position,
                                    std::span<const GlyphInstance> glyphs) {
    ColorDecode decode = _shading.colorDecode;
    _stats.draws++;
    for (const auto& glyph : glyphs) {
        std::array<Varyings, 4> strip;
        for (uint32_t i = 0; i < QUAD_VERTEX_COUNT; ++i) {
            strip[i] = glyphVertex(_camera, position, glyph, i);
        }
        _stats.instances++;
        drawStrip(strip, [&atlas, decode](const Varyings& in) {
            return glyphFragment(atlas, in, decode);
        });
    }
}

template<typename Shade>
void SoftwareRasterizer::drawStrip(const std::array<Varyings, 4>& strip, Shade&& shade) {
    rasterTriangle(strip[0], strip[1], strip[2], shade);
    rasterTriangle(strip[2], strip[1], strip[3], shade);
}

template<typename Shade>
void SoftwareRasterizer::rasterTriangle(const Varyings& v0, const Varyings& v1,
                                        const Varyings& v2, Shade&& shade) {
    _stats.triangles++;

    // No clipping: anything reaching behind the eye is dropped whole
    if (v0.clipPosition.w <= 0.0f || v1.clipPosition.w <= 0.0f || v2.clipPosition.w <= 0.0f) {
        _stats.culled++;
        return;
    }

    const double width = double(_framebuffer.width());
    const double height = double(_framebuffer.height());

    auto toScreen = [&](const Varyings& v) {
        double invW = 1.0 / double(v.clipPosition.w);
        glm::dvec2 ndc(double(v.clipPosition.x) * invW, double(v.clipPosition.y) * invW);
        return ScreenVertex{{(ndc.x * 0.5 + 0.5) * width, (0.5 - ndc.y * 0.5) * height},
                            float(invW), &v};
    };

    ScreenVertex a = toScreen(v0);
    ScreenVertex b = toScreen(v1);
    ScreenVertex c = toScreen(v2);

    double area = edge(a.p, b.p, c.p);
    if (area == 0.0 || !std::isfinite(area)) {
        _stats.culled++;
        return;
    }
    // Both windings are drawn; flip to positive area. The flat color
    // still comes from the first vertex of the primitive.
    const Varyings* provoking = a.in;
    if (area < 0.0) {
        std::swap(b, c);
        area = -area;
    }

    double minX = std::min({a.p.x, b.p.x, c.p.x});
    double maxX = std::max({a.p.x, b.p.x, c.p.x});
    double minY = std::min({a.p.y, b.p.y, c.p.y});
    double maxY = std::max({a.p.y, b.p.y, c.p.y});

    int x0 = 0, x1 = 0, y0 = 0, y1 = 0;
    if (!pixelSpan(minX, maxX, _framebuffer.width(), x0, x1) ||
        !pixelSpan(minY, maxY, _framebuffer.height(), y0, y1)) {
        return;
    }

    bool tlA = isTopLeft(b.p, c.p);  // edge opposite a
    bool tlB = isTopLeft(c.p, a.p);
    bool tlC = isTopLeft(a.p, b.p);

    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            glm::dvec2 p(double(x) + 0.5, double(y) + 0.5);
            double wa = edge(b.p, c.p, p);
            double wb = edge(c.p, a.p, p);
            double wc = edge(a.p, b.p, p);
            if (!covers(wa, tlA) || !covers(wb, tlB) || !covers(wc, tlC)) {
                continue;
            }

            // Perspective-correct weights
            float la = float(wa / area) * a.invW;
            float lb = float(wb / area) * b.invW;
            float lc = float(wc / area) * c.invW;
            float sum = la + lb + lc;
            la /= sum;
            lb /= sum;
            lc /= sum;

            Varyings in;
            in.clipPosition = glm::vec4(glm::vec2(p), 0.0f, 1.0f);
            in.uv = a.in->uv * la + b.in->uv * lb + c.in->uv * lc;
            in.color = a.in->color * la + b.in->color * lb + c.in->color * lc;
            in.selectionRangeY = a.in->selectionRangeY * la + b.in->selectionRangeY * lb +
                                 c.in->selectionRangeY * lc;
            in.packedColor = provoking->packedColor;

            blend(uint32_t(x), uint32_t(y), shade(in));
            _stats.fragments++;
        }
    }
}

void SoftwareRasterizer::blend(uint32_t x, uint32_t y, const glm::vec4& src) {
    glm::vec4& dst = _framebuffer.at(x, y);
    switch (_raster.blend) {
        case BlendMode::Replace:
            dst = src;
            break;
        case BlendMode::Alpha:
            dst = src * src.a + dst * (1.0f - src.a);
            break;
    }
}

} // namespace quadshade
