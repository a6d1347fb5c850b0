#pragma once

#include <quadshade/fragment-stage.h>
#include <quadshade/result.hpp>
#include <quadshade/shader-types.h>
#include <quadshade/shading-options.h>
#include <quadshade/texture.h>
#include <quadshade/vertex-stage.h>
#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace quadshade {

//-----------------------------------------------------------------------------
// Framebuffer - RGBA float color target, row 0 at the top
//-----------------------------------------------------------------------------
class Framebuffer {
public:
    Framebuffer(uint32_t width, uint32_t height)
        : _width(width), _height(height), _pixels(size_t(width) * height, glm::vec4(0.0f)) {}

    void clear(const glm::vec4& color);

    glm::vec4& at(uint32_t x, uint32_t y) { return _pixels[size_t(y) * _width + x]; }
    const glm::vec4& at(uint32_t x, uint32_t y) const { return _pixels[size_t(y) * _width + x]; }

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

    // 8-bit RGBA, clamped and rounded, rows top to bottom
    std::vector<uint8_t> toRgba8() const;

private:
    uint32_t _width;
    uint32_t _height;
    std::vector<glm::vec4> _pixels;
};

struct DrawStats {
    uint32_t draws = 0;
    uint32_t instances = 0;
    uint32_t triangles = 0;
    uint32_t culled = 0;      // triangles dropped behind w <= 0 or zero area
    uint64_t fragments = 0;
};

/**
 * SoftwareRasterizer runs the quad programs on the CPU.
 *
 * Each instance is expanded to the 4-vertex strip, split into the
 * triangles (0,1,2) and (2,1,3), rasterized at pixel centers with a
 * top-left fill rule and shaded with the variant's fragment compositor.
 * Varyings are interpolated perspective-correct; the glyph color is flat.
 */
class SoftwareRasterizer {
public:
    using Ptr = std::unique_ptr<SoftwareRasterizer>;

    static Result<Ptr> create(const RasterOptions& raster, const ShadingOptions& shading);

    ~SoftwareRasterizer() = default;

    SoftwareRasterizer(const SoftwareRasterizer&) = delete;
    SoftwareRasterizer& operator=(const SoftwareRasterizer&) = delete;

    // Binds the camera for the following draws and clears the target
    void beginFrame(const CameraUniform& camera, const glm::vec4& clearColor);

    void drawPanel(const PanelUniform& panel, const ModelUniform& position);
    void drawSprites(const TextureSampler& texture, std::span<const SpriteInstance> instances);
    Result<void> drawQuads(const TextureSampler& texture,
                           std::span<const QuadVertex> vertices,
                           std::span<const QuadInstance> instances);
    void drawGlyphs(const TextureSampler& atlas, const ModelUniform& position,
                    std::span<const GlyphInstance> glyphs);

    const Framebuffer& framebuffer() const { return _framebuffer; }
    const DrawStats& stats() const { return _stats; }
    const RasterOptions& rasterOptions() const { return _raster; }
    const ShadingOptions& shadingOptions() const { return _shading; }

private:
    SoftwareRasterizer(const RasterOptions& raster, const ShadingOptions& shading)
        : _raster(raster), _shading(shading), _framebuffer(raster.width, raster.height) {}

    template<typename Shade>
    void drawStrip(const std::array<Varyings, 4>& strip, Shade&& shade);

    template<typename Shade>
    void rasterTriangle(const Varyings& v0, const Varyings& v1, const Varyings& v2, Shade&& shade);

    void blend(uint32_t x, uint32_t y, const glm::vec4& src);

    RasterOptions _raster;
    ShadingOptions _shading;
    Framebuffer _framebuffer;
    CameraUniform _camera;
    DrawStats _stats;
};

} // namespace quadshade
