#pragma once

#include <quadshade/result.hpp>
#include <quadshade/shader-types.h>
#include <quadshade/shader-variant.h>
#include <quadshade/shading-options.h>
#include <quadshade/software-rasterizer.h>
#include <quadshade/texture.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace quadshade::render {

// One draw call. Which fields are used depends on variant.
struct Draw {
    ShaderVariant variant = ShaderVariant::Sprite;
    PanelUniform panel;                      // Panel
    ModelUniform position;                   // Panel, Glyph
    std::string texture;                     // Sprite, Quad, Glyph (atlas)
    std::vector<SpriteInstance> instances;   // Sprite, Quad
    std::vector<GlyphInstance> glyphs;       // Glyph
};

/**
 * Scene - what quadshade-render draws, loaded from YAML:
 *
 *   camera:
 *     ortho: [left, right, bottom, top]
 *     position: [x, y, z]
 *   clear: [r, g, b, a]
 *   textures:
 *     - {name: hero, path: hero.png}
 *     - {name: white, solid: [1, 1, 1, 1]}
 *     - {name: font, coverage: {width: w, height: h, data: [bytes...]}}
 *   draws:
 *     - panel: {size: [w, h], at: [x, y], menu-color: [...],
 *               selection-color: [...], selection-range: [start, end]}
 *     - sprites: {texture: hero, instances: [{at: [x, y], size: [w, h],
 *                 rotation: deg, color: [...]}]}
 *     - quads:   {same as sprites, drawn from the unit quad vertex buffer}
 *     - glyphs:  {atlas: font, at: [x, y], glyphs: [{pos: [x, y], size: [w, h],
 *                 uv-start: [u, v], uv-end: [u, v], color: 0xAARRGGBB}]}
 *
 * Draws are issued in file order.
 */
struct Scene {
    CameraUniform camera;
    glm::vec4 clearColor{0.0f, 0.0f, 0.0f, 1.0f};
    std::map<std::string, ImageTexture::Ptr> textures;
    std::vector<Draw> draws;

    static Result<Scene> load(const std::filesystem::path& path, const SamplerDesc& sampler);
    static Result<Scene> parse(const YAML::Node& root, const std::filesystem::path& baseDir,
                               const SamplerDesc& sampler);
};

Result<void> renderScene(const Scene& scene, SoftwareRasterizer& rasterizer);

// Writes the framebuffer as an 8-bit RGBA PNG
Result<void> writePng(const Framebuffer& framebuffer, const std::filesystem::path& path);

} // namespace quadshade::render
