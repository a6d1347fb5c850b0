#include "scene.h"

#include <quadshade/packed-color.h>
#include <ytrace/ytrace.hpp>
#include <glm/gtc/matrix_transform.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <cmath>
#include <cstdint>

namespace quadshade::render {

namespace {

glm::vec2 readVec2(const YAML::Node& node, glm::vec2 def) {
    if (!node || !node.IsSequence() || node.size() < 2) return def;
    return {node[0].as<float>(), node[1].as<float>()};
}

glm::vec3 readVec3(const YAML::Node& node, glm::vec3 def) {
    if (!node || !node.IsSequence() || node.size() < 3) return def;
    return {node[0].as<float>(), node[1].as<float>(), node[2].as<float>()};
}

glm::vec4 readVec4(const YAML::Node& node, glm::vec4 def) {
    if (!node || !node.IsSequence() || node.size() < 4) return def;
    return {node[0].as<float>(), node[1].as<float>(), node[2].as<float>(), node[3].as<float>()};
}

glm::mat4 placement(const YAML::Node& node) {
    glm::vec2 at = readVec2(node["at"], glm::vec2(0.0f));
    float rotation = node["rotation"] ? node["rotation"].as<float>() : 0.0f;
    glm::mat4 m = glm::translate(glm::mat4(1.0f), glm::vec3(at, 0.0f));
    if (rotation != 0.0f) {
        m = glm::rotate(m, glm::radians(rotation), glm::vec3(0.0f, 0.0f, 1.0f));
    }
    return m;
}

Result<ImageTexture::Ptr> loadTexture(const YAML::Node& node, const std::filesystem::path& baseDir,
                                      const SamplerDesc& sampler) {
    if (node["solid"]) {
        auto texture = ImageTexture::solid(readVec4(node["solid"], glm::vec4(1.0f)));
        texture->setSampler(sampler);
        return Ok(texture);
    }

    if (node["coverage"]) {
        const YAML::Node& cov = node["coverage"];
        uint32_t width = cov["width"].as<uint32_t>();
        uint32_t height = cov["height"].as<uint32_t>();
        std::vector<uint8_t> data;
        for (const auto& v : cov["data"]) {
            data.push_back(static_cast<uint8_t>(v.as<unsigned>()));
        }
        return ImageTexture::fromCoverage(width, height, data, sampler);
    }

    if (node["path"]) {
        std::filesystem::path path = node["path"].as<std::string>();
        if (path.is_relative()) {
            path = baseDir / path;
        }
        int width = 0, height = 0, channels = 0;
        unsigned char* pixels = stbi_load(path.string().c_str(), &width, &height, &channels, 4);
        if (!pixels) {
            return Err<ImageTexture::Ptr>("Failed to load image " + path.string() + ": " +
                                          stbi_failure_reason());
        }
        auto texture = ImageTexture::fromRgba8(
            uint32_t(width), uint32_t(height),
            std::span<const uint8_t>(pixels, size_t(width) * height * 4), sampler);
        stbi_image_free(pixels);
        if (texture) {
            ydebug("Loaded texture {} ({}x{}, {} channels)", path.string(), width, height, channels);
        }
        return texture;
    }

    return Err<ImageTexture::Ptr>("texture needs one of solid, coverage or path");
}

Draw parsePanel(const YAML::Node& node) {
    Draw draw;
    draw.variant = ShaderVariant::Panel;
    PanelUniform defaults;
    draw.panel = PanelUniform::make(
        readVec2(node["size"], glm::vec2(1.0f)),
        readVec4(node["menu-color"], defaults.menuColor),
        readVec4(node["selection-color"], defaults.selectionColor),
        readVec2(node["selection-range"], glm::vec2(0.0f)));
    draw.position.transform = placement(node);
    return draw;
}

Draw parseSprites(const YAML::Node& node, ShaderVariant variant) {
    Draw draw;
    draw.variant = variant;
    draw.texture = node["texture"].as<std::string>();
    for (const auto& inst : node["instances"]) {
        SpriteInstance instance;
        instance.size = readVec2(inst["size"], glm::vec2(1.0f));
        instance.transform = placement(inst);
        instance.color = readVec4(inst["color"], glm::vec4(1.0f));
        draw.instances.push_back(instance);
    }
    return draw;
}

Draw parseGlyphs(const YAML::Node& node) {
    Draw draw;
    draw.variant = ShaderVariant::Glyph;
    draw.texture = node["atlas"].as<std::string>();
    draw.position.transform = placement(node);
    for (const auto& g : node["glyphs"]) {
        GlyphInstance glyph;
        glyph.glyphPos = readVec2(g["pos"], glm::vec2(0.0f));
        glyph.glyphSize = readVec2(g["size"], glm::vec2(1.0f));
        glyph.uvStart = readVec2(g["uv-start"], glm::vec2(0.0f));
        glyph.uvEnd = readVec2(g["uv-end"], glm::vec2(1.0f));
        const YAML::Node& color = g["color"];
        if (!color) {
            glyph.color = 0xFFFFFFFFu;
        } else if (color.IsSequence()) {
            glyph.color = packColor(readVec4(color, glm::vec4(1.0f)));
        } else {
            glyph.color = color.as<uint32_t>();
        }
        draw.glyphs.push_back(glyph);
    }
    return draw;
}

} // anonymous namespace

Result<Scene> Scene::load(const std::filesystem::path& path, const SamplerDesc& sampler) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Err<Scene>("Failed to load scene " + path.string() + ": " + e.what());
    }
    auto scene = parse(root, path.parent_path(), sampler);
    if (!scene) {
        return Err<Scene>("Invalid scene " + path.string(), scene);
    }
    yinfo("Loaded scene {}: {} textures, {} draws", path.string(),
          scene->textures.size(), scene->draws.size());
    return scene;
}

Result<Scene> Scene::parse(const YAML::Node& root, const std::filesystem::path& baseDir,
                           const SamplerDesc& sampler) {
    Scene scene;
    try {
        if (const YAML::Node& camera = root["camera"]) {
            glm::vec4 ortho = readVec4(camera["ortho"], glm::vec4(-1.0f, 1.0f, -1.0f, 1.0f));
            scene.camera.projection = glm::ortho(ortho.x, ortho.y, ortho.z, ortho.w);
            scene.camera.position = readVec3(camera["position"], glm::vec3(0.0f));
        }
        scene.clearColor = readVec4(root["clear"], scene.clearColor);

        for (const auto& tex : root["textures"]) {
            std::string name = tex["name"].as<std::string>();
            auto texture = loadTexture(tex, baseDir, sampler);
            if (!texture) {
                return Err<Scene>("texture '" + name + "'", texture);
            }
            scene.textures[name] = *texture;
        }

        for (const auto& entry : root["draws"]) {
            if (entry["panel"]) {
                scene.draws.push_back(parsePanel(entry["panel"]));
            } else if (entry["sprites"]) {
                scene.draws.push_back(parseSprites(entry["sprites"], ShaderVariant::Sprite));
            } else if (entry["quads"]) {
                scene.draws.push_back(parseSprites(entry["quads"], ShaderVariant::Quad));
            } else if (entry["glyphs"]) {
                scene.draws.push_back(parseGlyphs(entry["glyphs"]));
            } else {
                return Err<Scene>("draw #" + std::to_string(scene.draws.size()) +
                                  " needs one of panel, sprites, quads or glyphs");
            }
        }
    } catch (const YAML::Exception& e) {
        return Err<Scene>(std::string("YAML error: ") + e.what());
    }
    return Ok(std::move(scene));
}

Result<void> renderScene(const Scene& scene, SoftwareRasterizer& rasterizer) {
    rasterizer.beginFrame(scene.camera, scene.clearColor);

    for (size_t i = 0; i < scene.draws.size(); ++i) {
        const Draw& draw = scene.draws[i];

        const ImageTexture* texture = nullptr;
        if (hasCapability(draw.variant, CAP_TEXTURE)) {
            auto it = scene.textures.find(draw.texture);
            if (it == scene.textures.end()) {
                return Err("draw #" + std::to_string(i) + ": unknown texture '" + draw.texture + "'");
            }
            texture = it->second.get();
        }

        switch (draw.variant) {
            case ShaderVariant::Panel:
                rasterizer.drawPanel(draw.panel, draw.position);
                break;
            case ShaderVariant::Sprite:
                rasterizer.drawSprites(*texture, draw.instances);
                break;
            case ShaderVariant::Quad:
                if (auto res = rasterizer.drawQuads(*texture, UNIT_QUAD_VERTICES, draw.instances); !res) {
                    return Err("draw #" + std::to_string(i), res);
                }
                break;
            case ShaderVariant::Glyph:
                rasterizer.drawGlyphs(*texture, draw.position, draw.glyphs);
                break;
        }
    }

    const auto& stats = rasterizer.stats();
    ydebug("Rendered {} draws, {} instances, {} triangles ({} culled), {} fragments",
           stats.draws, stats.instances, stats.triangles, stats.culled, stats.fragments);
    return Ok();
}

Result<void> writePng(const Framebuffer& framebuffer, const std::filesystem::path& path) {
    auto pixels = framebuffer.toRgba8();
    int w = int(framebuffer.width());
    int h = int(framebuffer.height());
    if (!stbi_write_png(path.string().c_str(), w, h, 4, pixels.data(), w * 4)) {
        return Err("Failed to write " + path.string());
    }
    return Ok();
}

} // namespace quadshade::render
