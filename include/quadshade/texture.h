#pragma once

#include <quadshade/result.hpp>
#include <quadshade/shading-options.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace quadshade {

//-----------------------------------------------------------------------------
// TextureSampler - a bound texture + sampler pair as the fragment stage
// sees it. sample() follows textureSample(): normalized UV in, RGBA out.
//-----------------------------------------------------------------------------
class TextureSampler {
public:
    virtual ~TextureSampler() = default;

    virtual glm::vec4 sample(glm::vec2 uv) const = 0;
};

//-----------------------------------------------------------------------------
// ImageTexture - CPU texture with RGBA float texels, row 0 at v = 0
//-----------------------------------------------------------------------------
class ImageTexture : public TextureSampler {
public:
    using Ptr = std::shared_ptr<ImageTexture>;

    static Result<Ptr> create(uint32_t width, uint32_t height,
                              std::vector<glm::vec4> texels,
                              SamplerDesc sampler = {});

    // 8-bit RGBA, tightly packed rows
    static Result<Ptr> fromRgba8(uint32_t width, uint32_t height,
                                 std::span<const uint8_t> pixels,
                                 SamplerDesc sampler = {});

    // Single channel coverage (an R8 glyph atlas): samples as (c, 0, 0, 1)
    static Result<Ptr> fromCoverage(uint32_t width, uint32_t height,
                                    std::span<const uint8_t> coverage,
                                    SamplerDesc sampler = {});

    // 1x1 texture
    static Ptr solid(const glm::vec4& color);

    glm::vec4 sample(glm::vec2 uv) const override;

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }
    const SamplerDesc& sampler() const { return _sampler; }
    void setSampler(const SamplerDesc& sampler) { _sampler = sampler; }

    const glm::vec4& texel(uint32_t x, uint32_t y) const { return _texels[size_t(y) * _width + x]; }

private:
    ImageTexture(uint32_t width, uint32_t height, std::vector<glm::vec4> texels, SamplerDesc sampler)
        : _width(width), _height(height), _texels(std::move(texels)), _sampler(sampler) {}

    int wrap(int coord, uint32_t extent) const;
    glm::vec4 fetch(int x, int y) const;

    uint32_t _width;
    uint32_t _height;
    std::vector<glm::vec4> _texels;
    SamplerDesc _sampler;
};

} // namespace quadshade
