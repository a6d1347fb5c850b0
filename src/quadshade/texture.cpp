#include <quadshade/texture.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace quadshade {

Result<ImageTexture::Ptr> ImageTexture::create(uint32_t width, uint32_t height,
                                               std::vector<glm::vec4> texels,
                                               SamplerDesc sampler) {
    if (width == 0 || height == 0) {
        return Err<Ptr>("ImageTexture::create: empty texture");
    }
    size_t expected = size_t(width) * height;
    if (texels.size() != expected) {
        return Err<Ptr>("ImageTexture::create: expected " + std::to_string(expected) +
                        " texels, got " + std::to_string(texels.size()));
    }
    return Ok(Ptr(new ImageTexture(width, height, std::move(texels), sampler)));
}

Result<ImageTexture::Ptr> ImageTexture::fromRgba8(uint32_t width, uint32_t height,
                                                  std::span<const uint8_t> pixels,
                                                  SamplerDesc sampler) {
    size_t expected = size_t(width) * height * 4;
    if (pixels.size() != expected) {
        return Err<Ptr>("ImageTexture::fromRgba8: expected " + std::to_string(expected) +
                        " bytes, got " + std::to_string(pixels.size()));
    }
    std::vector<glm::vec4> texels(size_t(width) * height);
    for (size_t i = 0; i < texels.size(); ++i) {
        const uint8_t* p = pixels.data() + i * 4;
        texels[i] = glm::vec4(p[0], p[1], p[2], p[3]) / 255.0f;
    }
    return create(width, height, std::move(texels), sampler);
}

Result<ImageTexture::Ptr> ImageTexture::fromCoverage(uint32_t width, uint32_t height,
                                                     std::span<const uint8_t> coverage,
                                                     SamplerDesc sampler) {
    size_t expected = size_t(width) * height;
    if (coverage.size() != expected) {
        return Err<Ptr>("ImageTexture::fromCoverage: expected " + std::to_string(expected) +
                        " bytes, got " + std::to_string(coverage.size()));
    }
    std::vector<glm::vec4> texels(expected);
    for (size_t i = 0; i < expected; ++i) {
        texels[i] = glm::vec4(coverage[i] / 255.0f, 0.0f, 0.0f, 1.0f);
    }
    return create(width, height, std::move(texels), sampler);
}

ImageTexture::Ptr ImageTexture::solid(const glm::vec4& color) {
    return Ptr(new ImageTexture(1, 1, {color}, SamplerDesc{FilterMode::Nearest, AddressMode::ClampToEdge}));
}

// Texel-space coordinate made safe for the int conversion. NaN maps to 0.
// Past 2^24 a float has no fractional bits left, so nothing is lost.
static float texelSpace(float v) {
    constexpr float LIMIT = 16777216.0f;
    if (std::isnan(v)) return 0.0f;
    return std::clamp(v, -LIMIT, LIMIT);
}

int ImageTexture::wrap(int coord, uint32_t extent) const {
    int n = static_cast<int>(extent);
    if (_sampler.address == AddressMode::Repeat) {
        int m = coord % n;
        return m < 0 ? m + n : m;
    }
    return std::clamp(coord, 0, n - 1);
}

glm::vec4 ImageTexture::fetch(int x, int y) const {
    return texel(static_cast<uint32_t>(wrap(x, _width)), static_cast<uint32_t>(wrap(y, _height)));
}

glm::vec4 ImageTexture::sample(glm::vec2 uv) const {
    // Texel centers sit at (i + 0.5) / extent
    float x = texelSpace(uv.x * float(_width));
    float y = texelSpace(uv.y * float(_height));

    if (_sampler.filter == FilterMode::Nearest) {
        return fetch(static_cast<int>(std::floor(x)), static_cast<int>(std::floor(y)));
    }

    float fx = x - 0.5f;
    float fy = y - 0.5f;
    int x0 = static_cast<int>(std::floor(fx));
    int y0 = static_cast<int>(std::floor(fy));
    float tx = fx - float(x0);
    float ty = fy - float(y0);

    glm::vec4 top = glm::mix(fetch(x0, y0), fetch(x0 + 1, y0), tx);
    glm::vec4 bottom = glm::mix(fetch(x0, y0 + 1), fetch(x0 + 1, y0 + 1), tx);
    return glm::mix(top, bottom, ty);
}

} // namespace quadshade
