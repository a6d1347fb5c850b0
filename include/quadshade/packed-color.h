#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace quadshade {

//-----------------------------------------------------------------------------
// Packed glyph colors
//
// The text engine packs colors as 0xAARRGGBB (alpha in the most significant
// byte). Legacy decoding reproduces the blue lane of the glyph program that
// shipped first: it masks bits 23:16 (the red byte) without shifting, so
// any color with non-zero red decodes to a blue far above 1.0. Data encoded
// against that program only renders identically with Legacy.
//-----------------------------------------------------------------------------
enum class ColorDecode : uint32_t {
    Conventional = 0,
    Legacy = 1
};

constexpr uint32_t packColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return (uint32_t(a) << 24) | (uint32_t(r) << 16) | (uint32_t(g) << 8) | uint32_t(b);
}

// Float channels are clamped to [0,1] and rounded to the nearest byte
uint32_t packColor(const glm::vec4& rgba);

glm::vec4 unpackColor(uint32_t packed, ColorDecode decode = ColorDecode::Conventional);

const char* toString(ColorDecode decode);
std::optional<ColorDecode> parseColorDecode(std::string_view name);

} // namespace quadshade
