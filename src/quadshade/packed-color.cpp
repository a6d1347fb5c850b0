#include <quadshade/packed-color.h>

#include <algorithm>
#include <cmath>

namespace quadshade {

static uint8_t toByte(float v) {
    float c = std::clamp(v, 0.0f, 1.0f);
    return static_cast<uint8_t>(std::lround(c * 255.0f));
}

uint32_t packColor(const glm::vec4& rgba) {
    return packColor(toByte(rgba.r), toByte(rgba.g), toByte(rgba.b), toByte(rgba.a));
}

glm::vec4 unpackColor(uint32_t packed, ColorDecode decode) {
    float r = float((packed & 0x00FF0000u) >> 16) / 255.0f;
    float g = float((packed & 0x0000FF00u) >> 8) / 255.0f;
    float a = float((packed & 0xFF000000u) >> 24) / 255.0f;
    float b = 0.0f;
    switch (decode) {
        case ColorDecode::Legacy:
            b = float(packed & 0x00FF0000u) / 255.0f;
            break;
        case ColorDecode::Conventional:
            b = float(packed & 0x000000FFu) / 255.0f;
            break;
    }
    return {r, g, b, a};
}

const char* toString(ColorDecode decode) {
    switch (decode) {
        case ColorDecode::Legacy: return "legacy";
        case ColorDecode::Conventional: return "conventional";
    }
    return "unknown";
}

std::optional<ColorDecode> parseColorDecode(std::string_view name) {
    if (name == "legacy") return ColorDecode::Legacy;
    if (name == "conventional") return ColorDecode::Conventional;
    return std::nullopt;
}

} // namespace quadshade
