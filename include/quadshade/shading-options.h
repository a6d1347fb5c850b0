#pragma once

#include <quadshade/config.h>
#include <quadshade/packed-color.h>
#include <quadshade/result.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace quadshade {

//-----------------------------------------------------------------------------
// PanelAnchor - where a panel sits relative to its Position transform
//
// A panel of size (w, h) is shifted by (w / xDivisor, -h / yDivisor). With
// the defaults its left edge sits on the anchor and it hangs below it, the
// top edge a tenth of its height above the anchor. The divisors are part of
// the panel layout convention and are not derived from anything.
//-----------------------------------------------------------------------------
struct PanelAnchor {
    float xDivisor = 2.0f;
    float yDivisor = 2.5f;

    glm::vec2 offset(glm::vec2 size) const {
        return {size.x / xDivisor, -size.y / yDivisor};
    }
};

struct ShadingOptions {
    ColorDecode colorDecode = ColorDecode::Conventional;
    PanelAnchor panelAnchor;

    static Result<ShadingOptions> fromConfig(const Config& config);
};

//-----------------------------------------------------------------------------
// Sampler state of a bound texture
//-----------------------------------------------------------------------------
enum class FilterMode : uint32_t {
    Nearest = 0,
    Linear = 1
};

enum class AddressMode : uint32_t {
    ClampToEdge = 0,
    Repeat = 1
};

struct SamplerDesc {
    FilterMode filter = FilterMode::Linear;
    AddressMode address = AddressMode::ClampToEdge;

    static Result<SamplerDesc> fromConfig(const Config& config);
};

//-----------------------------------------------------------------------------
// Software rasterizer settings
//-----------------------------------------------------------------------------
enum class BlendMode : uint32_t {
    Replace = 0,
    Alpha = 1    // src * src.a + dst * (1 - src.a), alpha likewise
};

struct RasterOptions {
    uint32_t width = 800;
    uint32_t height = 600;
    BlendMode blend = BlendMode::Alpha;

    static Result<RasterOptions> fromConfig(const Config& config);
};

std::optional<FilterMode> parseFilterMode(std::string_view name);
std::optional<AddressMode> parseAddressMode(std::string_view name);
std::optional<BlendMode> parseBlendMode(std::string_view name);

} // namespace quadshade
