#include <quadshade/shading-options.h>
#include <ytrace/ytrace.hpp>

#include <cmath>
#include <string>

namespace quadshade {

std::optional<FilterMode> parseFilterMode(std::string_view name) {
    if (name == "nearest") return FilterMode::Nearest;
    if (name == "linear") return FilterMode::Linear;
    return std::nullopt;
}

std::optional<AddressMode> parseAddressMode(std::string_view name) {
    if (name == "clamp") return AddressMode::ClampToEdge;
    if (name == "repeat") return AddressMode::Repeat;
    return std::nullopt;
}

std::optional<BlendMode> parseBlendMode(std::string_view name) {
    if (name == "replace") return BlendMode::Replace;
    if (name == "alpha") return BlendMode::Alpha;
    return std::nullopt;
}

Result<ShadingOptions> ShadingOptions::fromConfig(const Config& config) {
    ShadingOptions options;

    auto decodeName = config.get<std::string>(Config::KEY_COLOR_DECODE, "conventional");
    auto decode = parseColorDecode(decodeName);
    if (!decode) {
        return Err<ShadingOptions>(std::string(Config::KEY_COLOR_DECODE) +
                                   ": unknown color decode '" + decodeName + "'");
    }
    options.colorDecode = *decode;
    if (options.colorDecode == ColorDecode::Legacy) {
        ywarn("ShadingOptions: legacy glyph color decode selected, blue lane is read from the red byte");
    }

    auto xDiv = config.get<float>(Config::KEY_ANCHOR_X_DIVISOR);
    auto yDiv = config.get<float>(Config::KEY_ANCHOR_Y_DIVISOR);
    if (!xDiv || !yDiv) {
        return Err<ShadingOptions>("shading.panel-anchor: divisors must be numbers");
    }
    if (*xDiv == 0.0f || *yDiv == 0.0f || !std::isfinite(*xDiv) || !std::isfinite(*yDiv)) {
        return Err<ShadingOptions>("shading.panel-anchor: divisors must be finite and non-zero");
    }
    options.panelAnchor = {*xDiv, *yDiv};

    ydebug("ShadingOptions: decode={} anchor=({}, {})", toString(options.colorDecode),
           options.panelAnchor.xDivisor, options.panelAnchor.yDivisor);
    return Ok(options);
}

Result<SamplerDesc> SamplerDesc::fromConfig(const Config& config) {
    SamplerDesc desc;

    auto filterName = config.get<std::string>(Config::KEY_SAMPLER_FILTER, "linear");
    auto filter = parseFilterMode(filterName);
    if (!filter) {
        return Err<SamplerDesc>(std::string(Config::KEY_SAMPLER_FILTER) +
                                ": unknown filter '" + filterName + "'");
    }
    desc.filter = *filter;

    auto addressName = config.get<std::string>(Config::KEY_SAMPLER_ADDRESS, "clamp");
    auto address = parseAddressMode(addressName);
    if (!address) {
        return Err<SamplerDesc>(std::string(Config::KEY_SAMPLER_ADDRESS) +
                                ": unknown address mode '" + addressName + "'");
    }
    desc.address = *address;

    return Ok(desc);
}

Result<RasterOptions> RasterOptions::fromConfig(const Config& config) {
    RasterOptions options;

    auto blendName = config.get<std::string>(Config::KEY_RASTER_BLEND, "alpha");
    auto blend = parseBlendMode(blendName);
    if (!blend) {
        return Err<RasterOptions>(std::string(Config::KEY_RASTER_BLEND) +
                                  ": unknown blend mode '" + blendName + "'");
    }
    options.blend = *blend;

    auto width = config.get<uint32_t>(Config::KEY_RASTER_WIDTH);
    auto height = config.get<uint32_t>(Config::KEY_RASTER_HEIGHT);
    if (!width || !height || *width == 0 || *height == 0) {
        return Err<RasterOptions>("raster: width and height must be positive integers");
    }
    options.width = *width;
    options.height = *height;

    return Ok(options);
}

} // namespace quadshade
