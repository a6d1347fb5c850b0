// quadshade-render: Render a YAML scene of panels, sprites and glyph runs
// with the software rasterizer and write it as PNG.
//
// Also dumps the WGSL source of any program variant (--wgsl).

#include "scene.h"

#include <quadshade/config.h>
#include <quadshade/shader-library.h>
#include <quadshade/shading-options.h>
#include <quadshade/software-rasterizer.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <args.hxx>
#include <iostream>
#include <string>

using namespace quadshade;

int main(int argc, char** argv) {
    args::ArgumentParser parser("quadshade-render - Render a quad scene to PNG");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::ValueFlag<std::string> configFlag(parser, "FILE", "Config file", {"config"});
    args::ValueFlag<std::string> decodeFlag(parser, "POLICY",
                                            "Glyph color decode: conventional or legacy",
                                            {"color-decode"});
    args::ValueFlag<uint32_t> widthFlag(parser, "W", "Output width in pixels", {"width"});
    args::ValueFlag<uint32_t> heightFlag(parser, "H", "Output height in pixels", {"height"});
    args::ValueFlag<std::string> wgslFlag(parser, "VARIANT",
                                          "Print the WGSL of panel, sprite, quad or glyph and exit",
                                          {"wgsl"});
    args::ValueFlag<std::string> outputFlag(parser, "FILE", "Output PNG", {'o', "output"}, "out.png");
    args::Positional<std::string> sceneFile(parser, "scene", "Scene YAML file");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    auto logger = spdlog::stderr_color_mt("quadshade-render");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verboseFlag ? spdlog::level::debug : spdlog::level::info);

    // Command line overrides go on top of file and environment
    YAML::Node overrides;
    if (decodeFlag) overrides["shading"]["color-decode"] = args::get(decodeFlag);
    if (widthFlag) overrides["raster"]["width"] = args::get(widthFlag);
    if (heightFlag) overrides["raster"]["height"] = args::get(heightFlag);

    auto config = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!config) {
        spdlog::error("{}", error_msg(config));
        return 1;
    }

    auto shading = ShadingOptions::fromConfig(**config);
    if (!shading) {
        spdlog::error("{}", error_msg(shading));
        return 1;
    }

    if (wgslFlag) {
        auto variant = parseShaderVariant(args::get(wgslFlag));
        if (!variant) {
            spdlog::error("Unknown variant '{}'", args::get(wgslFlag));
            return 1;
        }
        auto library = ShaderLibrary::create(*shading);
        if (!library) {
            spdlog::error("{}", error_msg(library));
            return 1;
        }
        std::cout << (*library)->source(*variant);
        return 0;
    }

    if (!sceneFile) {
        spdlog::error("No scene file given");
        std::cerr << parser;
        return 1;
    }

    auto raster = RasterOptions::fromConfig(**config);
    auto sampler = SamplerDesc::fromConfig(**config);
    if (!raster || !sampler) {
        spdlog::error("{}", !raster ? error_msg(raster) : error_msg(sampler));
        return 1;
    }

    auto scene = render::Scene::load(args::get(sceneFile), *sampler);
    if (!scene) {
        spdlog::error("{}", error_msg(scene));
        return 1;
    }

    auto rasterizer = SoftwareRasterizer::create(*raster, *shading);
    if (!rasterizer) {
        spdlog::error("{}", error_msg(rasterizer));
        return 1;
    }

    if (auto res = render::renderScene(*scene, **rasterizer); !res) {
        spdlog::error("{}", error_msg(res));
        return 1;
    }

    std::string output = args::get(outputFlag);
    if (auto res = render::writePng((*rasterizer)->framebuffer(), output); !res) {
        spdlog::error("{}", error_msg(res));
        return 1;
    }

    const auto& stats = (*rasterizer)->stats();
    spdlog::info("Wrote {} ({}x{}, {} draws, {} fragments)", output,
                 raster->width, raster->height, stats.draws, stats.fragments);
    return 0;
}
