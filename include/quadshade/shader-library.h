#pragma once

#include <quadshade/result.hpp>
#include <quadshade/shader-variant.h>
#include <quadshade/shading-options.h>
#include <array>
#include <memory>
#include <string>

namespace quadshade {

/**
 * ShaderLibrary holds the WGSL source of each program variant.
 *
 * The sources are assembled once from a shared camera prelude and the
 * variant templates; the color decode policy and the panel anchor are
 * baked in from ShadingOptions. Every program exposes vs_main / fs_main
 * and follows the binding contract of bindingLayout().
 */
class ShaderLibrary {
public:
    using Ptr = std::unique_ptr<ShaderLibrary>;

    static Result<Ptr> create(const ShadingOptions& options);

    ~ShaderLibrary() = default;

    ShaderLibrary(const ShaderLibrary&) = delete;
    ShaderLibrary& operator=(const ShaderLibrary&) = delete;

    const std::string& source(ShaderVariant variant) const;

    const ShadingOptions& options() const { return _options; }

    static constexpr const char* VERTEX_ENTRY = "vs_main";
    static constexpr const char* FRAGMENT_ENTRY = "fs_main";

private:
    explicit ShaderLibrary(const ShadingOptions& options) : _options(options) {}

    Result<void> init();
    Result<std::string> assemble(ShaderVariant variant) const;

    ShadingOptions _options;
    std::array<std::string, 4> _sources;
};

} // namespace quadshade
