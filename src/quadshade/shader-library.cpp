#include <quadshade/shader-library.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/fmt/fmt.h>

#include <string>

namespace quadshade {

//-----------------------------------------------------------------------------
// Shared prelude: camera binding and the procedural corner table
//-----------------------------------------------------------------------------
static const char* PRELUDE = R"(
struct Camera {
    view_proj: mat4x4<f32>,
    position: vec3<f32>,
}

@group(0) @binding(0) var<uniform> camera: Camera;

struct Corner {
    position: vec2<f32>,
    uv: vec2<f32>,
}

// Ordinals 0..3: top-left, bottom-left, top-right, bottom-right.
// Anything else stays zero (degenerate vertex).
fn quad_corner(i: u32) -> Corner {
    var c: Corner;
    switch i {
        case 0u: { c.position = vec2<f32>(-0.5,  0.5); c.uv = vec2<f32>(0.0, 0.0); }
        case 1u: { c.position = vec2<f32>(-0.5, -0.5); c.uv = vec2<f32>(0.0, 1.0); }
        case 2u: { c.position = vec2<f32>( 0.5,  0.5); c.uv = vec2<f32>(1.0, 0.0); }
        case 3u: { c.position = vec2<f32>( 0.5, -0.5); c.uv = vec2<f32>(1.0, 1.0); }
        default: {}
    }
    return c;
}

fn to_clip(model: mat4x4<f32>, p: vec2<f32>) -> vec4<f32> {
    return camera.view_proj * model * vec4<f32>(p, 1.0, 1.0);
}
)";

//-----------------------------------------------------------------------------
// Panel: procedural quad, two-color selection test
//-----------------------------------------------------------------------------
static const char* PANEL_SHADER = R"(
struct Panel {
    size: vec4<f32>,
    menu_color: vec4<f32>,
    selection_color: vec4<f32>,
    selection_range_y: vec4<f32>,
}

struct Position {
    transform: mat4x4<f32>,
}

@group(1) @binding(0) var<uniform> panel: Panel;
@group(2) @binding(0) var<uniform> position: Position;

// PANEL_ANCHOR_PLACEHOLDER

struct VertexOutput {
    @builtin(position) clip_position: vec4<f32>,
    @location(0) uv: vec2<f32>,
    @location(1) selection_range_y: vec2<f32>,
    @location(2) @interpolate(flat) menu_color: vec4<f32>,
    @location(3) @interpolate(flat) selection_color: vec4<f32>,
}

@vertex fn vs_main(@builtin(vertex_index) vi: u32) -> VertexOutput {
    let corner = quad_corner(vi);
    let size = panel.size.xy;
    let offset = vec2<f32>(size.x / PANEL_ANCHOR.x, -size.y / PANEL_ANCHOR.y);

    var out: VertexOutput;
    out.clip_position = to_clip(position.transform, corner.position * size + offset);
    out.uv = corner.uv;
    out.selection_range_y = panel.selection_range_y.xy;
    out.menu_color = panel.menu_color;
    out.selection_color = panel.selection_color;
    return out;
}

@fragment fn fs_main(in: VertexOutput) -> @location(0) vec4<f32> {
    if (in.selection_range_y.x < in.uv.y && in.uv.y < in.selection_range_y.y) {
        return in.selection_color;
    }
    return in.menu_color;
}
)";

//-----------------------------------------------------------------------------
// Sprite: procedural quad per instance, texture * tint
//-----------------------------------------------------------------------------
static const char* SPRITE_SHADER = R"(
@group(1) @binding(0) var t_texture: texture_2d<f32>;
@group(1) @binding(1) var s_texture: sampler;

struct InstanceInput {
    @location(0) transform_0: vec4<f32>,
    @location(1) transform_1: vec4<f32>,
    @location(2) transform_2: vec4<f32>,
    @location(3) transform_3: vec4<f32>,
    @location(4) color: vec4<f32>,
    @location(5) size: vec4<f32>,
}

struct VertexOutput {
    @builtin(position) clip_position: vec4<f32>,
    @location(0) uv: vec2<f32>,
    @location(1) color: vec4<f32>,
}

@vertex fn vs_main(@builtin(vertex_index) vi: u32, inst: InstanceInput) -> VertexOutput {
    let model = mat4x4<f32>(inst.transform_0, inst.transform_1,
                            inst.transform_2, inst.transform_3);
    let corner = quad_corner(vi);

    var out: VertexOutput;
    out.clip_position = to_clip(model, corner.position * inst.size.xy);
    out.uv = corner.uv;
    out.color = inst.color;
    return out;
}

@fragment fn fs_main(in: VertexOutput) -> @location(0) vec4<f32> {
    return textureSample(t_texture, s_texture, in.uv) * in.color;
}
)";

//-----------------------------------------------------------------------------
// Quad: explicit vertex buffer, otherwise identical to Sprite
//-----------------------------------------------------------------------------
static const char* QUAD_SHADER = R"(
@group(1) @binding(0) var t_texture: texture_2d<f32>;
@group(1) @binding(1) var s_texture: sampler;

struct VertexInput {
    @location(0) position: vec2<f32>,
    @location(1) uv: vec2<f32>,
}

struct InstanceInput {
    @location(2) transform_0: vec4<f32>,
    @location(3) transform_1: vec4<f32>,
    @location(4) transform_2: vec4<f32>,
    @location(5) transform_3: vec4<f32>,
    @location(6) color: vec4<f32>,
    @location(7) size: vec4<f32>,
}

struct VertexOutput {
    @builtin(position) clip_position: vec4<f32>,
    @location(0) uv: vec2<f32>,
    @location(1) color: vec4<f32>,
}

@vertex fn vs_main(vert: VertexInput, inst: InstanceInput) -> VertexOutput {
    let model = mat4x4<f32>(inst.transform_0, inst.transform_1,
                            inst.transform_2, inst.transform_3);

    var out: VertexOutput;
    out.clip_position = to_clip(model, vert.position * inst.size.xy);
    out.uv = vert.uv;
    out.color = inst.color;
    return out;
}

@fragment fn fs_main(in: VertexOutput) -> @location(0) vec4<f32> {
    return textureSample(t_texture, s_texture, in.uv) * in.color;
}
)";

//-----------------------------------------------------------------------------
// Glyph: atlas sub-rectangle, packed 0xAARRGGBB color, coverage in .r
//-----------------------------------------------------------------------------
static const char* GLYPH_SHADER = R"(
@group(1) @binding(0) var t_atlas: texture_2d<f32>;
@group(1) @binding(1) var s_atlas: sampler;

struct Position {
    transform: mat4x4<f32>,
}

@group(2) @binding(0) var<uniform> position: Position;

// COLOR_DECODE_PLACEHOLDER

struct InstanceInput {
    @location(0) glyph_pos: vec2<f32>,
    @location(1) glyph_size: vec2<f32>,
    @location(2) uv_start: vec2<f32>,
    @location(3) uv_end: vec2<f32>,
    @location(4) color: u32,
}

struct VertexOutput {
    @builtin(position) clip_position: vec4<f32>,
    @location(0) uv: vec2<f32>,
    @location(1) @interpolate(flat) color: u32,
}

@vertex fn vs_main(@builtin(vertex_index) vi: u32, inst: InstanceInput) -> VertexOutput {
    let corner = quad_corner(vi);
    var uv = vec2<f32>(0.0, 0.0);
    switch vi {
        case 0u: { uv = inst.uv_start; }
        case 1u: { uv = vec2<f32>(inst.uv_start.x, inst.uv_end.y); }
        case 2u: { uv = vec2<f32>(inst.uv_end.x, inst.uv_start.y); }
        case 3u: { uv = inst.uv_end; }
        default: {}
    }

    var out: VertexOutput;
    out.clip_position = to_clip(position.transform,
                                corner.position * inst.glyph_size + inst.glyph_pos);
    out.uv = uv;
    out.color = inst.color;
    return out;
}

@fragment fn fs_main(in: VertexOutput) -> @location(0) vec4<f32> {
    let color = unpack_color(in.color);
    let coverage = textureSample(t_atlas, s_atlas, in.uv).r;
    return vec4<f32>(color.rgb, color.a * coverage);
}
)";

static const char* PANEL_ANCHOR_PLACEHOLDER = "// PANEL_ANCHOR_PLACEHOLDER";
static const char* COLOR_DECODE_PLACEHOLDER = "// COLOR_DECODE_PLACEHOLDER";

static std::string colorDecodeCode(ColorDecode decode) {
    // Blue lane is the only difference; legacy keeps the unshifted red mask
    std::string blue = decode == ColorDecode::Legacy
        ? "f32(c & 0x00FF0000u) / 255.0"
        : "f32(c & 0x000000FFu) / 255.0";
    return "fn unpack_color(c: u32) -> vec4<f32> {\n"
           "    let r = f32((c & 0x00FF0000u) >> 16u) / 255.0;\n"
           "    let g = f32((c & 0x0000FF00u) >> 8u) / 255.0;\n"
           "    let b = " + blue + ";\n"
           "    let a = f32((c & 0xFF000000u) >> 24u) / 255.0;\n"
           "    return vec4<f32>(r, g, b, a);\n"
           "}\n";
}

// Shortest round-trip form, independent of the C locale
static std::string panelAnchorCode(const PanelAnchor& anchor) {
    return fmt::format("const PANEL_ANCHOR: vec2<f32> = vec2<f32>({}, {});\n",
                       anchor.xDivisor, anchor.yDivisor);
}

static bool replacePlaceholder(std::string& str, const std::string& placeholder,
                               const std::string& replacement) {
    size_t pos = str.find(placeholder);
    if (pos != std::string::npos) {
        str.replace(pos, placeholder.length(), replacement);
        return true;
    }
    return false;
}

//-----------------------------------------------------------------------------
// ShaderLibrary
//-----------------------------------------------------------------------------

Result<ShaderLibrary::Ptr> ShaderLibrary::create(const ShadingOptions& options) {
    auto library = Ptr(new ShaderLibrary(options));
    if (auto res = library->init(); !res) {
        return Err<Ptr>("Failed to init ShaderLibrary", res);
    }
    return Ok(std::move(library));
}

Result<void> ShaderLibrary::init() {
    for (ShaderVariant variant : ALL_VARIANTS) {
        auto src = assemble(variant);
        if (!src) {
            return Err<void>(std::string("Failed to assemble ") + toString(variant) + " shader", src);
        }
        _sources[static_cast<size_t>(variant)] = std::move(*src);
        ydebug("ShaderLibrary: {} shader, {} bytes", toString(variant),
               _sources[static_cast<size_t>(variant)].size());
    }
    yinfo("ShaderLibrary: color decode={} panel anchor=({}, {})",
          toString(_options.colorDecode),
          _options.panelAnchor.xDivisor, _options.panelAnchor.yDivisor);
    return Ok();
}

Result<std::string> ShaderLibrary::assemble(ShaderVariant variant) const {
    std::string result = PRELUDE;

    switch (variant) {
        case ShaderVariant::Panel:
            result += PANEL_SHADER;
            if (!replacePlaceholder(result, PANEL_ANCHOR_PLACEHOLDER,
                                    panelAnchorCode(_options.panelAnchor))) {
                return Err<std::string>("panel anchor placeholder not found");
            }
            break;
        case ShaderVariant::Sprite:
            result += SPRITE_SHADER;
            break;
        case ShaderVariant::Quad:
            result += QUAD_SHADER;
            break;
        case ShaderVariant::Glyph:
            result += GLYPH_SHADER;
            if (!replacePlaceholder(result, COLOR_DECODE_PLACEHOLDER,
                                    colorDecodeCode(_options.colorDecode))) {
                return Err<std::string>("color decode placeholder not found");
            }
            break;
    }
    return Ok(std::move(result));
}

const std::string& ShaderLibrary::source(ShaderVariant variant) const {
    return _sources[static_cast<size_t>(variant)];
}

} // namespace quadshade
