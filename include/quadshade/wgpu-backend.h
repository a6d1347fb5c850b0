#pragma once

#include <quadshade/binding-layout.h>
#include <quadshade/result.hpp>
#include <quadshade/shader-library.h>
#include <quadshade/shader-variant.h>
#include <quadshade/wgpu-compat.h>
#include <vector>

namespace quadshade::wgpu {

//-----------------------------------------------------------------------------
// Binding contract as WebGPU layout entries, one list per bind group
//-----------------------------------------------------------------------------
std::vector<std::vector<WGPUBindGroupLayoutEntry>> bindGroupLayoutEntries(ShaderVariant variant);

// Creates one WGPUBindGroupLayout per group; the caller releases them
Result<std::vector<WGPUBindGroupLayout>> createBindGroupLayouts(WGPUDevice device,
                                                                ShaderVariant variant);

//-----------------------------------------------------------------------------
// VertexLayouts - WGPUVertexBufferLayout array plus the attribute storage
// it points into. Keep it alive until the pipeline is created.
//-----------------------------------------------------------------------------
class VertexLayouts {
public:
    explicit VertexLayouts(ShaderVariant variant);

    VertexLayouts(const VertexLayouts&) = delete;
    VertexLayouts& operator=(const VertexLayouts&) = delete;

    const WGPUVertexBufferLayout* data() const { return _layouts.empty() ? nullptr : _layouts.data(); }
    size_t count() const { return _layouts.size(); }

private:
    std::vector<std::vector<WGPUVertexAttribute>> _attributes;
    std::vector<WGPUVertexBufferLayout> _layouts;
};

WGPUVertexFormat toWGPU(VertexFormat format);
WGPUVertexStepMode toWGPU(StepMode mode);
WGPUShaderStage toWGPUVisibility(uint32_t visibility);

// Compiles the variant's WGSL from the library; the caller releases it
Result<WGPUShaderModule> createShaderModule(WGPUDevice device, ShaderVariant variant,
                                            const ShaderLibrary& library);

} // namespace quadshade::wgpu
