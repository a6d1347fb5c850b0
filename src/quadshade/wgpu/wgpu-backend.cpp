#include <quadshade/wgpu-backend.h>
#include <ytrace/ytrace.hpp>

#include <string>

namespace quadshade::wgpu {

WGPUVertexFormat toWGPU(VertexFormat format) {
    switch (format) {
        case VertexFormat::Float32x2: return WGPUVertexFormat_Float32x2;
        case VertexFormat::Float32x4: return WGPUVertexFormat_Float32x4;
        case VertexFormat::Uint32: return WGPUVertexFormat_Uint32;
    }
    return WGPUVertexFormat_Float32x4;
}

WGPUVertexStepMode toWGPU(StepMode mode) {
    return mode == StepMode::Instance ? WGPUVertexStepMode_Instance : WGPUVertexStepMode_Vertex;
}

WGPUShaderStage toWGPUVisibility(uint32_t visibility) {
    uint64_t stages = 0;
    if (visibility & STAGE_VERTEX) stages |= WGPUShaderStage_Vertex;
    if (visibility & STAGE_FRAGMENT) stages |= WGPUShaderStage_Fragment;
    return static_cast<WGPUShaderStage>(stages);
}

std::vector<std::vector<WGPUBindGroupLayoutEntry>> bindGroupLayoutEntries(ShaderVariant variant) {
    std::vector<std::vector<WGPUBindGroupLayoutEntry>> groups(bindGroupCount(variant));

    for (const auto& slot : bindingLayout(variant)) {
        WGPUBindGroupLayoutEntry entry = {};
        entry.binding = slot.binding;
        entry.visibility = toWGPUVisibility(slot.visibility);
        switch (slot.kind) {
            case ResourceKind::UniformBuffer:
                entry.buffer.type = WGPUBufferBindingType_Uniform;
                entry.buffer.minBindingSize = slot.minSize;
                break;
            case ResourceKind::Texture:
                entry.texture.sampleType = WGPUTextureSampleType_Float;
                entry.texture.viewDimension = WGPUTextureViewDimension_2D;
                break;
            case ResourceKind::Sampler:
                entry.sampler.type = WGPUSamplerBindingType_Filtering;
                break;
        }
        groups[slot.group].push_back(entry);
    }
    return groups;
}

Result<std::vector<WGPUBindGroupLayout>> createBindGroupLayouts(WGPUDevice device,
                                                                ShaderVariant variant) {
    auto groups = bindGroupLayoutEntries(variant);
    std::vector<WGPUBindGroupLayout> layouts;
    layouts.reserve(groups.size());

    for (size_t i = 0; i < groups.size(); ++i) {
        WGPUBindGroupLayoutDescriptor layoutDesc = {};
        layoutDesc.entryCount = groups[i].size();
        layoutDesc.entries = groups[i].data();
        WGPUBindGroupLayout layout = wgpuDeviceCreateBindGroupLayout(device, &layoutDesc);
        if (!layout) {
            for (auto created : layouts) {
                wgpuBindGroupLayoutRelease(created);
            }
            return Err<std::vector<WGPUBindGroupLayout>>(
                std::string("Failed to create ") + toString(variant) +
                " bind group layout " + std::to_string(i));
        }
        layouts.push_back(layout);
    }
    return Ok(std::move(layouts));
}

VertexLayouts::VertexLayouts(ShaderVariant variant) {
    auto buffers = vertexBuffers(variant);
    _attributes.reserve(buffers.size());
    _layouts.reserve(buffers.size());

    for (const auto& buffer : buffers) {
        auto& attrs = _attributes.emplace_back();
        for (const auto& a : buffer.attributes) {
            WGPUVertexAttribute attr = {};
            attr.format = toWGPU(a.format);
            attr.offset = a.offset;
            attr.shaderLocation = a.location;
            attrs.push_back(attr);
        }

        WGPUVertexBufferLayout layout = {};
        layout.arrayStride = buffer.arrayStride;
        layout.stepMode = toWGPU(buffer.stepMode);
        layout.attributeCount = attrs.size();
        layout.attributes = attrs.data();
        _layouts.push_back(layout);
    }
}

Result<WGPUShaderModule> createShaderModule(WGPUDevice device, ShaderVariant variant,
                                            const ShaderLibrary& library) {
    const std::string& source = library.source(variant);
    if (source.empty()) {
        return Err<WGPUShaderModule>(std::string("No WGSL source for ") + toString(variant));
    }

    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    WGPU_SHADER_CODE(wgslDesc, source);
    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = WGPU_STR(toString(variant));
    WGPUShaderModule module = wgpuDeviceCreateShaderModule(device, &shaderDesc);
    if (!module) {
        return Err<WGPUShaderModule>(std::string("Failed to create ") + toString(variant) +
                                     " shader module");
    }
    ydebug("wgpu: created {} shader module", toString(variant));
    return Ok(module);
}

} // namespace quadshade::wgpu
