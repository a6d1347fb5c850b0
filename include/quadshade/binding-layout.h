#pragma once

#include <quadshade/result.hpp>
#include <quadshade/shader-variant.h>
#include <cstdint>
#include <span>

namespace quadshade {

//-----------------------------------------------------------------------------
// Resource binding contract
//
// Every variant binds the camera at group 0. What follows depends on the
// variant's capabilities: a PanelUniform, a texture + sampler pair, and/or
// the entity's ModelUniform.
//-----------------------------------------------------------------------------
enum class ResourceKind : uint32_t {
    UniformBuffer = 0,
    Texture = 1,
    Sampler = 2
};

enum StageVisibility : uint32_t {
    STAGE_NONE = 0,
    STAGE_VERTEX = 1u << 0,
    STAGE_FRAGMENT = 1u << 1
};

struct BindingSlot {
    uint32_t group;
    uint32_t binding;
    ResourceKind kind;
    uint32_t visibility;
    uint64_t minSize;   // uniform buffers only, 0 otherwise
    const char* label;
};

std::span<const BindingSlot> bindingLayout(ShaderVariant variant);

// Number of bind groups the variant's pipeline layout declares
uint32_t bindGroupCount(ShaderVariant variant);

const char* toString(ResourceKind kind);

//-----------------------------------------------------------------------------
// Vertex attribute contract
//-----------------------------------------------------------------------------
enum class VertexFormat : uint32_t {
    Float32x2 = 0,
    Float32x4 = 1,
    Uint32 = 2
};

enum class StepMode : uint32_t {
    Vertex = 0,
    Instance = 1
};

struct VertexAttribute {
    VertexFormat format;
    uint64_t offset;
    uint32_t location;
};

struct VertexBufferLayout {
    uint64_t arrayStride;
    StepMode stepMode;
    std::span<const VertexAttribute> attributes;
};

// Buffer slots in order; empty for the Panel variant
std::span<const VertexBufferLayout> vertexBuffers(ShaderVariant variant);

uint64_t formatSize(VertexFormat format);

//-----------------------------------------------------------------------------
// Binding validation
//-----------------------------------------------------------------------------

// A resource the host is about to bind. size is the buffer size for
// uniform buffers and ignored otherwise.
struct BoundResource {
    uint32_t group;
    uint32_t binding;
    ResourceKind kind;
    uint64_t size = 0;
};

// Every declared slot bound with the right kind (uniforms large enough),
// no duplicates, nothing undeclared. The error names the first offending
// group/binding.
Result<void> validateBindings(ShaderVariant variant, std::span<const BoundResource> bound);

} // namespace quadshade
