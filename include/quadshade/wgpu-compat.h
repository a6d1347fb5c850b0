#pragma once

// String and shader-source helpers for the WGPUStringView API
// (wgpu-native v27+; emdawnwebgpu shares the same API)

#include <webgpu/webgpu.h>

#define WGPU_STR(s) (WGPUStringView{ .data = (s), .length = WGPU_STRLEN })

#define WGPU_SHADER_CODE(desc, src) (desc).code = { .data = (src).c_str(), .length = (src).size() }
