#pragma once
#include <webgpu/webgpu.h>
#include <string>

namespace flycam::viewer {

inline WGPUStringView makeStringView(const char* s) {
  WGPUStringView sv{};
  sv.data = s;
  sv.length = WGPU_STRLEN;  // treat as null-terminated
  return sv;
}

std::string toString(WGPUStringView sv);

WGPUShaderModule createShaderModuleFromWGSL(WGPUDevice device, const std::string& code,
                                            const char* label);

}  // namespace flycam::viewer
