#include "util.h"

#include <stdexcept>

namespace flycam::viewer {

std::string toString(WGPUStringView sv) {
  if (!sv.data) return {};
  if (sv.length == WGPU_STRLEN) return std::string(sv.data);
  return std::string(sv.data, sv.length);
}

WGPUShaderModule createShaderModuleFromWGSL(WGPUDevice device, const std::string& code,
                                            const char* label) {
  WGPUShaderSourceWGSL wgsl{};
  wgsl.chain.sType = WGPUSType_ShaderSourceWGSL;
  wgsl.code = makeStringView(code.c_str());

  WGPUShaderModuleDescriptor desc{};
  desc.nextInChain = reinterpret_cast<WGPUChainedStruct*>(&wgsl);
  desc.label = makeStringView(label);

  WGPUShaderModule module = wgpuDeviceCreateShaderModule(device, &desc);
  if (!module) {
    throw std::runtime_error(std::string("failed to create shader module '") + label + "'");
  }
  return module;
}

}  // namespace flycam::viewer
