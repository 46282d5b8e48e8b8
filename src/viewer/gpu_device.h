#pragma once
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace flycam::viewer {

// Filled in by the device callbacks; read by the renderer every frame.
struct DeviceErrors {
  bool out_of_memory = false;
  bool lost = false;
};

struct WgpuInitResult {
  WGPUAdapter adapter{};
  WGPUDevice device{};
  WGPUQueue queue{};
  // Heap allocated so the callback userdata pointer stays valid when moved.
  std::unique_ptr<DeviceErrors> errors;
};

WGPUInstance CreateWgpuInstance();

// Platform default (Metal / D3D12 / Vulkan) when name is empty, otherwise
// "vulkan", "metal", "d3d12" or "opengl".
WGPUBackendType BackendFromName(const std::string& name);

// Blocks until the adapter and device requests resolve. Pass the surface so
// the adapter is guaranteed to be able to present to it.
// Throws std::runtime_error when no adapter or device is available.
WgpuInitResult CreateWgpuDevice(WGPUInstance instance,
                                std::optional<WGPUSurface> surfaceOpt,
                                WGPUBackendType backend,
                                bool highPerformance = true,
                                const char* label = "flycam device");

}  // namespace flycam::viewer
