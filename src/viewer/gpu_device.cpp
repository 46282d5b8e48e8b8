#include "gpu_device.h"
#include <webgpu/webgpu.h>
#include <iostream>
#include <stdexcept>

#include "flycam/config.hpp"
#include "util.h"

namespace flycam::viewer {

namespace {
struct CbCtx {
  WGPUAdapter adapter{};
  WGPUDevice device{};
  std::string message;
  bool done = false;
};

void onAdapter(WGPURequestAdapterStatus status, WGPUAdapter adapter, WGPUStringView message,
               void* userdata1, void* /*userdata2*/) {
  auto* ctx = reinterpret_cast<CbCtx*>(userdata1);
  if (status == WGPURequestAdapterStatus_Success) {
    ctx->adapter = adapter;
  } else {
    ctx->message = toString(message);
  }
  ctx->done = true;
}

void onDevice(WGPURequestDeviceStatus status, WGPUDevice device, WGPUStringView message,
              void* userdata1, void* /*userdata2*/) {
  auto* ctx = reinterpret_cast<CbCtx*>(userdata1);
  if (status == WGPURequestDeviceStatus_Success) {
    ctx->device = device;
  } else {
    ctx->message = toString(message);
  }
  ctx->done = true;
}

void onUncapturedError(WGPUDevice const* /*device*/, WGPUErrorType type, WGPUStringView message,
                       void* userdata1, void* /*userdata2*/) {
  auto* errors = reinterpret_cast<DeviceErrors*>(userdata1);
  if (type == WGPUErrorType_OutOfMemory) errors->out_of_memory = true;
  std::cerr << "WebGPU error (" << static_cast<int>(type) << "): " << toString(message)
            << std::endl;
}

void onDeviceLost(WGPUDevice const* /*device*/, WGPUDeviceLostReason reason,
                  WGPUStringView message, void* userdata1, void* /*userdata2*/) {
  auto* errors = reinterpret_cast<DeviceErrors*>(userdata1);
  errors->lost = true;
  // Destroyed is the normal teardown path.
  if (reason == WGPUDeviceLostReason_Destroyed) return;
  std::cerr << "WebGPU device lost (" << static_cast<int>(reason) << "): " << toString(message)
            << std::endl;
}

WGPURequestAdapterOptions makeAdapterOptions(std::optional<WGPUSurface> surfaceOpt,
                                             WGPUBackendType backend, bool highPerformance) {
  WGPURequestAdapterOptions opt{};
  opt.compatibleSurface = surfaceOpt.has_value() ? surfaceOpt.value() : nullptr;
  opt.backendType = backend;
  opt.powerPreference =
      highPerformance ? WGPUPowerPreference_HighPerformance : WGPUPowerPreference_LowPower;
  return opt;
}

}  // namespace

WGPUInstance CreateWgpuInstance() {
  WGPUInstanceDescriptor desc{};
  WGPUInstance instance = wgpuCreateInstance(&desc);
  if (!instance) {
    throw std::runtime_error("failed to create WebGPU instance");
  }
  return instance;
}

WGPUBackendType BackendFromName(const std::string& name) {
  if (name == "vulkan") return WGPUBackendType_Vulkan;
  if (name == "metal") return WGPUBackendType_Metal;
  if (name == "d3d12") return WGPUBackendType_D3D12;
  if (name == "opengl") return WGPUBackendType_OpenGL;
  if (!name.empty()) {
    throw std::invalid_argument("unknown backend '" + name + "'");
  }
#if defined(__APPLE__)
  return WGPUBackendType_Metal;
#elif defined(_WIN32)
  return WGPUBackendType_D3D12;
#else
  return WGPUBackendType_Vulkan;
#endif
}

WgpuInitResult CreateWgpuDevice(WGPUInstance instance, std::optional<WGPUSurface> surfaceOpt,
                                WGPUBackendType backend, bool highPerformance,
                                const char* label) {
  WgpuInitResult out{};
  out.errors = std::make_unique<DeviceErrors>();

  // Adapter
  CbCtx a{};
  WGPURequestAdapterOptions opt = makeAdapterOptions(surfaceOpt, backend, highPerformance);
  WGPURequestAdapterCallbackInfo acb{};
  acb.mode = WGPUCallbackMode_AllowProcessEvents;
  acb.callback = onAdapter;
  acb.userdata1 = &a;
  acb.userdata2 = nullptr;
  wgpuInstanceRequestAdapter(instance, &opt, acb);
  // Process events until callback runs
  while (!a.done) {
    wgpuInstanceProcessEvents(instance);
  }
  if (!a.adapter) {
    throw std::runtime_error("no suitable GPU adapter: " + a.message);
  }
  out.adapter = a.adapter;

  if (Verbose()) {
    WGPUAdapterInfo info{};
    if (wgpuAdapterGetInfo(out.adapter, &info) == WGPUStatus_Success) {
      std::cout << "Adapter: " << toString(info.device) << " ("
                << toString(info.description) << "), backend "
                << static_cast<int>(info.backendType) << std::endl;
      wgpuAdapterInfoFreeMembers(info);
    }
  }

  // Device
  CbCtx d{};
  WGPUDeviceDescriptor devDesc{};
  devDesc.label = makeStringView(label);
  devDesc.uncapturedErrorCallbackInfo.callback = onUncapturedError;
  devDesc.uncapturedErrorCallbackInfo.userdata1 = out.errors.get();
  devDesc.deviceLostCallbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
  devDesc.deviceLostCallbackInfo.callback = onDeviceLost;
  devDesc.deviceLostCallbackInfo.userdata1 = out.errors.get();

  WGPURequestDeviceCallbackInfo dcb{};
  dcb.mode = WGPUCallbackMode_AllowProcessEvents;
  dcb.callback = onDevice;
  dcb.userdata1 = &d;
  dcb.userdata2 = nullptr;
  wgpuAdapterRequestDevice(out.adapter, &devDesc, dcb);
  while (!d.done) {
    wgpuInstanceProcessEvents(instance);
  }
  if (!d.device) {
    wgpuAdapterRelease(out.adapter);
    throw std::runtime_error("failed to create GPU device: " + d.message);
  }
  out.device = d.device;

  out.queue = wgpuDeviceGetQueue(out.device);
  if (!out.queue) {
    wgpuDeviceRelease(out.device);
    wgpuAdapterRelease(out.adapter);
    throw std::runtime_error("failed to get device queue");
  }

  return out;
}

}  // namespace flycam::viewer
