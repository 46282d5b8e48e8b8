#pragma once
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <optional>

#include "flycam/app.hpp"
#include "flycam/image.hpp"
#include "gpu_device.h"
#include "texture.h"
#include "window.h"

namespace flycam::viewer {

// Draws the textured quad through the camera uniform onto the window surface.
class Renderer : public RenderBackend {
 public:
  // Acquires instance, surface, adapter and device, then builds every
  // resource. Throws std::runtime_error on any startup failure.
  Renderer(const Window& window, const Image& diffuse, WGPUBackendType backend);
  ~Renderer() override;

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  void Resize(std::uint32_t width, std::uint32_t height) override;
  FrameStatus Render(const CameraUniform& camera) override;

 private:
  void release_();
  void configureSurface_();
  void createBindGroupLayouts_();
  void createBindGroups_();
  void createPipeline_();
  void createMeshBuffers_();
  void encodeRenderPass_(WGPUTextureView targetView);

  WGPUInstance instance_{};
  WGPUSurface surface_{};
  WGPUAdapter adapter_{};
  WGPUDevice device_{};
  WGPUQueue queue_{};
  std::unique_ptr<DeviceErrors> errors_;

  WGPUTextureFormat surfaceFormat_{WGPUTextureFormat_Undefined};
  WGPUPresentMode presentMode_{WGPUPresentMode_Fifo};
  WGPUCompositeAlphaMode alphaMode_{WGPUCompositeAlphaMode_Auto};
  std::uint32_t width_ = 0;
  std::uint32_t height_ = 0;

  std::optional<Texture> diffuse_;

  WGPUShaderModule shaderModule_{};
  WGPUBindGroupLayout textureBindGroupLayout_{};
  WGPUBindGroupLayout cameraBindGroupLayout_{};
  WGPUPipelineLayout pipelineLayout_{};
  WGPURenderPipeline pipeline_{};
  WGPUBindGroup diffuseBindGroup_{};
  WGPUBindGroup cameraBindGroup_{};

  WGPUBuffer vertexBuffer_{};
  WGPUBuffer indexBuffer_{};
  WGPUBuffer cameraBuffer_{};
  std::uint32_t indexCount_ = 0;
};

}  // namespace flycam::viewer
