#include "renderer.h"
#include <webgpu/webgpu.h>
#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

#include "flycam/config.hpp"
#include "flycam/mesh.hpp"
#include "util.h"

namespace flycam::viewer {

namespace {
// Quad vertices are transformed by the camera; the texture is sampled as is.
constexpr const char* kShaderWGSL = R"WGSL(
struct CameraUniform {
  view_proj : mat4x4<f32>,
};
@group(1) @binding(0) var<uniform> camera : CameraUniform;

struct VertexInput {
  @location(0) position : vec3<f32>,
  @location(1) tex_coords : vec2<f32>,
};

struct VertexOutput {
  @builtin(position) clip_position : vec4<f32>,
  @location(0) tex_coords : vec2<f32>,
};

@vertex
fn vs_main(model : VertexInput) -> VertexOutput {
  var out : VertexOutput;
  out.tex_coords = model.tex_coords;
  out.clip_position = camera.view_proj * vec4<f32>(model.position, 1.0);
  return out;
}

@group(0) @binding(0) var t_diffuse : texture_2d<f32>;
@group(0) @binding(1) var s_diffuse : sampler;

@fragment
fn fs_main(in : VertexOutput) -> @location(0) vec4<f32> {
  return textureSample(t_diffuse, s_diffuse, in.tex_coords);
}
)WGSL";

bool isSrgb(WGPUTextureFormat format) {
  return format == WGPUTextureFormat_BGRA8UnormSrgb || format == WGPUTextureFormat_RGBA8UnormSrgb;
}

// WebGPU buffer writes must be a multiple of 4 bytes.
constexpr size_t alignedBufferSize(size_t bytes) { return (bytes + 3) & ~size_t{3}; }

WGPUBuffer createBuffer(WGPUDevice device, WGPUQueue queue, const char* label,
                        WGPUBufferUsage usage, const void* data, size_t size) {
  WGPUBufferDescriptor bd{};
  bd.label = makeStringView(label);
  bd.usage = usage | WGPUBufferUsage_CopyDst;
  bd.size = alignedBufferSize(size);
  WGPUBuffer buffer = wgpuDeviceCreateBuffer(device, &bd);
  if (!buffer) {
    throw std::runtime_error(std::string("failed to create buffer '") + label + "'");
  }
  if (data) {
    if (bd.size == size) {
      wgpuQueueWriteBuffer(queue, buffer, 0, data, size);
    } else {
      // WriteBuffer sizes must be 4-byte multiples.
      std::string padded(bd.size, '\0');
      std::memcpy(padded.data(), data, size);
      wgpuQueueWriteBuffer(queue, buffer, 0, padded.data(), padded.size());
    }
  }
  return buffer;
}
}  // namespace

Renderer::Renderer(const Window& window, const Image& diffuse, WGPUBackendType backend) {
  try {
    instance_ = CreateWgpuInstance();
    surface_ = window.CreateSurface(instance_);

    auto init = CreateWgpuDevice(instance_, surface_, backend);
    adapter_ = init.adapter;
    device_ = init.device;
    queue_ = init.queue;
    errors_ = std::move(init.errors);

    // A minimized window reports 0x0, which the surface rejects.
    const Size size = window.size();
    width_ = std::max<std::uint32_t>(1, size.width);
    height_ = std::max<std::uint32_t>(1, size.height);
    configureSurface_();

    diffuse_ = Texture::FromImage(device_, queue_, diffuse, "diffuse_texture");

    createBindGroupLayouts_();
    createBindGroups_();
    createPipeline_();
    createMeshBuffers_();
  } catch (...) {
    release_();
    throw;
  }
}

Renderer::~Renderer() { release_(); }

void Renderer::release_() {
  if (cameraBindGroup_) wgpuBindGroupRelease(cameraBindGroup_);
  if (diffuseBindGroup_) wgpuBindGroupRelease(diffuseBindGroup_);
  if (pipeline_) wgpuRenderPipelineRelease(pipeline_);
  if (pipelineLayout_) wgpuPipelineLayoutRelease(pipelineLayout_);
  if (cameraBindGroupLayout_) wgpuBindGroupLayoutRelease(cameraBindGroupLayout_);
  if (textureBindGroupLayout_) wgpuBindGroupLayoutRelease(textureBindGroupLayout_);
  if (shaderModule_) wgpuShaderModuleRelease(shaderModule_);
  if (cameraBuffer_) wgpuBufferRelease(cameraBuffer_);
  if (indexBuffer_) wgpuBufferRelease(indexBuffer_);
  if (vertexBuffer_) wgpuBufferRelease(vertexBuffer_);
  diffuse_.reset();
  if (surface_) {
    if (device_) wgpuSurfaceUnconfigure(surface_);
    wgpuSurfaceRelease(surface_);
  }
  if (queue_) wgpuQueueRelease(queue_);
  if (device_) wgpuDeviceRelease(device_);
  if (adapter_) wgpuAdapterRelease(adapter_);
  if (instance_) wgpuInstanceRelease(instance_);

  cameraBindGroup_ = {};
  diffuseBindGroup_ = {};
  pipeline_ = {};
  pipelineLayout_ = {};
  cameraBindGroupLayout_ = {};
  textureBindGroupLayout_ = {};
  shaderModule_ = {};
  cameraBuffer_ = {};
  indexBuffer_ = {};
  vertexBuffer_ = {};
  surface_ = {};
  queue_ = {};
  device_ = {};
  adapter_ = {};
  instance_ = {};
}

void Renderer::configureSurface_() {
  if (surfaceFormat_ == WGPUTextureFormat_Undefined) {
    WGPUSurfaceCapabilities caps{};
    if (wgpuSurfaceGetCapabilities(surface_, adapter_, &caps) != WGPUStatus_Success ||
        caps.formatCount == 0) {
      throw std::runtime_error("Surface has no supported formats");
    }
    // Prefer an sRGB format, otherwise the first one.
    surfaceFormat_ = caps.formats[0];
    for (size_t i = 0; i < caps.formatCount; ++i) {
      if (isSrgb(caps.formats[i])) {
        surfaceFormat_ = caps.formats[i];
        break;
      }
    }
    if (caps.presentModeCount > 0) presentMode_ = caps.presentModes[0];
    if (caps.alphaModeCount > 0) alphaMode_ = caps.alphaModes[0];
    wgpuSurfaceCapabilitiesFreeMembers(caps);

    if (Verbose()) {
      std::cout << "Surface format " << static_cast<int>(surfaceFormat_) << ", present mode "
                << static_cast<int>(presentMode_) << std::endl;
    }
  }

  WGPUSurfaceConfiguration cfg{};
  cfg.device = device_;
  cfg.format = surfaceFormat_;
  cfg.usage = WGPUTextureUsage_RenderAttachment;
  cfg.presentMode = presentMode_;
  cfg.alphaMode = alphaMode_;
  cfg.width = width_;
  cfg.height = height_;
  wgpuSurfaceConfigure(surface_, &cfg);
}

void Renderer::Resize(std::uint32_t width, std::uint32_t height) {
  if (width == 0 || height == 0) return;
  width_ = width;
  height_ = height;
  configureSurface_();
}

void Renderer::createBindGroupLayouts_() {
  // group 0: diffuse texture + sampler
  WGPUBindGroupLayoutEntry tex[2]{};
  tex[0].binding = 0;
  tex[0].visibility = WGPUShaderStage_Fragment;
  tex[0].texture.sampleType = WGPUTextureSampleType_Float;
  tex[0].texture.viewDimension = WGPUTextureViewDimension_2D;
  tex[0].texture.multisampled = false;

  tex[1].binding = 1;
  tex[1].visibility = WGPUShaderStage_Fragment;
  tex[1].sampler.type = WGPUSamplerBindingType_Filtering;

  WGPUBindGroupLayoutDescriptor texDesc{};
  texDesc.label = makeStringView("texture_bind_group_layout");
  texDesc.entryCount = 2;
  texDesc.entries = tex;
  textureBindGroupLayout_ = wgpuDeviceCreateBindGroupLayout(device_, &texDesc);

  // group 1: camera uniform
  WGPUBindGroupLayoutEntry cam{};
  cam.binding = 0;
  cam.visibility = WGPUShaderStage_Vertex;
  cam.buffer.type = WGPUBufferBindingType_Uniform;
  cam.buffer.hasDynamicOffset = false;
  cam.buffer.minBindingSize = sizeof(CameraUniform);

  WGPUBindGroupLayoutDescriptor camDesc{};
  camDesc.label = makeStringView("camera_bind_group_layout");
  camDesc.entryCount = 1;
  camDesc.entries = &cam;
  cameraBindGroupLayout_ = wgpuDeviceCreateBindGroupLayout(device_, &camDesc);

  if (!textureBindGroupLayout_ || !cameraBindGroupLayout_) {
    throw std::runtime_error("failed to create bind group layouts");
  }
}

void Renderer::createBindGroups_() {
  WGPUBindGroupEntry tex[2]{};
  tex[0].binding = 0;
  tex[0].textureView = diffuse_->view();
  tex[1].binding = 1;
  tex[1].sampler = diffuse_->sampler();

  WGPUBindGroupDescriptor texDesc{};
  texDesc.label = makeStringView("diffuse_bind_group");
  texDesc.layout = textureBindGroupLayout_;
  texDesc.entryCount = 2;
  texDesc.entries = tex;
  diffuseBindGroup_ = wgpuDeviceCreateBindGroup(device_, &texDesc);

  const CameraUniform initial;
  cameraBuffer_ = createBuffer(device_, queue_, "Camera Buffer", WGPUBufferUsage_Uniform,
                               &initial, sizeof(initial));

  WGPUBindGroupEntry cam{};
  cam.binding = 0;
  cam.buffer = cameraBuffer_;
  cam.offset = 0;
  cam.size = sizeof(CameraUniform);

  WGPUBindGroupDescriptor camDesc{};
  camDesc.label = makeStringView("camera_bind_group");
  camDesc.layout = cameraBindGroupLayout_;
  camDesc.entryCount = 1;
  camDesc.entries = &cam;
  cameraBindGroup_ = wgpuDeviceCreateBindGroup(device_, &camDesc);

  if (!diffuseBindGroup_ || !cameraBindGroup_) {
    throw std::runtime_error("failed to create bind groups");
  }
}

void Renderer::createPipeline_() {
  shaderModule_ = createShaderModuleFromWGSL(device_, kShaderWGSL, "shader.wgsl");

  WGPUBindGroupLayout layouts[2] = {textureBindGroupLayout_, cameraBindGroupLayout_};
  WGPUPipelineLayoutDescriptor plDesc{};
  plDesc.label = makeStringView("Render Pipeline Layout");
  plDesc.bindGroupLayoutCount = 2;
  plDesc.bindGroupLayouts = layouts;
  pipelineLayout_ = wgpuDeviceCreatePipelineLayout(device_, &plDesc);

  // Vertex { position: vec3<f32>, tex_coords: vec2<f32> }
  WGPUVertexAttribute attributes[2]{};
  attributes[0].format = WGPUVertexFormat_Float32x3;
  attributes[0].offset = offsetof(Vertex, position);
  attributes[0].shaderLocation = 0;
  attributes[1].format = WGPUVertexFormat_Float32x2;
  attributes[1].offset = offsetof(Vertex, tex_coords);
  attributes[1].shaderLocation = 1;

  WGPUVertexBufferLayout vertexLayout{};
  vertexLayout.stepMode = WGPUVertexStepMode_Vertex;
  vertexLayout.arrayStride = sizeof(Vertex);
  vertexLayout.attributeCount = 2;
  vertexLayout.attributes = attributes;

  WGPUBlendState blend{};
  blend.color.operation = WGPUBlendOperation_Add;
  blend.color.srcFactor = WGPUBlendFactor_One;
  blend.color.dstFactor = WGPUBlendFactor_Zero;
  blend.alpha = blend.color;

  WGPUColorTargetState colorTarget{};
  colorTarget.format = surfaceFormat_;
  colorTarget.blend = &blend;
  // IMPORTANT: enable color writes (default 0 disables all writes)
  colorTarget.writeMask = WGPUColorWriteMask_All;

  WGPUFragmentState frag{};
  frag.module = shaderModule_;
  frag.entryPoint = makeStringView("fs_main");
  frag.targetCount = 1;
  frag.targets = &colorTarget;

  WGPUVertexState vert{};
  vert.module = shaderModule_;
  vert.entryPoint = makeStringView("vs_main");
  vert.bufferCount = 1;
  vert.buffers = &vertexLayout;

  WGPURenderPipelineDescriptor pDesc{};
  pDesc.label = makeStringView("Render Pipeline");
  pDesc.layout = pipelineLayout_;
  pDesc.vertex = vert;
  pDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
  pDesc.primitive.stripIndexFormat = WGPUIndexFormat_Undefined;
  pDesc.primitive.frontFace = WGPUFrontFace_CCW;
  pDesc.primitive.cullMode = WGPUCullMode_Back;
  pDesc.depthStencil = nullptr;
  pDesc.multisample.count = 1;
  pDesc.multisample.mask = ~0u;
  pDesc.multisample.alphaToCoverageEnabled = false;
  pDesc.fragment = &frag;

  pipeline_ = wgpuDeviceCreateRenderPipeline(device_, &pDesc);
  if (!pipeline_) {
    throw std::runtime_error("failed to create render pipeline");
  }
}

void Renderer::createMeshBuffers_() {
  vertexBuffer_ = createBuffer(device_, queue_, "Vertex Buffer", WGPUBufferUsage_Vertex,
                               kQuadVertices.data(), sizeof(kQuadVertices));
  indexBuffer_ = createBuffer(device_, queue_, "Index Buffer", WGPUBufferUsage_Index,
                              kQuadIndices.data(), sizeof(kQuadIndices));
  indexCount_ = static_cast<std::uint32_t>(kQuadIndices.size());
}

FrameStatus Renderer::Render(const CameraUniform& camera) {
  if (errors_->lost) return FrameStatus::DeviceLost;
  if (errors_->out_of_memory) return FrameStatus::OutOfMemory;

  wgpuQueueWriteBuffer(queue_, cameraBuffer_, 0, &camera, sizeof(camera));

  WGPUSurfaceTexture st{};
  wgpuSurfaceGetCurrentTexture(surface_, &st);
  if (Verbose()) {
    std::cout << "GetCurrentTexture status: " << static_cast<int>(st.status) << std::endl;
  }

  FrameStatus status = FrameStatus::Ok;
  switch (st.status) {
    case WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal:
    case WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal:
      break;
    case WGPUSurfaceGetCurrentTextureStatus_Timeout:
      status = FrameStatus::Timeout;
      break;
    case WGPUSurfaceGetCurrentTextureStatus_Outdated:
      status = FrameStatus::Outdated;
      break;
    case WGPUSurfaceGetCurrentTextureStatus_Lost:
      status = FrameStatus::Lost;
      break;
    default:
      if (errors_->lost) {
        status = FrameStatus::DeviceLost;
      } else if (errors_->out_of_memory) {
        status = FrameStatus::OutOfMemory;
      } else {
        status = FrameStatus::Lost;
      }
      break;
  }
  if (status != FrameStatus::Ok) {
    if (st.texture) wgpuTextureRelease(st.texture);
    return status;
  }

  WGPUTextureViewDescriptor vdesc{};
  vdesc.dimension = WGPUTextureViewDimension_2D;
  vdesc.format = surfaceFormat_;
  vdesc.baseMipLevel = 0;
  vdesc.mipLevelCount = WGPU_MIP_LEVEL_COUNT_UNDEFINED;
  vdesc.baseArrayLayer = 0;
  vdesc.arrayLayerCount = WGPU_ARRAY_LAYER_COUNT_UNDEFINED;
  vdesc.aspect = WGPUTextureAspect_All;
  WGPUTextureView tv = wgpuTextureCreateView(st.texture, &vdesc);
  encodeRenderPass_(tv);
  wgpuTextureViewRelease(tv);

  const WGPUStatus presented = wgpuSurfacePresent(surface_);
  wgpuTextureRelease(st.texture);
  wgpuInstanceProcessEvents(instance_);

  if (errors_->lost) return FrameStatus::DeviceLost;
  if (errors_->out_of_memory) return FrameStatus::OutOfMemory;
  return presented == WGPUStatus_Success ? FrameStatus::Ok : FrameStatus::Outdated;
}

void Renderer::encodeRenderPass_(WGPUTextureView targetView) {
  WGPUCommandEncoderDescriptor encDesc{};
  encDesc.label = makeStringView("Render Encoder");
  WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(device_, &encDesc);

  WGPURenderPassColorAttachment color{};
  color.view = targetView;
  // For non-3D color targets, depthSlice must be undefined sentinel.
  color.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
  color.resolveTarget = nullptr;
  color.loadOp = WGPULoadOp_Clear;
  color.storeOp = WGPUStoreOp_Store;
  color.clearValue = {0.1, 0.2, 0.3, 1.0};

  WGPURenderPassDescriptor rpDesc{};
  rpDesc.label = makeStringView("Render Pass");
  rpDesc.colorAttachmentCount = 1;
  rpDesc.colorAttachments = &color;

  WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &rpDesc);

  wgpuRenderPassEncoderSetPipeline(pass, pipeline_);
  wgpuRenderPassEncoderSetBindGroup(pass, 0, diffuseBindGroup_, 0, nullptr);
  wgpuRenderPassEncoderSetBindGroup(pass, 1, cameraBindGroup_, 0, nullptr);
  wgpuRenderPassEncoderSetVertexBuffer(pass, 0, vertexBuffer_, 0, WGPU_WHOLE_SIZE);
  wgpuRenderPassEncoderSetIndexBuffer(pass, indexBuffer_, WGPUIndexFormat_Uint16, 0,
                                      WGPU_WHOLE_SIZE);
  wgpuRenderPassEncoderDrawIndexed(pass, indexCount_, 1, 0, 0, 0);

  wgpuRenderPassEncoderEnd(pass);
  wgpuRenderPassEncoderRelease(pass);

  WGPUCommandBufferDescriptor cmdDesc{};
  WGPUCommandBuffer cmd = wgpuCommandEncoderFinish(encoder, &cmdDesc);
  wgpuCommandEncoderRelease(encoder);

  wgpuQueueSubmit(queue_, 1, &cmd);
  wgpuCommandBufferRelease(cmd);
}

}  // namespace flycam::viewer
