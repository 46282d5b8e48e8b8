#include "texture.h"
#include <stdexcept>
#include <string>
#include <utility>

#include "util.h"

namespace flycam::viewer {

Texture Texture::FromImage(WGPUDevice device, WGPUQueue queue, const Image& image,
                           const char* label) {
  if (image.width == 0 || image.height == 0 ||
      image.rgba.size() != static_cast<size_t>(image.bytesPerRow()) * image.height) {
    throw std::invalid_argument(std::string("Texture '") + label + "': malformed image");
  }

  Texture out;

  WGPUTextureDescriptor texDesc{};
  texDesc.label = makeStringView(label);
  texDesc.dimension = WGPUTextureDimension_2D;
  texDesc.size = {image.width, image.height, 1};
  texDesc.mipLevelCount = 1;
  texDesc.sampleCount = 1;
  texDesc.format = WGPUTextureFormat_RGBA8UnormSrgb;
  texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;
  out.texture_ = wgpuDeviceCreateTexture(device, &texDesc);
  if (!out.texture_) {
    throw std::runtime_error(std::string("failed to create texture '") + label + "'");
  }

  WGPUTexelCopyTextureInfo dst{};
  dst.texture = out.texture_;
  dst.mipLevel = 0;
  dst.origin = {0, 0, 0};
  dst.aspect = WGPUTextureAspect_All;

  WGPUTexelCopyBufferLayout layout{};
  layout.offset = 0;
  layout.bytesPerRow = image.bytesPerRow();
  layout.rowsPerImage = image.height;

  WGPUExtent3D extent{image.width, image.height, 1};
  wgpuQueueWriteTexture(queue, &dst, image.rgba.data(), image.rgba.size(), &layout, &extent);

  WGPUTextureViewDescriptor viewDesc{};
  viewDesc.dimension = WGPUTextureViewDimension_2D;
  viewDesc.format = texDesc.format;
  viewDesc.baseMipLevel = 0;
  viewDesc.mipLevelCount = 1;
  viewDesc.baseArrayLayer = 0;
  viewDesc.arrayLayerCount = 1;
  viewDesc.aspect = WGPUTextureAspect_All;
  out.view_ = wgpuTextureCreateView(out.texture_, &viewDesc);

  // Linear when magnified, nearest when minified.
  WGPUSamplerDescriptor sampDesc{};
  sampDesc.addressModeU = WGPUAddressMode_ClampToEdge;
  sampDesc.addressModeV = WGPUAddressMode_ClampToEdge;
  sampDesc.addressModeW = WGPUAddressMode_ClampToEdge;
  sampDesc.magFilter = WGPUFilterMode_Linear;
  sampDesc.minFilter = WGPUFilterMode_Nearest;
  sampDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
  sampDesc.lodMinClamp = 0.0f;
  sampDesc.lodMaxClamp = 32.0f;
  // wgpu-native rejects the zero default.
  sampDesc.maxAnisotropy = 1;
  out.sampler_ = wgpuDeviceCreateSampler(device, &sampDesc);

  if (!out.view_ || !out.sampler_) {
    throw std::runtime_error(std::string("failed to create view/sampler for '") + label + "'");
  }
  return out;
}

Texture::Texture(Texture&& other) noexcept
    : texture_(std::exchange(other.texture_, nullptr)),
      view_(std::exchange(other.view_, nullptr)),
      sampler_(std::exchange(other.sampler_, nullptr)) {}

Texture& Texture::operator=(Texture&& other) noexcept {
  if (this != &other) {
    release_();
    texture_ = std::exchange(other.texture_, nullptr);
    view_ = std::exchange(other.view_, nullptr);
    sampler_ = std::exchange(other.sampler_, nullptr);
  }
  return *this;
}

Texture::~Texture() { release_(); }

void Texture::release_() {
  if (sampler_) wgpuSamplerRelease(sampler_);
  if (view_) wgpuTextureViewRelease(view_);
  if (texture_) wgpuTextureRelease(texture_);
  sampler_ = nullptr;
  view_ = nullptr;
  texture_ = nullptr;
}

}  // namespace flycam::viewer
