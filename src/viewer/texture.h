#pragma once
#include <webgpu/webgpu.h>

#include "flycam/image.hpp"

namespace flycam::viewer {

// Sampleable RGBA8 (sRGB) 2D texture with its view and sampler.
class Texture {
 public:
  // Throws std::invalid_argument for an empty or inconsistent image.
  static Texture FromImage(WGPUDevice device, WGPUQueue queue, const Image& image,
                           const char* label);

  Texture(Texture&& other) noexcept;
  Texture& operator=(Texture&& other) noexcept;
  Texture(const Texture&) = delete;
  Texture& operator=(const Texture&) = delete;
  ~Texture();

  WGPUTextureView view() const { return view_; }
  WGPUSampler sampler() const { return sampler_; }

 private:
  Texture() = default;
  void release_();

  WGPUTexture texture_{};
  WGPUTextureView view_{};
  WGPUSampler sampler_{};
};

}  // namespace flycam::viewer
