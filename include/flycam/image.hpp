#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace flycam {

// Thrown when a byte stream is not an image the codec understands.
class DecodeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Tightly packed RGBA8, rows top to bottom.
struct Image {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::vector<std::uint8_t> rgba;

  std::uint32_t bytesPerRow() const { return width * 4; }
};

// Decodes PNG/JPEG/BMP/... from memory. Grey, BGR, BGRA and 16-bit sources are
// converted to RGBA8.
Image DecodeImage(const std::vector<std::uint8_t>& bytes);

// Reads a whole file. Throws std::runtime_error if it cannot be opened.
std::vector<std::uint8_t> ReadFileBytes(const std::filesystem::path& path);

// Two-tone checkerboard used when no texture asset is available.
Image MakeCheckerImage(std::uint32_t width, std::uint32_t height, std::uint32_t cell);

}  // namespace flycam
