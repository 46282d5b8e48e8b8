#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace flycam {

inline constexpr const char* kDefaultTexturePath = "assets/texture.png";

struct Config {
  std::string title = "flycam";
  std::uint32_t width = 800;
  std::uint32_t height = 600;
  float speed = 0.2f;
  // Explicit texture file. When empty the default asset is tried and a
  // generated pattern is used if it is missing.
  std::optional<std::filesystem::path> texture_path;
  // Adapter backend override: "", "vulkan", "metal", "d3d12" or "opengl".
  std::string backend;
  bool verbose = false;
  bool show_help = false;
};

// Parses `[--speed <s>] [--size <w>x<h>] [--help] [texture]` and reads
// FLYCAM_VERBOSE / FLYCAM_BACKEND from the environment.
// Throws std::invalid_argument on malformed input.
Config ParseConfig(const std::vector<std::string>& args);
Config ParseConfig(int argc, char** argv);

void PrintUsage(const char* argv0);

// True when FLYCAM_VERBOSE is set.
bool Verbose();

}  // namespace flycam
