#include "flycam/config.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace flycam {

namespace {
std::uint32_t parseDimension(const std::string& s, const std::string& whole) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("invalid --size '" + whole + "', expected <width>x<height>");
  }
  unsigned long v = 0;
  try {
    v = std::stoul(s);
  } catch (const std::out_of_range&) {
    v = 0;
  }
  if (v == 0 || v > 16384) {
    throw std::invalid_argument("--size dimensions must be in [1, 16384]");
  }
  return static_cast<std::uint32_t>(v);
}

bool isKnownBackend(const std::string& name) {
  return name.empty() || name == "vulkan" || name == "metal" || name == "d3d12" ||
         name == "opengl";
}
}  // namespace

bool Verbose() { return std::getenv("FLYCAM_VERBOSE") != nullptr; }

Config ParseConfig(const std::vector<std::string>& args) {
  Config cfg;
  cfg.verbose = Verbose();
  if (const char* backend = std::getenv("FLYCAM_BACKEND")) {
    cfg.backend = backend;
  }
  if (!isKnownBackend(cfg.backend)) {
    throw std::invalid_argument("unknown FLYCAM_BACKEND '" + cfg.backend + "'");
  }

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      cfg.show_help = true;
    } else if (arg == "--speed") {
      if (i + 1 >= args.size()) throw std::invalid_argument("--speed needs a value");
      size_t used = 0;
      const std::string& value = args[++i];
      try {
        cfg.speed = std::stof(value, &used);
      } catch (const std::out_of_range&) {
        throw std::invalid_argument("--speed out of range, got '" + value + "'");
      }
      if (used != value.size() || !(cfg.speed > 0.0f) || !std::isfinite(cfg.speed)) {
        throw std::invalid_argument("--speed must be a positive number, got '" + value + "'");
      }
    } else if (arg == "--size") {
      if (i + 1 >= args.size()) throw std::invalid_argument("--size needs a value");
      const std::string& value = args[++i];
      const size_t x = value.find('x');
      if (x == std::string::npos) {
        throw std::invalid_argument("invalid --size '" + value + "', expected <width>x<height>");
      }
      cfg.width = parseDimension(value.substr(0, x), value);
      cfg.height = parseDimension(value.substr(x + 1), value);
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::invalid_argument("unknown option '" + arg + "'");
    } else if (cfg.texture_path) {
      throw std::invalid_argument("only one texture path may be given");
    } else {
      cfg.texture_path = std::filesystem::path(arg);
    }
  }
  return cfg;
}

Config ParseConfig(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  return ParseConfig(args);
}

void PrintUsage(const char* argv0) {
  std::cout << "flycam - textured quad with a keyboard-driven camera\n";
  std::cout << "\nUsage:\n";
  std::cout << "  " << argv0 << " [--speed <s>] [--size <w>x<h>] [texture]\n\n";
  std::cout << "  texture : image file to show (default " << kDefaultTexturePath << ")\n";
  std::cout << "  --speed : camera movement per frame (default 0.2)\n";
  std::cout << "  --size  : initial window size (default 800x600)\n";
  std::cout << "\nControls:\n";
  std::cout << "  W/S or Up/Down     move toward / away from the target\n";
  std::cout << "  A/D or Left/Right  orbit sideways\n";
  std::cout << "  Space/LeftShift    orbit up / down\n";
  std::cout << "  Esc                quit\n";
  std::cout << "\nEnvironment:\n";
  std::cout << "  FLYCAM_VERBOSE=1   verbose logging\n";
  std::cout << "  FLYCAM_BACKEND     vulkan | metal | d3d12 | opengl\n";
}

}  // namespace flycam
