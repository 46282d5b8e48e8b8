#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "flycam/app.hpp"
#include "flycam/config.hpp"
#include "flycam/image.hpp"
#include "viewer/gpu_device.h"
#include "viewer/renderer.h"
#include "viewer/window.h"

using std::cout;

namespace fs = std::filesystem;

namespace {

// An explicit path must load. The default asset may be missing, in which case
// a generated pattern stands in.
flycam::Image loadDiffuse(const flycam::Config& cfg) {
  if (cfg.texture_path) {
    return flycam::DecodeImage(flycam::ReadFileBytes(*cfg.texture_path));
  }
  const fs::path fallback = flycam::kDefaultTexturePath;
  std::error_code ec;
  if (!fs::exists(fallback, ec)) {
    std::cerr << "Warning: '" << fallback.string()
              << "' not found. Falling back to a generated test pattern.\n";
    return flycam::MakeCheckerImage(256, 256, 32);
  }
  return flycam::DecodeImage(flycam::ReadFileBytes(fallback));
}

}  // namespace

int main(int argc, char** argv) {
  flycam::Config cfg;
  try {
    cfg = flycam::ParseConfig(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    flycam::PrintUsage(argv[0]);
    return EXIT_FAILURE;
  }
  if (cfg.show_help) {
    flycam::PrintUsage(argv[0]);
    return EXIT_SUCCESS;
  }

  try {
    const flycam::Image diffuse = loadDiffuse(cfg);
    if (cfg.verbose) {
      cout << "Texture " << diffuse.width << "x" << diffuse.height << ", speed " << cfg.speed
           << ", backend '" << (cfg.backend.empty() ? "default" : cfg.backend) << "'\n";
    }

    flycam::viewer::Window window(cfg.title, {cfg.width, cfg.height});
    auto renderer = std::make_unique<flycam::viewer::Renderer>(
        window, diffuse, flycam::viewer::BackendFromName(cfg.backend));

    flycam::App app(cfg.speed);
    app.Start(std::move(renderer), window.size());
    app.SetRedrawRequester([&window] { window.RequestRedraw(); });
    window.SetEventSink([&app](const flycam::WindowEvent& event) { app.HandleEvent(event); });

    window.RequestRedraw();
    while (app.running()) {
      window.PollEvents();
    }
    // Drop the callbacks into app before it goes away.
    window.SetEventSink(nullptr);

    return app.failed() ? EXIT_FAILURE : EXIT_SUCCESS;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_FAILURE;
  }
}
