#include "flycam/image.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace flycam {

namespace {
// Converts whatever imdecode produced into 8-bit RGBA.
cv::Mat toRGBA8(const cv::Mat& decoded) {
  cv::Mat eight;
  if (decoded.depth() == CV_8U) {
    eight = decoded;
  } else if (decoded.depth() == CV_16U) {
    decoded.convertTo(eight, CV_8U, 1.0 / 257.0);
  } else {
    throw DecodeError("DecodeImage: unsupported sample depth");
  }

  cv::Mat rgba;
  switch (eight.channels()) {
    case 1:
      cv::cvtColor(eight, rgba, cv::COLOR_GRAY2RGBA);
      break;
    case 3:
      cv::cvtColor(eight, rgba, cv::COLOR_BGR2RGBA);
      break;
    case 4:
      cv::cvtColor(eight, rgba, cv::COLOR_BGRA2RGBA);
      break;
    default:
      throw DecodeError("DecodeImage: unsupported channel count " +
                        std::to_string(eight.channels()));
  }
  return rgba;
}
}  // namespace

Image DecodeImage(const std::vector<std::uint8_t>& bytes) {
  if (bytes.empty()) {
    throw DecodeError("DecodeImage: empty input");
  }

  cv::Mat decoded;
  try {
    decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    throw DecodeError(std::string("DecodeImage: ") + e.what());
  }
  if (decoded.empty() || decoded.cols <= 0 || decoded.rows <= 0) {
    throw DecodeError("DecodeImage: not a supported image encoding");
  }

  const cv::Mat rgba = toRGBA8(decoded);

  Image out;
  out.width = static_cast<std::uint32_t>(rgba.cols);
  out.height = static_cast<std::uint32_t>(rgba.rows);
  out.rgba.resize(static_cast<size_t>(out.bytesPerRow()) * out.height);
  // cvtColor output is continuous, but copy row by row to be independent of step.
  for (std::uint32_t y = 0; y < out.height; ++y) {
    const std::uint8_t* row = rgba.ptr<std::uint8_t>(static_cast<int>(y));
    std::copy(row, row + out.bytesPerRow(), out.rgba.begin() + static_cast<long>(y) * out.bytesPerRow());
  }
  return out;
}

std::vector<std::uint8_t> ReadFileBytes(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("cannot open '" + path.string() + "'");
  }
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(ifs),
                                   std::istreambuf_iterator<char>());
}

Image MakeCheckerImage(std::uint32_t width, std::uint32_t height, std::uint32_t cell) {
  if (width == 0 || height == 0 || cell == 0) {
    throw std::invalid_argument("MakeCheckerImage: dimensions must be non-zero");
  }
  Image img;
  img.width = width;
  img.height = height;
  img.rgba.resize(static_cast<size_t>(width) * height * 4);

  size_t idx = 0;
  for (std::uint32_t y = 0; y < height; ++y) {
    for (std::uint32_t x = 0; x < width; ++x) {
      const bool light = ((x / cell) + (y / cell)) % 2 == 0;
      img.rgba[idx++] = light ? 230 : 40;
      img.rgba[idx++] = light ? 200 : 120;
      img.rgba[idx++] = light ? 90 : 60;
      img.rgba[idx++] = 255;
    }
  }
  return img;
}

}  // namespace flycam
