#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace flycam {

// Matches the vertex buffer layout of the pipeline:
// @location(0) position: vec3<f32>, @location(1) tex_coords: vec2<f32>.
struct Vertex {
  float position[3];
  float tex_coords[2];
};

static_assert(sizeof(Vertex) == 5 * sizeof(float), "Vertex must be tightly packed");
static_assert(offsetof(Vertex, tex_coords) == 3 * sizeof(float), "tex_coords follows position");

inline constexpr std::array<Vertex, 4> kQuadVertices{{
    {{0.0f, 0.5f, 0.0f}, {1.0f, 0.0f}},
    {{-0.5f, 0.5f, 0.0f}, {0.0f, 0.0f}},
    {{-0.5f, -0.5f, 0.0f}, {0.0f, 1.0f}},
    {{0.0f, -0.5f, 0.0f}, {1.0f, 1.0f}},
}};

inline constexpr std::array<std::uint16_t, 6> kQuadIndices{0, 1, 2, 2, 3, 0};

}  // namespace flycam
