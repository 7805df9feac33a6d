#pragma once

#include "shared/math_vec.hpp"

namespace RT::AntiAlias
{

// Largest supported grid is MAX_GRID_SIZE x MAX_GRID_SIZE samples per pixel
constexpr i32 MAX_GRID_SIZE = 16;

// Offset of the sample from the pixel's top left corner, in pixels. Samples are the centers of the cells of
// a regular gridSize x gridSize subdivision of the pixel, in row major order
vec2 RegularGridOffset( i32 iteration, i32 gridSize );

i32 GetIterations( i32 gridSize );

} // namespace RT::AntiAlias
