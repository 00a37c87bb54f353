/*
 * PeerMesh
 * Recording grid layout
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace peermesh
{

struct LayoutRect {
	float x = 0.0f;
	float y = 0.0f;
	float width = 0.0f;
	float height = 0.0f;
};

struct GridShape {
	uint32_t columns = 0;
	uint32_t rows = 0;
};

// 1 -> 1x1, 2..4 -> 2x2, 5..9 -> 3x3, otherwise 4 columns
GridShape gridShapeFor(size_t itemCount);

std::vector<LayoutRect> buildGridLayout(size_t itemCount, uint32_t canvasWidth, uint32_t canvasHeight);

} // namespace peermesh
