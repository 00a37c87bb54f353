/*
 * PeerMesh
 * Recording grid layout
 */

#include "peermesh-layout.h"

namespace peermesh
{

GridShape gridShapeFor(size_t itemCount)
{
	GridShape shape;
	if (itemCount == 0) {
		return shape;
	}

	if (itemCount == 1) {
		shape.columns = 1;
	} else if (itemCount <= 4) {
		shape.columns = 2;
	} else if (itemCount <= 9) {
		shape.columns = 3;
	} else {
		shape.columns = 4;
	}

	if (itemCount <= 9) {
		shape.rows = shape.columns;
	} else {
		shape.rows = static_cast<uint32_t>((itemCount + 3) / 4);
	}
	return shape;
}

std::vector<LayoutRect> buildGridLayout(size_t itemCount, uint32_t canvasWidth, uint32_t canvasHeight)
{
	std::vector<LayoutRect> layout;
	if (itemCount == 0) {
		return layout;
	}

	const uint32_t safeWidth = canvasWidth == 0 ? 1 : canvasWidth;
	const uint32_t safeHeight = canvasHeight == 0 ? 1 : canvasHeight;

	const GridShape shape = gridShapeFor(itemCount);
	const float cellWidth = static_cast<float>(safeWidth) / static_cast<float>(shape.columns);
	const float cellHeight = static_cast<float>(safeHeight) / static_cast<float>(shape.rows);

	layout.reserve(itemCount);
	for (size_t i = 0; i < itemCount; ++i) {
		const uint32_t row = static_cast<uint32_t>(i) / shape.columns;
		const uint32_t col = static_cast<uint32_t>(i) % shape.columns;

		LayoutRect rect;
		rect.x = cellWidth * static_cast<float>(col);
		rect.y = cellHeight * static_cast<float>(row);
		rect.width = cellWidth;
		rect.height = cellHeight;
		layout.push_back(rect);
	}

	return layout;
}

} // namespace peermesh
