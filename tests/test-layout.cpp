/*
 * Unit tests for recording grid layout
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include "peermesh-layout.h"

using namespace peermesh;

TEST(LayoutTest, ReturnsEmptyForZeroItems)
{
	auto layout = buildGridLayout(0, 1280, 720);
	EXPECT_TRUE(layout.empty());
	EXPECT_EQ(gridShapeFor(0).columns, 0u);
}

TEST(LayoutTest, SingleItemFillsCanvas)
{
	auto layout = buildGridLayout(1, 1280, 720);
	ASSERT_EQ(layout.size(), 1u);
	EXPECT_FLOAT_EQ(layout[0].x, 0.0f);
	EXPECT_FLOAT_EQ(layout[0].y, 0.0f);
	EXPECT_FLOAT_EQ(layout[0].width, 1280.0f);
	EXPECT_FLOAT_EQ(layout[0].height, 720.0f);
}

TEST(LayoutTest, TwoToFourItemsUseTwoByTwoGrid)
{
	for (size_t count = 2; count <= 4; ++count) {
		const GridShape shape = gridShapeFor(count);
		EXPECT_EQ(shape.columns, 2u) << count;
		EXPECT_EQ(shape.rows, 2u) << count;
	}

	auto layout = buildGridLayout(3, 1280, 720);
	ASSERT_EQ(layout.size(), 3u);
	EXPECT_FLOAT_EQ(layout[0].width, 640.0f);
	EXPECT_FLOAT_EQ(layout[0].height, 360.0f);
	EXPECT_FLOAT_EQ(layout[1].x, 640.0f);
	EXPECT_FLOAT_EQ(layout[1].y, 0.0f);
	EXPECT_FLOAT_EQ(layout[2].x, 0.0f);
	EXPECT_FLOAT_EQ(layout[2].y, 360.0f);
}

TEST(LayoutTest, FiveToNineItemsUseThreeByThreeGrid)
{
	EXPECT_EQ(gridShapeFor(5).columns, 3u);
	EXPECT_EQ(gridShapeFor(5).rows, 3u);
	EXPECT_EQ(gridShapeFor(9).rows, 3u);

	auto layout = buildGridLayout(5, 1920, 1080);
	ASSERT_EQ(layout.size(), 5u);
	EXPECT_FLOAT_EQ(layout[0].width, 640.0f);
	EXPECT_FLOAT_EQ(layout[0].height, 360.0f);
	EXPECT_FLOAT_EQ(layout[3].x, 0.0f);
	EXPECT_FLOAT_EQ(layout[3].y, 360.0f);
	EXPECT_FLOAT_EQ(layout[4].x, 640.0f);
	EXPECT_FLOAT_EQ(layout[4].y, 360.0f);
}

TEST(LayoutTest, TenOrMoreItemsUseFourColumns)
{
	EXPECT_EQ(gridShapeFor(10).columns, 4u);
	EXPECT_EQ(gridShapeFor(10).rows, 3u);
	EXPECT_EQ(gridShapeFor(12).rows, 3u);
	EXPECT_EQ(gridShapeFor(13).rows, 4u);

	auto layout = buildGridLayout(10, 1280, 720);
	ASSERT_EQ(layout.size(), 10u);
	EXPECT_FLOAT_EQ(layout[0].width, 320.0f);
	EXPECT_FLOAT_EQ(layout[0].height, 240.0f);
	EXPECT_FLOAT_EQ(layout[9].x, 320.0f);
	EXPECT_FLOAT_EQ(layout[9].y, 480.0f);
}

TEST(LayoutTest, ZeroSizedCanvasStillProducesCells)
{
	auto layout = buildGridLayout(2, 0, 0);
	ASSERT_EQ(layout.size(), 2u);
	EXPECT_GT(layout[0].width, 0.0f);
}
