#include <gtest/gtest.h>

#include "layout/viewport_partitioner.hpp"

using namespace sheetscape;

static ViewportInfo make_viewport(double cx, double cy, double w, double h, float px = 1600.0f, float reserved = 0.0f)
{
    ViewportInfo vp;
    vp.center_x          = cx;
    vp.center_y          = cy;
    vp.world_width       = w;
    vp.world_height      = h;
    vp.pixel_width       = px;
    vp.reserved_panel_px = reserved;
    return vp;
}

// ─── partition_viewport ──────────────────────────────────────────────────────

TEST(PartitionViewport, SplitsIntoEqualHalves)
{
    Partition p = partition_viewport(make_viewport(0.0, 4.0, 22.0, 12.4));

    EXPECT_NEAR(p.grid.width, 10.25, 1e-9);
    EXPECT_NEAR(p.stage.width, 10.25, 1e-9);
    EXPECT_NEAR(p.grid.center_x, -5.375, 1e-9);
    EXPECT_NEAR(p.stage.center_x, 5.375, 1e-9);
    EXPECT_NEAR(p.grid.left(), -10.5, 1e-9);
    EXPECT_NEAR(p.stage.right(), 10.5, 1e-9);

    // Gap between the boxes
    EXPECT_NEAR(p.stage.left() - p.grid.right(), 0.5, 1e-9);
}

TEST(PartitionViewport, VerticalExtent)
{
    Partition p = partition_viewport(make_viewport(0.0, 4.0, 22.0, 12.4));

    EXPECT_NEAR(p.grid.top(), 10.2 - 0.08 * 12.4, 1e-9);
    EXPECT_NEAR(p.grid.bottom(), -1.7, 1e-9);
    EXPECT_DOUBLE_EQ(p.grid.center_y, p.stage.center_y);
    EXPECT_DOUBLE_EQ(p.grid.height, p.stage.height);
}

TEST(PartitionViewport, ReservedPanelTakenFromRightEdge)
{
    // 320px of 1600px over 22 world units = 4.4 units
    Partition p = partition_viewport(make_viewport(0.0, 4.0, 22.0, 12.4, 1600.0f, 320.0f));

    EXPECT_NEAR(p.stage.right(), 11.0 - 4.4 - 0.5, 1e-9);
    EXPECT_NEAR(p.grid.width, (21.0 - 4.4 - 0.5) * 0.5, 1e-9);
    EXPECT_NEAR(p.grid.left(), -10.5, 1e-9);
}

TEST(PartitionViewport, ZeroPixelWidthIgnoresReservation)
{
    Partition with    = partition_viewport(make_viewport(0.0, 4.0, 22.0, 12.4, 0.0f, 320.0f));
    Partition without = partition_viewport(make_viewport(0.0, 4.0, 22.0, 12.4, 0.0f, 0.0f));
    EXPECT_EQ(with, without);
}

TEST(PartitionViewport, BottomClampedToFloor)
{
    Partition p = partition_viewport(make_viewport(0.0, 0.0, 20.0, 10.0));
    EXPECT_NEAR(p.grid.bottom(), -2.0, 1e-9);
    EXPECT_NEAR(p.grid.top(), 4.2, 1e-9);
}

TEST(PartitionViewport, MinimumHeight)
{
    Partition p = partition_viewport(make_viewport(0.0, -5.0, 20.0, 4.0));
    EXPECT_NEAR(p.grid.bottom(), -2.0, 1e-9);
    EXPECT_NEAR(p.grid.height, 2.0, 1e-9);
    EXPECT_NEAR(p.stage.height, 2.0, 1e-9);
}

TEST(PartitionViewport, MinimumWidth)
{
    Partition p = partition_viewport(make_viewport(0.0, 4.0, 1.0, 12.4));
    EXPECT_DOUBLE_EQ(p.grid.width, 0.5);
    EXPECT_DOUBLE_EQ(p.stage.width, 0.5);
}

TEST(PartitionViewport, CustomMargins)
{
    PartitionMargins m;
    m.outer = 1.0;
    m.gap   = 2.0;

    Partition p = partition_viewport(make_viewport(0.0, 4.0, 22.0, 12.4), m);
    EXPECT_NEAR(p.grid.left(), -10.0, 1e-9);
    EXPECT_NEAR(p.stage.left() - p.grid.right(), 2.0, 1e-9);
    EXPECT_NEAR(p.grid.width, 9.0, 1e-9);
}

// ─── ViewportPartitioner ─────────────────────────────────────────────────────

TEST(ViewportPartitioner, FirstUpdateComputes)
{
    ViewportPartitioner vp;
    EXPECT_EQ(vp.generation(), 0u);
    EXPECT_TRUE(vp.update(make_viewport(0.0, 4.0, 22.0, 12.4)));
    EXPECT_EQ(vp.generation(), 1u);
    EXPECT_EQ(vp.partition(), partition_viewport(make_viewport(0.0, 4.0, 22.0, 12.4)));
}

TEST(ViewportPartitioner, SameInputIsMemoized)
{
    ViewportPartitioner vp;
    vp.update(make_viewport(0.0, 4.0, 22.0, 12.4));
    EXPECT_FALSE(vp.update(make_viewport(0.0, 4.0, 22.0, 12.4)));
    EXPECT_EQ(vp.generation(), 1u);
}

TEST(ViewportPartitioner, AnyFieldChangeRecomputes)
{
    ViewportPartitioner vp;
    vp.update(make_viewport(0.0, 4.0, 22.0, 12.4));

    EXPECT_TRUE(vp.update(make_viewport(0.0, 4.0, 22.0, 12.4, 1600.0f, 352.0f)));
    EXPECT_TRUE(vp.update(make_viewport(0.0, 4.0, 22.0, 12.4, 1280.0f, 352.0f)));
    EXPECT_TRUE(vp.update(make_viewport(1.0, 4.0, 22.0, 12.4, 1280.0f, 352.0f)));
    EXPECT_EQ(vp.generation(), 4u);
    EXPECT_EQ(vp.viewport().center_x, 1.0);
}

TEST(LayoutBox, Contains)
{
    LayoutBox b{0.0, 0.0, 4.0, 2.0};
    EXPECT_TRUE(b.contains(2.0, 1.0));
    EXPECT_TRUE(b.contains(0.0, 0.0));
    EXPECT_FALSE(b.contains(2.1, 0.0));
    EXPECT_FALSE(b.contains(0.0, -1.1));
}
