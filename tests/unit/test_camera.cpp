#include <cmath>
#include <gtest/gtest.h>
#include <sheetscape/camera.hpp>

#include "layout/viewport_partitioner.hpp"

using namespace sheetscape;

constexpr float W = 1600.0f;
constexpr float H = 900.0f;

TEST(Camera, Defaults)
{
    Camera cam;
    EXPECT_EQ(cam.position, vec3(0.0, 5.0, 15.0));
    EXPECT_EQ(cam.target, vec3(0.0, 4.0, 0.0));
    EXPECT_FLOAT_EQ(cam.fov, 45.0f);
}

TEST(Camera, TargetProjectsToScreenCenter)
{
    Camera cam;
    auto   p = cam.project(cam.target, W, H);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->x, W * 0.5f, 0.5f);
    EXPECT_NEAR(p->y, H * 0.5f, 0.5f);
    EXPECT_GT(p->depth, 0.0f);
    EXPECT_LT(p->depth, 1.0f);
}

TEST(Camera, ScreenOriginIsTopLeft)
{
    Camera cam;
    auto   above = cam.project(cam.target + vec3{0.0, 1.0, 0.0}, W, H);
    auto   right = cam.project(cam.target + vec3{1.0, 0.0, 0.0}, W, H);
    ASSERT_TRUE(above && right);
    EXPECT_LT(above->y, H * 0.5f);
    EXPECT_GT(right->x, W * 0.5f);
}

TEST(Camera, NearerPointsHaveSmallerDepth)
{
    Camera cam;
    auto   near_pt = cam.project({0.0, 4.0, 5.0}, W, H);
    auto   far_pt  = cam.project({0.0, 4.0, -5.0}, W, H);
    ASSERT_TRUE(near_pt && far_pt);
    EXPECT_LT(near_pt->depth, far_pt->depth);
}

TEST(Camera, BehindCameraIsNotProjected)
{
    Camera cam;
    EXPECT_FALSE(cam.project({0.0, 5.0, 30.0}, W, H).has_value());
}

TEST(Camera, ScreenRayRoundTrip)
{
    Camera cam;
    vec3   world{2.0, 3.0, 0.0};
    auto   p = cam.project(world, W, H);
    ASSERT_TRUE(p.has_value());

    Ray  ray = cam.screen_ray(p->x, p->y, W, H);
    auto hit = ray_plane_intersect(ray, Plane{{0.0, 0.0, 0.0}, {0.0, 0.0, 1.0}});
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->x, 2.0, 1e-2);
    EXPECT_NEAR(hit->y, 3.0, 1e-2);
}

TEST(Camera, VisibleRegionAtFocusPlane)
{
    Camera       cam;
    ViewportInfo vp = cam.visible_region(W, H);

    EXPECT_FLOAT_EQ(vp.pixel_width, W);
    EXPECT_NEAR(vp.center_x, 0.0, 1e-3);
    EXPECT_GT(vp.world_width, vp.world_height);
    EXPECT_GT(vp.world_height, 10.0);
    EXPECT_LT(vp.world_height, 15.0);
}

TEST(Camera, DegenerateAspect)
{
    Camera cam;
    EXPECT_TRUE(cam.project(cam.target, 100.0f, 0.0f).has_value());
    mat4 p0 = cam.projection_matrix(0.0f);
    mat4 p1 = cam.projection_matrix(1.0f);
    for (int i = 0; i < 16; ++i)
        EXPECT_FLOAT_EQ(p0.m[i], p1.m[i]);
}
