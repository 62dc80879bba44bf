#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "layout/placement_strategy.hpp"

using namespace sheetscape;

namespace
{

// left 0, right 10, top 9, bottom -1
const LayoutBox STAGE{5.0, 4.0, 10.0, 10.0};
// left -11, right -1, top 9, bottom -1
const LayoutBox GRID{-6.0, 4.0, 10.0, 10.0};

Artifact make_artifact(const std::string& title, ArtifactCategory category = ArtifactCategory::Uncategorized)
{
    Artifact a;
    a.id       = "artifact-x";
    a.title    = title;
    a.category = category;
    return a;
}

void expect_position(const Pose& p, double x, double y, double z)
{
    EXPECT_NEAR(p.position.x, x, 1e-6);
    EXPECT_NEAR(p.position.y, y, 1e-6);
    EXPECT_NEAR(p.position.z, z, 1e-6);
}

}   // namespace

// ─── Active board ────────────────────────────────────────────────────────────

TEST(ActivePose, CenteredOnStage)
{
    Pose p = active_pose(STAGE, false);
    expect_position(p, 5.0, 4.0, 0.0);
    EXPECT_FLOAT_EQ(p.width, 7.0f);
    EXPECT_FLOAT_EQ(p.height, 5.0f);
    EXPECT_FLOAT_EQ(p.scale, 1.0f);
    EXPECT_FLOAT_EQ(p.opacity, 1.0f);
    EXPECT_DOUBLE_EQ(p.rotation.y, 0.0);
}

TEST(ActivePose, ExpandedFillsStageFromTop)
{
    Pose p = active_pose(STAGE, true);
    EXPECT_FLOAT_EQ(p.width, 10.0f);
    EXPECT_FLOAT_EQ(p.height, 9.0f);
    expect_position(p, 5.0, 4.5, 2.0);
}

TEST(ActivePose, ShrinksToNarrowStage)
{
    LayoutBox narrow{0.0, 0.0, 3.0, 2.0};
    Pose      p = active_pose(narrow, false);
    EXPECT_FLOAT_EQ(p.width, 3.0f);
    EXPECT_FLOAT_EQ(p.height, 2.0f);
}

TEST(PlacementStrategy, ActiveIsSameForEveryVariant)
{
    Artifact a = make_artifact("Clustering Analysis");
    for (auto kind : {VisualizationStrategy::Sidebar,
                      VisualizationStrategy::Tabs,
                      VisualizationStrategy::Grouping,
                      VisualizationStrategy::Gallery})
    {
        auto strategy = make_placement_strategy(kind);
        EXPECT_EQ(strategy->kind(), kind);
        EXPECT_EQ(strategy->pose(a, true, -1, STAGE, GRID, false), active_pose(STAGE, false));
        EXPECT_EQ(strategy->pose(a, true, -1, STAGE, GRID, true, true), active_pose(STAGE, true));
    }
}

// ─── Sidebar ─────────────────────────────────────────────────────────────────

TEST(SidebarPlacement, FirstSlot)
{
    SidebarPlacement s;
    Pose             p = s.pose(make_artifact("A"), false, 0, STAGE, GRID, false);
    expect_position(p, 11.2, 7.5, -2.0);
    EXPECT_NEAR(p.rotation.y, -PI / 6.0, 1e-6);
    EXPECT_FLOAT_EQ(p.scale, 0.3f);
    EXPECT_FLOAT_EQ(p.opacity, 0.5f);
    EXPECT_FLOAT_EQ(p.width, 7.0f);
    EXPECT_FLOAT_EQ(p.height, 5.0f);
}

TEST(SidebarPlacement, WrapsIntoNextColumn)
{
    SidebarPlacement s;
    Pose             p4 = s.pose(make_artifact("A"), false, 4, STAGE, GRID, false);
    Pose             p6 = s.pose(make_artifact("A"), false, 6, STAGE, GRID, false);

    expect_position(p4, 11.2, 7.5 - 4 * 1.8, -2.0 - 0.8);
    expect_position(p6, 13.6, 5.7, -4.7);
}

TEST(SidebarPlacement, HoverBrightensAndGrows)
{
    SidebarPlacement s;
    Pose             p = s.pose(make_artifact("A"), false, 0, STAGE, GRID, true);
    EXPECT_FLOAT_EQ(p.opacity, 0.9f);
    EXPECT_FLOAT_EQ(p.scale, 0.3f * 1.1f);
}

TEST(SidebarPlacement, NegativeRankTreatedAsZero)
{
    SidebarPlacement s;
    EXPECT_EQ(s.pose(make_artifact("A"), false, -3, STAGE, GRID, false),
              s.pose(make_artifact("A"), false, 0, STAGE, GRID, false));
}

// ─── Tabs ────────────────────────────────────────────────────────────────────

TEST(TabsPlacement, StacksDownFromGridTop)
{
    TabsPlacement t;
    Pose          p0 = t.pose(make_artifact("A"), false, 0, STAGE, GRID, false);
    Pose          p2 = t.pose(make_artifact("A"), false, 2, STAGE, GRID, false);

    expect_position(p0, -6.0, 8.65, 0.5);
    expect_position(p2, -6.0, 7.25, 0.48);
    EXPECT_FLOAT_EQ(p0.width, 6.0f);
    EXPECT_FLOAT_EQ(p0.height, 1.5f);
    EXPECT_FLOAT_EQ(p0.scale, 0.4f);
    EXPECT_FLOAT_EQ(p0.opacity, 0.6f);
    EXPECT_DOUBLE_EQ(p0.rotation.y, 0.0);
}

TEST(TabsPlacement, HoveredFullyOpaque)
{
    TabsPlacement t;
    EXPECT_FLOAT_EQ(t.pose(make_artifact("A"), false, 1, STAGE, GRID, true).opacity, 1.0f);
}

TEST(TabsPlacement, StripsStayAboveSpreadsheet)
{
    TabsPlacement t;
    // 10 high box minus the reserve leaves room for five slots.
    double surface_top = GRID.bottom() + TabsPlacement::SURFACE_RESERVE;
    for (int rank = 0; rank < 40; ++rank)
    {
        Pose   p    = t.pose(make_artifact("A"), false, rank, STAGE, GRID, true);
        double half = p.height * p.scale * 0.5;
        EXPECT_LE(p.position.y + half, GRID.top() + 1e-9) << "rank " << rank;
        EXPECT_GE(p.position.y - half, surface_top) << "rank " << rank;
    }
}

TEST(TabsPlacement, FullBandStartsLayerBehind)
{
    TabsPlacement t;
    Pose          p4 = t.pose(make_artifact("A"), false, 4, STAGE, GRID, false);
    Pose          p5 = t.pose(make_artifact("A"), false, 5, STAGE, GRID, false);

    expect_position(p4, -6.0, 5.85, 0.46);
    expect_position(p5, -5.7, 8.65, 0.05);
}

TEST(TabsPlacement, ShortBoxKeepsOneSlot)
{
    TabsPlacement t;
    LayoutBox     low{-6.0, 2.0, 10.0, 4.0};
    Pose          p0 = t.pose(make_artifact("A"), false, 0, STAGE, low, false);
    Pose          p1 = t.pose(make_artifact("A"), false, 1, STAGE, low, false);
    EXPECT_DOUBLE_EQ(p0.position.y, p1.position.y);
    EXPECT_LT(p1.position.z, p0.position.z);
}

// ─── Grouping ────────────────────────────────────────────────────────────────

TEST(GroupingPlacement, CategoryPicksArcSlot)
{
    GroupingPlacement g;
    Pose p = g.pose(make_artifact("Result", ArtifactCategory::Clustering), false, 0, STAGE, GRID, false);

    // Span -11..10: center -0.5, half 10.5
    expect_position(p, -0.5 + 0.27 * 10.5, 6.3, -4.0);
    EXPECT_NEAR(p.rotation.y, -0.08, 1e-6);
    EXPECT_FLOAT_EQ(p.scale, 0.4f);
}

TEST(GroupingPlacement, TitleFallbackClassification)
{
    GroupingPlacement g;
    Pose p = g.pose(make_artifact("Time Series Analysis"), false, 0, STAGE, GRID, false);
    expect_position(p, -0.5 + 0.8 * 10.5, 6.3, -2.0);
    EXPECT_NEAR(p.rotation.y, -0.25, 1e-6);
}

TEST(GroupingPlacement, UnmatchedTitleSpreadsByRank)
{
    GroupingPlacement g;
    Pose p = g.pose(make_artifact("Misc"), false, 1, STAGE, GRID, false);

    // rank 1 -> bucket 1, stacked one step
    expect_position(p, -0.5 - 0.27 * 10.5 + 0.15, 6.45, -4.3);
    EXPECT_FLOAT_EQ(p.opacity, 0.6f);
}

// ─── Gallery ─────────────────────────────────────────────────────────────────

TEST(GalleryPlacement, EvenRanksRightOddRanksLeft)
{
    GalleryPlacement g;
    Pose             p0 = g.pose(make_artifact("A"), false, 0, STAGE, GRID, false);
    Pose             p3 = g.pose(make_artifact("A"), false, 3, STAGE, GRID, false);

    expect_position(p0, 5.0 + 6.725, 4.0, -1.5);
    EXPECT_NEAR(p0.rotation.y, 0.35, 1e-6);

    expect_position(p3, 5.0 - 7.525, 4.3, -3.0);
    EXPECT_NEAR(p3.rotation.y, -0.35, 1e-6);
    EXPECT_FLOAT_EQ(p3.scale, 0.35f);
    EXPECT_FLOAT_EQ(p3.opacity, 0.55f);
}

TEST(GalleryPlacement, HoverOpacity)
{
    GalleryPlacement g;
    EXPECT_FLOAT_EQ(g.pose(make_artifact("A"), false, 2, STAGE, GRID, true).opacity, 0.95f);
}

// ─── Category helpers ────────────────────────────────────────────────────────

TEST(ArtifactCategory, FromTitle)
{
    EXPECT_EQ(category_from_title("Descriptive Stats"), ArtifactCategory::Descriptive);
    EXPECT_EQ(category_from_title("LINEAR fit"), ArtifactCategory::Regression);
    EXPECT_EQ(category_from_title("k-means clustering"), ArtifactCategory::Clustering);
    EXPECT_EQ(category_from_title("Time Series"), ArtifactCategory::TimeSeries);
    EXPECT_EQ(category_from_title("Something else"), ArtifactCategory::Uncategorized);
}

TEST(ArtifactCategory, BucketPrefersExplicitCategory)
{
    Artifact a = make_artifact("Linear Regression", ArtifactCategory::Clustering);
    EXPECT_EQ(category_bucket(a, 3), 2);

    Artifact b = make_artifact("Untitled");
    EXPECT_EQ(category_bucket(b, 0), 0);
    EXPECT_EQ(category_bucket(b, 5), 1);
    EXPECT_EQ(category_bucket(b, -1), 0);
}

// ─── Every variant ───────────────────────────────────────────────────────────

class PlacementVariantTest : public ::testing::TestWithParam<VisualizationStrategy>
{
   protected:
    // One placement pass over a collection with the given active index.
    static std::vector<Pose> place_all(const PlacementStrategy&     strategy,
                                       const std::vector<Artifact>& list,
                                       size_t                       active)
    {
        std::vector<Pose> poses;
        int               rank = 0;
        for (size_t i = 0; i < list.size(); ++i)
        {
            bool is_active = i == active;
            poses.push_back(strategy.pose(list[i], is_active, is_active ? -1 : rank, STAGE, GRID, false));
            if (!is_active)
                ++rank;
        }
        return poses;
    }
};

TEST_P(PlacementVariantTest, RepeatedPassIsIdentical)
{
    std::vector<Artifact> list;
    const char*           titles[] = {"Descriptive Stats", "Linear Regression", "Clustering", "Time Series", "Misc"};
    for (int i = 0; i < 10; ++i)
    {
        Artifact a = make_artifact(titles[i % 5]);
        a.id       = "artifact-" + std::to_string(i + 1);
        list.push_back(a);
    }

    auto first  = make_placement_strategy(GetParam());
    auto second = make_placement_strategy(GetParam());
    for (size_t active : {size_t{0}, size_t{4}, size_t{9}})
    {
        std::vector<Pose> a = place_all(*first, list, active);
        std::vector<Pose> b = place_all(*first, list, active);
        std::vector<Pose> c = place_all(*second, list, active);
        ASSERT_EQ(a.size(), list.size());
        for (size_t i = 0; i < a.size(); ++i)
        {
            EXPECT_TRUE(a[i] == b[i]) << "entry " << i;
            EXPECT_TRUE(a[i] == c[i]) << "entry " << i;
        }
    }
}

TEST_P(PlacementVariantTest, ConsecutiveRanksStayClose)
{
    auto     strategy = make_placement_strategy(GetParam());
    Artifact a        = make_artifact("Misc");

    // No step between neighbouring ranks crosses more than twice the
    // combined width of both boxes.
    double limit = 2.0 * (STAGE.width + GRID.width);
    for (int rank = 0; rank <= 20; ++rank)
    {
        Pose here = strategy->pose(a, false, rank, STAGE, GRID, false);
        Pose next = strategy->pose(a, false, rank + 1, STAGE, GRID, false);
        EXPECT_TRUE(std::isfinite(here.position.x) && std::isfinite(here.position.y)
                    && std::isfinite(here.position.z));
        EXPECT_LE(pose_distance(here, next), limit) << "rank " << rank;
        EXPECT_GT(pose_distance(here, next), 0.0) << "rank " << rank;
    }
}

TEST_P(PlacementVariantTest, InactiveNeverOutshinesActive)
{
    auto strategy = make_placement_strategy(GetParam());
    Pose active   = strategy->pose(make_artifact("A"), true, -1, STAGE, GRID, false);
    for (int rank = 0; rank < 12; ++rank)
    {
        Pose p = strategy->pose(make_artifact("A"), false, rank, STAGE, GRID, true);
        EXPECT_LE(p.opacity, active.opacity);
        EXPECT_LE(p.scale, active.scale);
    }
}

INSTANTIATE_TEST_SUITE_P(AllVariants,
                         PlacementVariantTest,
                         ::testing::Values(VisualizationStrategy::Sidebar,
                                           VisualizationStrategy::Tabs,
                                           VisualizationStrategy::Grouping,
                                           VisualizationStrategy::Gallery));
