#include <gtest/gtest.h>
#include <memory>
#include <numeric>
#include <vector>

#include "layout/placement_strategy.hpp"
#include "workspace/artifact_manager.hpp"

using namespace sheetscape;

class ArtifactManagerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        manager = std::make_unique<ArtifactLifecycleManager>(timers, backend);
        manager->set_on_changed([this]() { ++changes; });
    }

    AnalysisRequest run(const std::string& algorithm)
    {
        AnalysisRequest r;
        r.algorithm = algorithm;
        return r;
    }

    TimerQueue                                timers;
    MockAnalysisBackend                       backend{42};
    std::unique_ptr<ArtifactLifecycleManager> manager;
    int                                       changes = 0;
};

// ─── Immediate policy ────────────────────────────────────────────────────────

TEST_F(ArtifactManagerTest, ImmediateRunInsertsAndActivates)
{
    EXPECT_TRUE(manager->request_run(run("Linear Regression")));

    ASSERT_EQ(manager->size(), 1u);
    const Artifact& a = manager->artifacts().front();
    EXPECT_EQ(a.id, "artifact-1");
    EXPECT_EQ(a.title, "Linear Regression Analysis");
    EXPECT_EQ(a.status, ArtifactStatus::Complete);
    EXPECT_FALSE(a.progress.has_value());
    EXPECT_EQ(a.plots.size(), static_cast<size_t>(MockAnalysisBackend::DEFAULT_PANELS));
    EXPECT_EQ(manager->active_id(), "artifact-1");
    EXPECT_FALSE(manager->is_processing());
    EXPECT_GT(changes, 0);
}

TEST_F(ArtifactManagerTest, NewestFirst)
{
    manager->request_run(run("Descriptive Stats"));
    manager->request_run(run("Clustering"));
    manager->request_run(run("Time Series"));

    ASSERT_EQ(manager->size(), 3u);
    EXPECT_EQ(manager->artifacts()[0].id, "artifact-3");
    EXPECT_EQ(manager->artifacts()[1].id, "artifact-2");
    EXPECT_EQ(manager->artifacts()[2].id, "artifact-1");
    EXPECT_EQ(manager->active_id(), "artifact-3");
}

TEST_F(ArtifactManagerTest, ActivateNeverReorders)
{
    manager->request_run(run("Descriptive Stats"));
    manager->request_run(run("Clustering"));
    manager->request_run(run("Time Series"));

    EXPECT_TRUE(manager->activate("artifact-1"));
    EXPECT_EQ(manager->active_id(), "artifact-1");
    EXPECT_EQ(manager->artifacts()[0].id, "artifact-3");
    EXPECT_EQ(manager->artifacts()[2].id, "artifact-1");

    EXPECT_FALSE(manager->activate("artifact-99"));
    EXPECT_EQ(manager->active_id(), "artifact-1");
}

TEST_F(ArtifactManagerTest, InactiveRanksSkipActive)
{
    manager->request_run(run("Descriptive Stats"));
    manager->request_run(run("Clustering"));
    manager->request_run(run("Time Series"));
    manager->activate("artifact-2");

    EXPECT_EQ(manager->inactive_ranks(), (std::vector<int>{0, -1, 1}));
    EXPECT_EQ(manager->inactive_rank("artifact-3"), 0);
    EXPECT_EQ(manager->inactive_rank("artifact-1"), 1);
    EXPECT_FALSE(manager->inactive_rank("artifact-2").has_value());
    EXPECT_FALSE(manager->inactive_rank("missing").has_value());
}

TEST_F(ArtifactManagerTest, InactiveRanksArePermutationForAnySize)
{
    for (int n = 1; n <= 10; ++n)
    {
        TimerQueue               q;
        ArtifactLifecycleManager m(q, backend);
        for (int i = 0; i < n; ++i)
            m.request_run(run("Clustering"));

        // Any entry may be the active one.
        for (int active = 0; active < n; ++active)
        {
            m.activate(m.artifacts()[active].id);
            std::vector<int> ranks = m.inactive_ranks();
            ASSERT_EQ(ranks.size(), static_cast<size_t>(n));
            EXPECT_EQ(ranks[active], -1);

            std::vector<int> inactive;
            for (int r : ranks)
            {
                if (r >= 0)
                    inactive.push_back(r);
            }
            std::vector<int> expected(n - 1);
            std::iota(expected.begin(), expected.end(), 0);
            EXPECT_EQ(inactive, expected) << "n=" << n << " active=" << active;
        }
    }
}

TEST_F(ArtifactManagerTest, PrependKeepsActive)
{
    manager->request_run(run("Clustering"));

    Artifact external;
    external.id    = "imported";
    external.title = "Imported";
    manager->prepend(external);

    EXPECT_EQ(manager->artifacts().front().id, "imported");
    EXPECT_EQ(manager->active_id(), "artifact-1");
}

// ─── Fixed delay ─────────────────────────────────────────────────────────────

TEST_F(ArtifactManagerTest, FixedDelayWaitsThenCompletes)
{
    manager->set_policy(ProgressStrategy::FixedDelay);
    int before = changes;

    EXPECT_TRUE(manager->request_run(run("Clustering")));
    EXPECT_TRUE(manager->is_processing());
    EXPECT_EQ(manager->size(), 0u);
    EXPECT_GT(changes, before);

    timers.advance(1.0);
    EXPECT_EQ(manager->size(), 0u);
    EXPECT_TRUE(manager->is_processing());

    timers.advance(0.5);
    ASSERT_EQ(manager->size(), 1u);
    EXPECT_FALSE(manager->is_processing());
    EXPECT_EQ(manager->active_id(), "artifact-1");
    EXPECT_DOUBLE_EQ(manager->artifacts().front().created_at, 1.5);
}

TEST_F(ArtifactManagerTest, BusyRequestsAreIgnored)
{
    manager->set_policy(ProgressStrategy::FixedDelay);
    EXPECT_TRUE(manager->request_run(run("Clustering")));
    EXPECT_FALSE(manager->request_run(run("Time Series")));

    timers.advance(2.0);
    ASSERT_EQ(manager->size(), 1u);
    EXPECT_EQ(manager->artifacts().front().category, ArtifactCategory::Clustering);

    EXPECT_TRUE(manager->request_run(run("Time Series")));
}

// ─── Streaming ───────────────────────────────────────────────────────────────

TEST_F(ArtifactManagerTest, StreamingShowsPendingEntryImmediately)
{
    manager->set_policy(ProgressStrategy::Streaming);
    manager->request_run(run("Linear Regression"));

    ASSERT_EQ(manager->size(), 1u);
    const Artifact& a = manager->artifacts().front();
    EXPECT_EQ(a.id, "artifact-1");
    EXPECT_TRUE(a.is_pending());
    EXPECT_EQ(a.title, "Linear Regression (Running...)");
    EXPECT_DOUBLE_EQ(a.progress_or_zero(), 0.0);
    EXPECT_TRUE(a.plots.empty());
    EXPECT_EQ(manager->active_id(), "artifact-1");
    EXPECT_TRUE(manager->is_processing());
    EXPECT_TRUE(manager->has_stream("artifact-1"));
}

TEST_F(ArtifactManagerTest, StreamingCompletesInPlaceAfterTenSteps)
{
    manager->set_policy(ProgressStrategy::Streaming);
    manager->request_run(run("Linear Regression"));

    double last = 0.0;
    for (int step = 1; step <= 9; ++step)
    {
        EXPECT_EQ(timers.advance(0.15), 1u);
        const Artifact& a = manager->artifacts().front();
        ASSERT_TRUE(a.is_pending()) << "step " << step;
        EXPECT_NEAR(a.progress_or_zero(), step * 0.1, 1e-9);
        EXPECT_GT(a.progress_or_zero(), last);
        last = a.progress_or_zero();
    }

    EXPECT_EQ(timers.advance(0.15), 1u);
    ASSERT_EQ(manager->size(), 1u);
    const Artifact& done = manager->artifacts().front();
    EXPECT_EQ(done.id, "artifact-1");
    EXPECT_EQ(done.status, ArtifactStatus::Complete);
    EXPECT_EQ(done.title, "Linear Regression Analysis");
    EXPECT_FALSE(done.progress.has_value());
    EXPECT_FALSE(done.plots.empty());
    EXPECT_DOUBLE_EQ(done.created_at, 0.0);
    EXPECT_FALSE(manager->is_processing());
    EXPECT_FALSE(manager->has_stream("artifact-1"));
    EXPECT_EQ(manager->active_id(), "artifact-1");

    // The stream timer is gone.
    EXPECT_EQ(timers.advance(1.0), 0u);
}

TEST_F(ArtifactManagerTest, StreamingKeepsCollectionPosition)
{
    manager->request_run(run("Descriptive Stats"));
    manager->set_policy(ProgressStrategy::Streaming);
    manager->request_run(run("Clustering"));

    timers.advance(3.0);
    ASSERT_EQ(manager->size(), 2u);
    EXPECT_EQ(manager->artifacts()[0].id, "artifact-2");
    EXPECT_EQ(manager->artifacts()[0].status, ArtifactStatus::Complete);
    EXPECT_EQ(manager->artifacts()[1].id, "artifact-1");
}

TEST_F(ArtifactManagerTest, StreamingFinishesWithinOneLongAdvance)
{
    manager->set_policy(ProgressStrategy::Streaming);
    manager->request_run(run("Linear Regression"));

    timers.advance(30.0);
    ASSERT_EQ(manager->size(), 1u);
    EXPECT_FALSE(manager->artifacts().front().is_pending());
    EXPECT_FALSE(manager->is_processing());
    EXPECT_EQ(timers.pending_count(), 0u);

    EXPECT_TRUE(manager->request_run(run("Clustering")));
    EXPECT_EQ(manager->size(), 2u);
}

TEST_F(ArtifactManagerTest, StreamingCategoryKnownWhilePending)
{
    manager->set_policy(ProgressStrategy::Streaming);
    manager->request_run(run("Time Series"));
    EXPECT_EQ(manager->artifacts().front().category, ArtifactCategory::TimeSeries);
}

TEST_F(ArtifactManagerTest, DestructionCancelsTimers)
{
    manager->set_policy(ProgressStrategy::Streaming);
    manager->request_run(run("Clustering"));
    EXPECT_EQ(timers.pending_count(), 1u);

    manager.reset();
    EXPECT_EQ(timers.pending_count(), 0u);
    EXPECT_EQ(timers.advance(5.0), 0u);
}

// ─── Two runs, every layout ──────────────────────────────────────────────────

class TwoRunLayoutTest : public ::testing::TestWithParam<VisualizationStrategy>
{
};

TEST_P(TwoRunLayoutTest, OlderArtifactBecomesRankZero)
{
    TimerQueue               timers;
    MockAnalysisBackend      backend(7);
    ArtifactLifecycleManager manager(timers, backend);

    AnalysisRequest first;
    first.algorithm = "Descriptive Stats";
    AnalysisRequest second;
    second.algorithm = "Clustering";
    manager.request_run(first);
    manager.request_run(second);

    ASSERT_EQ(manager.active_id(), "artifact-2");
    ASSERT_EQ(manager.inactive_rank("artifact-1"), 0);

    LayoutBox stage{5.0, 4.0, 10.0, 10.0};
    LayoutBox grid{-6.0, 4.0, 10.0, 10.0};
    auto      strategy = make_placement_strategy(GetParam());

    const Artifact* older  = manager.find("artifact-1");
    const Artifact* newest = manager.find("artifact-2");
    ASSERT_NE(older, nullptr);
    ASSERT_NE(newest, nullptr);

    Pose active   = strategy->pose(*newest, true, -1, stage, grid, false);
    Pose inactive = strategy->pose(*older, false, 0, stage, grid, false);
    Pose hovered  = strategy->pose(*older, false, 0, stage, grid, true);

    EXPECT_EQ(active, active_pose(stage, false));
    EXPECT_LT(inactive.opacity, 1.0f);
    EXPECT_LT(inactive.scale, 1.0f);
    EXPECT_GT(hovered.opacity, inactive.opacity);
    EXPECT_FLOAT_EQ(hovered.scale, inactive.scale * ActiveBoardMetrics::HOVER_SCALE);
    EXPECT_EQ(hovered.position, inactive.position);
}

INSTANTIATE_TEST_SUITE_P(AllLayouts,
                         TwoRunLayoutTest,
                         ::testing::Values(VisualizationStrategy::Sidebar,
                                           VisualizationStrategy::Tabs,
                                           VisualizationStrategy::Grouping,
                                           VisualizationStrategy::Gallery));
