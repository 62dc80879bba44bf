#include <gtest/gtest.h>

#include "workspace/analysis_backend.hpp"

using namespace sheetscape;

TEST(MockAnalysisBackend, DefaultRun)
{
    MockAnalysisBackend backend(42);
    AnalysisRequest     req;
    req.algorithm = "Clustering";

    Artifact a = backend.run(req, "artifact-7");
    EXPECT_EQ(a.id, "artifact-7");
    EXPECT_EQ(a.title, "Clustering Analysis");
    EXPECT_EQ(a.category, ArtifactCategory::Clustering);
    EXPECT_EQ(a.status, ArtifactStatus::Complete);
    ASSERT_EQ(a.plots.size(), static_cast<size_t>(MockAnalysisBackend::DEFAULT_PANELS));

    EXPECT_EQ(a.plots[0].id, "plot-1-artifact-7");
    EXPECT_EQ(a.plots[0].title, "Distribution");
    EXPECT_EQ(a.plots[0].type, PlotType::Bar);
    EXPECT_EQ(a.plots[1].type, PlotType::Scatter);
    EXPECT_NE(a.summary.find("Mean: "), std::string::npos);
    EXPECT_NE(a.summary.find("Std Dev: "), std::string::npos);
}

TEST(MockAnalysisBackend, SamplesInRange)
{
    MockAnalysisBackend backend(3);
    Artifact            a = backend.run({}, "artifact-1");
    for (const auto& plot : a.plots)
    {
        ASSERT_EQ(plot.data.size(), static_cast<size_t>(MockAnalysisBackend::SAMPLES_PER_PLOT));
        for (double v : plot.data)
        {
            EXPECT_GE(v, 0.0);
            EXPECT_LT(v, 100.0);
        }
    }
}

TEST(MockAnalysisBackend, PanelCountClamped)
{
    MockAnalysisBackend backend;
    AnalysisRequest     req;
    req.algorithm = "Time Series";

    req.panel_count = 0;
    EXPECT_EQ(backend.run(req, "a").plots.size(), 1u);

    req.panel_count = 50;
    Artifact big    = backend.run(req, "b");
    ASSERT_EQ(big.plots.size(), static_cast<size_t>(MockAnalysisBackend::MAX_PANELS));
    EXPECT_EQ(big.plots[6].title, "Distribution 2");
    EXPECT_EQ(big.plots[11].title, "Outliers 2");
}

TEST(MockAnalysisBackend, SameSeedSameResults)
{
    MockAnalysisBackend a(99);
    MockAnalysisBackend b(99);
    Artifact            ra = a.run({}, "x");
    Artifact            rb = b.run({}, "x");
    EXPECT_EQ(ra.title, rb.title);
    EXPECT_EQ(ra.plots[0].data, rb.plots[0].data);
    EXPECT_EQ(ra.summary, rb.summary);
}

TEST(MockAnalysisBackend, EmptyAlgorithmPicksKnownName)
{
    MockAnalysisBackend backend(5);
    Artifact            a = backend.run({}, "x");

    bool known = false;
    for (const auto& name : MockAnalysisBackend::algorithms())
        known |= (a.title == name + " Analysis");
    EXPECT_TRUE(known);
    EXPECT_NE(a.category, ArtifactCategory::Uncategorized);
}

TEST(MockAnalysisBackend, CategoryFor)
{
    EXPECT_EQ(MockAnalysisBackend::category_for("Descriptive Stats"), ArtifactCategory::Descriptive);
    EXPECT_EQ(MockAnalysisBackend::category_for("Linear Regression"), ArtifactCategory::Regression);
    EXPECT_EQ(MockAnalysisBackend::category_for("Hierarchical clustering"), ArtifactCategory::Clustering);
    EXPECT_EQ(MockAnalysisBackend::category_for("PCA"), ArtifactCategory::Uncategorized);
}

TEST(PlotData, MaxOrOne)
{
    PlotData p;
    EXPECT_DOUBLE_EQ(plot_max_or_one(p), 1.0);
    p.data = {0.2, 0.5};
    EXPECT_DOUBLE_EQ(plot_max_or_one(p), 1.0);
    p.data = {3.0, 7.0, -2.0};
    EXPECT_DOUBLE_EQ(plot_max_or_one(p), 7.0);
}
