#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sheetscape
{

using ArtifactId = std::string;

enum class PlotType
{
    Bar,
    Scatter,
};

struct PlotData
{
    std::string         id;
    std::string         title;
    PlotType            type = PlotType::Bar;
    std::vector<double> data;
};

enum class ArtifactStatus
{
    Pending,
    Complete,
};

enum class ArtifactCategory
{
    Descriptive,
    Regression,
    Clustering,
    TimeSeries,
    Uncategorized,
};

inline constexpr int ARTIFACT_CATEGORY_BUCKETS = 4;

// One analysis result. Owned by ArtifactLifecycleManager; everyone else reads.
struct Artifact
{
    ArtifactId            id;
    std::string           title;
    std::string           summary;
    std::vector<PlotData> plots;
    ArtifactStatus        status = ArtifactStatus::Complete;
    std::optional<double> progress;   // only while pending
    double                created_at = 0.0;
    ArtifactCategory      category   = ArtifactCategory::Uncategorized;

    bool   is_pending() const { return status == ArtifactStatus::Pending; }
    double progress_or_zero() const { return progress.value_or(0.0); }
};

const char* plot_type_name(PlotType type);
const char* category_name(ArtifactCategory category);

// Legacy classification from free-text titles: case-insensitive match of
// "descriptive", "linear", "cluster", "time". Uncategorized when none match.
ArtifactCategory category_from_title(std::string_view title);

// Bucket used by the grouping layout: explicit category first, then the
// title, then rank modulo the bucket count.
int category_bucket(const Artifact& artifact, int inactive_rank);

// Largest sample, or 1 when the set is empty or every sample is below 1.
double plot_max_or_one(const PlotData& plot);

}   // namespace sheetscape
