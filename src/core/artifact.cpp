#include <algorithm>
#include <cctype>
#include <sheetscape/artifact.hpp>

namespace sheetscape
{

const char* plot_type_name(PlotType type)
{
    switch (type)
    {
        case PlotType::Bar:
            return "bar";
        case PlotType::Scatter:
            return "scatter";
    }
    return "bar";
}

const char* category_name(ArtifactCategory category)
{
    switch (category)
    {
        case ArtifactCategory::Descriptive:
            return "descriptive";
        case ArtifactCategory::Regression:
            return "regression";
        case ArtifactCategory::Clustering:
            return "clustering";
        case ArtifactCategory::TimeSeries:
            return "time-series";
        case ArtifactCategory::Uncategorized:
            return "uncategorized";
    }
    return "uncategorized";
}

ArtifactCategory category_from_title(std::string_view title)
{
    std::string lower(title);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.find("descriptive") != std::string::npos)
        return ArtifactCategory::Descriptive;
    if (lower.find("linear") != std::string::npos)
        return ArtifactCategory::Regression;
    if (lower.find("cluster") != std::string::npos)
        return ArtifactCategory::Clustering;
    if (lower.find("time") != std::string::npos)
        return ArtifactCategory::TimeSeries;
    return ArtifactCategory::Uncategorized;
}

int category_bucket(const Artifact& artifact, int inactive_rank)
{
    ArtifactCategory category = artifact.category;
    if (category == ArtifactCategory::Uncategorized)
        category = category_from_title(artifact.title);

    if (category != ArtifactCategory::Uncategorized)
        return static_cast<int>(category);

    // Unmatched titles spread across the buckets by rank.
    int rank = std::max(inactive_rank, 0);
    return rank % ARTIFACT_CATEGORY_BUCKETS;
}

double plot_max_or_one(const PlotData& plot)
{
    double max_value = 1.0;
    for (double v : plot.data)
        max_value = std::max(max_value, v);
    return max_value;
}

}   // namespace sheetscape
