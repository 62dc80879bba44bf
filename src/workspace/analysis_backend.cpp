#include "analysis_backend.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <sheetscape/logger.hpp>

namespace sheetscape
{

namespace
{

struct PlotTemplate
{
    const char* title;
    PlotType    type;
};

constexpr PlotTemplate PLOT_TEMPLATES[] = {
    {"Distribution", PlotType::Bar},
    {"Residuals", PlotType::Scatter},
    {"Feature Importance", PlotType::Bar},
    {"Correlation", PlotType::Scatter},
    {"Variance", PlotType::Bar},
    {"Outliers", PlotType::Scatter},
};
constexpr int PLOT_TEMPLATE_COUNT = static_cast<int>(std::size(PLOT_TEMPLATES));

std::string format_summary(const std::vector<double>& samples)
{
    double mean = 0.0;
    for (double v : samples)
        mean += v;
    mean /= samples.empty() ? 1.0 : static_cast<double>(samples.size());

    double variance = 0.0;
    for (double v : samples)
        variance += (v - mean) * (v - mean);
    variance /= samples.empty() ? 1.0 : static_cast<double>(samples.size());

    char buf[256];
    std::snprintf(buf,
                  sizeof(buf),
                  "Analysis completed successfully.\n\nMean: %.2f\nStd Dev: %.2f\nVariance: %.2f\n\n"
                  "Found significant correlation (p < 0.05) in the selected dataset.",
                  mean,
                  std::sqrt(variance),
                  variance);
    return buf;
}

}   // namespace

const std::vector<std::string>& MockAnalysisBackend::algorithms()
{
    static const std::vector<std::string> names = {
        "Descriptive Stats",
        "Linear Regression",
        "Clustering",
        "Time Series",
    };
    return names;
}

ArtifactCategory MockAnalysisBackend::category_for(const std::string& algorithm)
{
    const auto& names = algorithms();
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (names[i] == algorithm)
            return static_cast<ArtifactCategory>(i);
    }
    return category_from_title(algorithm);
}

std::vector<double> MockAnalysisBackend::generate_samples()
{
    std::uniform_real_distribution<double> dist(0.0, 100.0);
    std::vector<double>                    samples(SAMPLES_PER_PLOT);
    for (auto& v : samples)
        v = dist(rng_);
    return samples;
}

Artifact MockAnalysisBackend::run(const AnalysisRequest& request, const ArtifactId& id)
{
    std::string algorithm = request.algorithm;
    if (algorithm.empty())
    {
        const auto&                        names = algorithms();
        std::uniform_int_distribution<int> pick(0, static_cast<int>(names.size()) - 1);
        algorithm = names[static_cast<size_t>(pick(rng_))];
    }

    int panels = std::clamp(request.panel_count.value_or(DEFAULT_PANELS), 1, MAX_PANELS);

    Artifact a;
    a.id       = id;
    a.title    = algorithm + " Analysis";
    a.status   = ArtifactStatus::Complete;
    a.category = category_for(algorithm);

    a.plots.reserve(static_cast<size_t>(panels));
    for (int i = 0; i < panels; ++i)
    {
        const PlotTemplate& tpl = PLOT_TEMPLATES[i % PLOT_TEMPLATE_COUNT];
        PlotData            plot;
        plot.id    = "plot-" + std::to_string(i + 1) + "-" + id;
        plot.title = tpl.title;
        if (i >= PLOT_TEMPLATE_COUNT)
            plot.title += " " + std::to_string(i / PLOT_TEMPLATE_COUNT + 1);
        plot.type = tpl.type;
        plot.data = generate_samples();
        a.plots.push_back(std::move(plot));
    }

    a.summary = format_summary(a.plots.front().data);

    SHEETSCAPE_LOG_DEBUG("backend", "{} produced {} plots for {}", algorithm, panels, id);
    return a;
}

}   // namespace sheetscape
