#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <sheetscape/artifact.hpp>
#include <string>
#include <vector>

namespace sheetscape
{

struct AnalysisRequest
{
    std::string        algorithm;   // empty = backend picks one
    std::optional<int> panel_count;
};

// Produces the finished form of an artifact. The lifecycle manager owns the
// id and timestamps; implementations only fill the payload.
class AnalysisBackend
{
   public:
    virtual ~AnalysisBackend() = default;

    virtual Artifact run(const AnalysisRequest& request, const ArtifactId& id) = 0;
};

// Synthetic results: uniform samples in [0, 100) and a summary whose figures
// are computed from the first plot.
class MockAnalysisBackend : public AnalysisBackend
{
   public:
    static constexpr int DEFAULT_PANELS   = 6;
    static constexpr int MAX_PANELS       = 12;
    static constexpr int SAMPLES_PER_PLOT = 10;

    explicit MockAnalysisBackend(uint32_t seed = 42) : rng_(seed) {}

    Artifact run(const AnalysisRequest& request, const ArtifactId& id) override;

    // Names offered by the control surface and the context menu.
    static const std::vector<std::string>& algorithms();

    static ArtifactCategory category_for(const std::string& algorithm);

   private:
    std::vector<double> generate_samples();

    std::mt19937 rng_;
};

}   // namespace sheetscape
