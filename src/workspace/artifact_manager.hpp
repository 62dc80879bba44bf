#pragma once

#include <functional>
#include <optional>
#include <sheetscape/artifact.hpp>
#include <sheetscape/config.hpp>
#include <unordered_map>
#include <vector>

#include "analysis_backend.hpp"
#include "anim/timer_queue.hpp"

namespace sheetscape
{

struct LifecycleTiming
{
    double fixed_delay_sec     = 1.5;
    double stream_interval_sec = 0.15;
    double stream_step         = 0.1;
};

// Owns the ordered artifact collection and the active id, and drives the
// pending -> complete transition under the selected progress policy:
//   None        complete artifact inserted synchronously
//   FixedDelay  complete artifact inserted after fixed_delay_sec
//   Streaming   pending artifact inserted at once; progress grows by
//               stream_step every stream_interval_sec, then the entry is
//               replaced in place by its complete form (same id)
// While a creation is in flight is_processing() holds and further
// request_run() calls are ignored.
class ArtifactLifecycleManager
{
   public:
    using ChangeCallback = std::function<void()>;

    ArtifactLifecycleManager(TimerQueue& timers, AnalysisBackend& backend);
    ~ArtifactLifecycleManager();

    ArtifactLifecycleManager(const ArtifactLifecycleManager&)            = delete;
    ArtifactLifecycleManager& operator=(const ArtifactLifecycleManager&) = delete;

    void             set_policy(ProgressStrategy policy) { policy_ = policy; }
    ProgressStrategy policy() const { return policy_; }

    void                   set_timing(const LifecycleTiming& timing) { timing_ = timing; }
    const LifecycleTiming& timing() const { return timing_; }

    // Returns false when ignored because a run is already in flight.
    bool request_run(const AnalysisRequest& request = {});
    bool is_processing() const { return processing_; }

    // Inserts at the front without changing the active id.
    void prepend(Artifact artifact);

    // Never reorders the collection. False for unknown ids.
    bool activate(const ArtifactId& id);

    const std::vector<Artifact>&     artifacts() const { return artifacts_; }
    size_t                           size() const { return artifacts_.size(); }
    const Artifact*                  find(const ArtifactId& id) const;
    const Artifact*                  active() const;
    const std::optional<ArtifactId>& active_id() const { return active_id_; }

    // Index among the non-active entries in collection order; empty for the
    // active artifact and for unknown ids.
    std::optional<int> inactive_rank(const ArtifactId& id) const;

    // One entry per artifact in collection order; -1 marks the active one.
    std::vector<int> inactive_ranks() const;

    bool has_stream(const ArtifactId& id) const { return streams_.count(id) != 0; }

    void set_on_changed(ChangeCallback cb) { on_changed_ = std::move(cb); }

   private:
    ArtifactId next_id();
    Artifact*  find_mutable(const ArtifactId& id);
    void       create_complete(const AnalysisRequest& request);
    void       start_stream(const AnalysisRequest& request);
    bool       stream_tick(const ArtifactId& id, const AnalysisRequest& request, int step);
    void       notify();

    TimerQueue&      timers_;
    AnalysisBackend& backend_;

    ProgressStrategy policy_ = ProgressStrategy::None;
    LifecycleTiming  timing_;

    std::vector<Artifact>                   artifacts_;
    std::optional<ArtifactId>               active_id_;
    bool                                    processing_ = false;
    TimerId                                 delay_timer_ = INVALID_TIMER_ID;
    std::unordered_map<ArtifactId, TimerId> streams_;
    uint64_t                                next_serial_ = 1;
    ChangeCallback                          on_changed_;
};

}   // namespace sheetscape
