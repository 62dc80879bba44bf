#include "artifact_manager.hpp"

#include <algorithm>
#include <sheetscape/logger.hpp>

namespace sheetscape
{

ArtifactLifecycleManager::ArtifactLifecycleManager(TimerQueue& timers, AnalysisBackend& backend)
    : timers_(timers), backend_(backend)
{
}

ArtifactLifecycleManager::~ArtifactLifecycleManager()
{
    // Pending callbacks capture this.
    if (delay_timer_ != INVALID_TIMER_ID)
        timers_.cancel(delay_timer_);
    for (const auto& [id, timer] : streams_)
        timers_.cancel(timer);
}

ArtifactId ArtifactLifecycleManager::next_id()
{
    return "artifact-" + std::to_string(next_serial_++);
}

void ArtifactLifecycleManager::notify()
{
    if (on_changed_)
        on_changed_();
}

// ─── Collection ──────────────────────────────────────────────────────────────

void ArtifactLifecycleManager::prepend(Artifact artifact)
{
    SHEETSCAPE_LOG_DEBUG("lifecycle", "prepend {}", artifact.id);
    artifacts_.insert(artifacts_.begin(), std::move(artifact));
    notify();
}

bool ArtifactLifecycleManager::activate(const ArtifactId& id)
{
    if (!find(id))
        return false;
    if (active_id_ && *active_id_ == id)
        return true;

    active_id_ = id;
    SHEETSCAPE_LOG_DEBUG("lifecycle", "activate {}", id);
    notify();
    return true;
}

const Artifact* ArtifactLifecycleManager::find(const ArtifactId& id) const
{
    auto it = std::find_if(
        artifacts_.begin(), artifacts_.end(), [&](const Artifact& a) { return a.id == id; });
    return it != artifacts_.end() ? &*it : nullptr;
}

Artifact* ArtifactLifecycleManager::find_mutable(const ArtifactId& id)
{
    auto it = std::find_if(
        artifacts_.begin(), artifacts_.end(), [&](const Artifact& a) { return a.id == id; });
    return it != artifacts_.end() ? &*it : nullptr;
}

const Artifact* ArtifactLifecycleManager::active() const
{
    return active_id_ ? find(*active_id_) : nullptr;
}

std::optional<int> ArtifactLifecycleManager::inactive_rank(const ArtifactId& id) const
{
    if (active_id_ && *active_id_ == id)
        return std::nullopt;

    int rank = 0;
    for (const auto& a : artifacts_)
    {
        if (active_id_ && a.id == *active_id_)
            continue;
        if (a.id == id)
            return rank;
        ++rank;
    }
    return std::nullopt;
}

std::vector<int> ArtifactLifecycleManager::inactive_ranks() const
{
    std::vector<int> ranks;
    ranks.reserve(artifacts_.size());
    int next = 0;
    for (const auto& a : artifacts_)
    {
        if (active_id_ && a.id == *active_id_)
            ranks.push_back(-1);
        else
            ranks.push_back(next++);
    }
    return ranks;
}

// ─── Runs ────────────────────────────────────────────────────────────────────

bool ArtifactLifecycleManager::request_run(const AnalysisRequest& request)
{
    if (processing_)
    {
        SHEETSCAPE_LOG_DEBUG("lifecycle", "run '{}' ignored: busy", request.algorithm);
        return false;
    }

    processing_ = true;
    SHEETSCAPE_LOG_INFO("lifecycle",
                        "run '{}' ({})",
                        request.algorithm.empty() ? std::string("auto") : request.algorithm,
                        to_string(policy_));

    switch (policy_)
    {
        case ProgressStrategy::None:
            create_complete(request);
            break;
        case ProgressStrategy::FixedDelay:
            delay_timer_ = timers_.schedule_once(timing_.fixed_delay_sec,
                                                 [this, request]()
                                                 {
                                                     delay_timer_ = INVALID_TIMER_ID;
                                                     create_complete(request);
                                                 });
            notify();
            break;
        case ProgressStrategy::Streaming:
            start_stream(request);
            break;
    }
    return true;
}

void ArtifactLifecycleManager::create_complete(const AnalysisRequest& request)
{
    ArtifactId id       = next_id();
    Artifact   artifact = backend_.run(request, id);
    artifact.id         = id;
    artifact.status     = ArtifactStatus::Complete;
    artifact.progress.reset();
    artifact.created_at = timers_.now();

    SHEETSCAPE_LOG_INFO("lifecycle", "{} complete: {}", id, artifact.title);

    processing_ = false;
    prepend(std::move(artifact));
    activate(id);
}

void ArtifactLifecycleManager::start_stream(const AnalysisRequest& request)
{
    Artifact pending;
    pending.id         = next_id();
    pending.title      = (request.algorithm.empty() ? std::string("Analysis") : request.algorithm)
                    + " (Running...)";
    pending.status     = ArtifactStatus::Pending;
    pending.progress   = 0.0;
    pending.created_at = timers_.now();
    if (!request.algorithm.empty())
        pending.category = MockAnalysisBackend::category_for(request.algorithm);

    ArtifactId id = pending.id;
    prepend(std::move(pending));
    activate(id);

    int     step  = 0;
    TimerId timer = timers_.schedule_repeating(timing_.stream_interval_sec,
                                               [this, id, request, step]() mutable
                                               { return stream_tick(id, request, ++step); });
    streams_[id]  = timer;
}

bool ArtifactLifecycleManager::stream_tick(const ArtifactId&      id,
                                           const AnalysisRequest& request,
                                           int                    step)
{
    Artifact* entry = find_mutable(id);
    if (!entry)
    {
        streams_.erase(id);
        processing_ = false;
        return false;
    }

    // Progress is derived from the step count so it cannot drift below 1
    // after the final step.
    double progress = std::min(1.0, step * timing_.stream_step);
    if (progress < 1.0 - 1e-9)
    {
        entry->progress = std::max(entry->progress_or_zero(), progress);
        notify();
        return true;
    }

    entry->progress = 1.0;
    notify();

    Artifact done = backend_.run(request, id);
    entry         = find_mutable(id);
    if (entry)
    {
        done.id         = id;
        done.status     = ArtifactStatus::Complete;
        done.created_at = entry->created_at;
        done.progress.reset();
        *entry = std::move(done);
        SHEETSCAPE_LOG_INFO("lifecycle", "{} complete: {}", id, entry->title);
    }

    streams_.erase(id);
    processing_ = false;
    notify();
    return false;
}

}   // namespace sheetscape
