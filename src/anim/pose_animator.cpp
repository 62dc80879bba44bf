#include "pose_animator.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace sheetscape
{

static double lerp_toward(double current, double target, double t)
{
    return current + (target - current) * t;
}

Pose advance_pose(const Pose& current, const Pose& target, float dt, float rate)
{
    if (dt <= 0.0f || rate <= 0.0f)
        return current;

    float t = std::min(1.0f, rate * dt);
    if (t >= 1.0f)
        return target;

    Pose next;
    next.position = vec3_lerp(current.position, target.position, t);
    next.rotation = vec3_lerp(current.rotation, target.rotation, t);
    next.scale    = static_cast<float>(lerp_toward(current.scale, target.scale, t));
    next.opacity  = static_cast<float>(lerp_toward(current.opacity, target.opacity, t));
    next.width    = static_cast<float>(lerp_toward(current.width, target.width, t));
    next.height   = static_cast<float>(lerp_toward(current.height, target.height, t));
    return next;
}

double pose_distance(const Pose& a, const Pose& b)
{
    double d = 0.0;
    d        = std::max(d, std::fabs(a.position.x - b.position.x));
    d        = std::max(d, std::fabs(a.position.y - b.position.y));
    d        = std::max(d, std::fabs(a.position.z - b.position.z));
    d        = std::max(d, std::fabs(a.rotation.x - b.rotation.x));
    d        = std::max(d, std::fabs(a.rotation.y - b.rotation.y));
    d        = std::max(d, std::fabs(a.rotation.z - b.rotation.z));
    d        = std::max(d, static_cast<double>(std::fabs(a.scale - b.scale)));
    d        = std::max(d, static_cast<double>(std::fabs(a.opacity - b.opacity)));
    d        = std::max(d, static_cast<double>(std::fabs(a.width - b.width)));
    d        = std::max(d, static_cast<double>(std::fabs(a.height - b.height)));
    return d;
}

// ─── PoseAnimator ────────────────────────────────────────────────────────────

void PoseAnimator::set_target(const ArtifactId& id, const Pose& target)
{
    auto it = entries_.find(id);
    if (it != entries_.end())
    {
        it->second.target = target;
        return;
    }

    Pose spawn = target;
    spawn.position.z -= SPAWN_DEPTH;
    spawn.opacity = 0.0f;
    entries_.emplace(id, Entry{spawn, target});
}

void PoseAnimator::advance(float dt)
{
    for (auto& [id, entry] : entries_)
        entry.current = advance_pose(entry.current, entry.target, dt, rate_);
}

void PoseAnimator::retain(const std::vector<ArtifactId>& ids)
{
    std::unordered_set<ArtifactId> keep(ids.begin(), ids.end());
    std::erase_if(entries_, [&](const auto& kv) { return keep.count(kv.first) == 0; });
}

bool PoseAnimator::remove(const ArtifactId& id)
{
    return entries_.erase(id) > 0;
}

void PoseAnimator::snap_all()
{
    for (auto& [id, entry] : entries_)
        entry.current = entry.target;
}

bool PoseAnimator::is_settled(double epsilon) const
{
    for (const auto& [id, entry] : entries_)
    {
        if (pose_distance(entry.current, entry.target) >= epsilon)
            return false;
    }
    return true;
}

const Pose* PoseAnimator::current(const ArtifactId& id) const
{
    auto it = entries_.find(id);
    return it != entries_.end() ? &it->second.current : nullptr;
}

const Pose* PoseAnimator::target(const ArtifactId& id) const
{
    auto it = entries_.find(id);
    return it != entries_.end() ? &it->second.target : nullptr;
}

}   // namespace sheetscape
