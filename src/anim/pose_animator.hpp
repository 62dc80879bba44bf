#pragma once

#include <sheetscape/artifact.hpp>
#include <sheetscape/pose.hpp>
#include <unordered_map>
#include <vector>

namespace sheetscape
{

// Arena of (current, target) pose pairs keyed by artifact id. Targets are
// replaced wholesale every placement pass; advance() converges every entry
// with advance_pose().
class PoseAnimator
{
   public:
    static constexpr float  DEFAULT_RATE = 6.0f;
    static constexpr double SPAWN_DEPTH  = 10.0;

    explicit PoseAnimator(float rate = DEFAULT_RATE) : rate_(rate) {}

    void  set_rate(float rate) { rate_ = rate; }
    float rate() const { return rate_; }

    // Unknown ids spawn SPAWN_DEPTH behind the target, fully transparent.
    void set_target(const ArtifactId& id, const Pose& target);

    void advance(float dt);

    // Drops every entry whose id is not listed.
    void retain(const std::vector<ArtifactId>& ids);
    bool remove(const ArtifactId& id);
    void clear() { entries_.clear(); }

    // Jumps every entry to its target.
    void snap_all();

    bool is_settled(double epsilon = 1e-3) const;

    const Pose* current(const ArtifactId& id) const;
    const Pose* target(const ArtifactId& id) const;
    bool        contains(const ArtifactId& id) const { return entries_.count(id) != 0; }
    size_t      size() const { return entries_.size(); }

   private:
    struct Entry
    {
        Pose current;
        Pose target;
    };

    std::unordered_map<ArtifactId, Entry> entries_;
    float                                 rate_;
};

}   // namespace sheetscape
