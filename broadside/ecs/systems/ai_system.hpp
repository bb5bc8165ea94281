#pragma once

// =============================================================================
// AI System - drives every AiAgent through its Helmsman
// =============================================================================
//
// Builds a snapshot of all vessels still afloat, then asks the helmsman for a
// control intent per autonomous vessel and writes it into the vessel's Helm.
// Sinking vessels get an empty intent. Does NOT move anything - see
// KinematicsSystem.
//
// Usage:
//   AISystem ai{seed};
//   ai.set_world_bounds(bounds);
//   ai.update(registry, dt);     // before kinematics
//

#include "../system.hpp"
#include "../components/naval.hpp"
#include "broadside/ai/helmsman.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace broadside::ecs {

class AISystem : public System {
public:
    AISystem() = default;
    explicit AISystem(std::uint32_t seed) : helmsman_(seed) {}

    void set_world_bounds(const WorldBounds& bounds) { bounds_ = bounds; }

    void update(entt::registry& registry, float dt) override;

    /// Snapshot of a vessel, or nothing if it is gone or already going down.
    static std::optional<ai::VesselSnapshot> snapshot_of(const entt::registry& registry, entt::entity entity);

private:
    void collect_snapshots(const entt::registry& registry);

    ai::Helmsman helmsman_{};
    WorldBounds bounds_{};
    std::vector<ai::VesselSnapshot> snapshots_;
};

} // namespace broadside::ecs
