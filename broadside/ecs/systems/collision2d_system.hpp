#pragma once

// =============================================================================
// Collision2D System - hull contacts, ramming and projectile hits
// =============================================================================
//
// Vessel pass (run twice per update):
//   circle-circle overlap on collision radii, mass-weighted positional
//   correction, restitution impulse with clamped friction and a small angular
//   kick, then ramming damage throttled per pair by a cooldown.
//
// Projectile pass:
//   every live projectile against every hull polygon except its owner's.
//   The first hull hit takes the projectile's current damage and the
//   projectile is tagged DeadTag.
//
// Fully sunk hulls take no part. Sinking hulls still collide and can be hit.
//
// Usage:
//   Collision2DSystem collision;
//   collision.update(registry, dt);
//   for (const auto& hit : collision.hits()) { ... }
//   for (const auto& ram : collision.ram_events()) { ... }
//

#include "../system.hpp"
#include "../components/naval.hpp"

#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

namespace broadside::ecs {

struct CollisionTuning {
    float restitution{0.2f};
    float friction{0.08f};          // tangential impulse cap, fraction of normal
    float angular_kick{0.0008f};    // rad/s per px/s of tangential slip
    float ram_cooldown{4.0f};       // seconds per pair
    float bow_threshold{0.7f};      // forward . normal for a bow strike
    float min_ram_damage{20.0f};
    float ram_share{0.67f};         // fraction of relative speed for the struck hull
    float glancing_share{0.25f};
    int iterations{2};
    bool debug{false};
};

struct ProjectileHit {
    entt::entity owner{entt::null};
    entt::entity hull{entt::null};
    float damage{0.0f};
    bool lethal{false};
    DamageProfile::Kind kind{DamageProfile::Kind::Standard};
    Vector2 position{0.0f, 0.0f};
};

struct RamEvent {
    entt::entity a{entt::null};
    entt::entity b{entt::null};
    float damage_a{0.0f};
    float damage_b{0.0f};
    float relative_speed{0.0f};
};

class Collision2DSystem : public System {
public:
    Collision2DSystem() = default;
    explicit Collision2DSystem(const CollisionTuning& tuning) : tuning_(tuning) {}

    void update(entt::registry& registry, float dt) override;

    /// Hits and rams from the last update
    const std::vector<ProjectileHit>& hits() const { return hits_; }
    const std::vector<RamEvent>& ram_events() const { return rams_; }

    /// Resolve one vessel pair. Arguments may come in either order.
    /// Returns true if the hulls overlapped.
    bool resolve_pair(entt::registry& registry, entt::entity first, entt::entity second);

    /// Check every live projectile against the hulls; spent ones get DeadTag.
    void resolve_projectiles(entt::registry& registry);

    /// Seconds until this pair can ram again (0 if ready).
    float ram_cooldown_remaining(entt::entity a, entt::entity b) const;

    static std::uint64_t pair_key(entt::entity a, entt::entity b);

    /// Ramming damage split for a contact: {to first, to second}.
    /// `first_bow`/`second_bow` tell whose bow points into the contact.
    static std::pair<float, float> ram_damage(const CollisionTuning& tuning, bool first_bow,
                                              bool second_bow, float relative_speed);

private:
    void decay_cooldowns(float dt);
    void collect_hulls(const entt::registry& registry);

    CollisionTuning tuning_{};
    std::unordered_map<std::uint64_t, float> ram_cooldowns_;
    std::vector<entt::entity> hulls_;
    std::vector<ProjectileHit> hits_;
    std::vector<RamEvent> rams_;
};

} // namespace broadside::ecs
