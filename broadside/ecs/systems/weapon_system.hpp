#pragma once

// =============================================================================
// Weapon System - broadside batteries and torpedo bays
// =============================================================================
//
// Each broadside fires at most one mount per tick, walking its mounts in
// round-robin order and waiting inter_shot_delay between shots, so a held
// trigger produces a rippling broadside rather than one volley.
// Fired projectiles are appended to an internal sink; the caller drains it
// after the pass and creates the entities.
//
// Usage:
//   WeaponSystem weapons;
//   weapons.update(registry, dt);
//   for (auto& shot : weapons.drain_fired()) { ... }
//

#include "../system.hpp"
#include "../components/naval.hpp"

#include <optional>
#include <random>
#include <vector>

namespace broadside::ecs {

class WeaponSystem : public System {
public:
    WeaponSystem() = default;
    explicit WeaponSystem(std::uint32_t seed) : rng_(seed) {}

    void update(entt::registry& registry, float dt) override;

    /// Projectiles fired since the last drain.
    std::vector<Projectile> drain_fired();

    /// `pairs` mounts per side spread along the hull, reload randomized per mount.
    static WeaponBattery make_battery(const Hull& hull, int pairs, std::mt19937& rng);

    static void tick_cooldowns(WeaponBattery& battery, float dt);

    /// Fire the next ready mount on `side`. Returns its index, or nullopt if
    /// the side is pacing or nothing is loaded.
    static std::optional<std::size_t> try_fire_side(WeaponBattery& battery, Side side);

    /// Unit vector pointing out of `side` for a hull at `heading`.
    static Vector2 outward_normal(float heading, Side side);

    static TorpedoBay make_torpedo_bay(int tubes);

private:
    Projectile make_shot(const WeaponBattery& battery, const WeaponMount& mount,
                         const Transform2D& transform, const Velocity2D& velocity,
                         entt::entity owner);

    void update_torpedo_bays(entt::registry& registry, float dt);

    std::mt19937 rng_{std::random_device{}()};
    std::vector<Projectile> fired_;
};

} // namespace broadside::ecs
