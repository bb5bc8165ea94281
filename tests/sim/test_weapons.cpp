/**
 * @file test_weapons.cpp
 * @brief Unit tests for broadside batteries and torpedo bays.
 */

#include <catch2/catch_test_macros.hpp>

#include "broadside/ecs/systems/weapon_system.hpp"
#include "broadside/math/vec2.hpp"
#include "helpers/test_utils.hpp"

#include <algorithm>
#include <random>
#include <set>

using namespace broadside;
using namespace broadside::ecs;
using namespace test_helpers;

namespace {

/// Battery with every mount loaded and known reload times.
WeaponBattery loaded_battery(int pairs) {
    std::mt19937 rng{seeds::DEFAULT_TEST_SEED};
    WeaponBattery battery = WeaponSystem::make_battery(Hull{120.0f, 44.0f}, pairs, rng);
    for (auto& mount : battery.mounts) {
        mount.cooldown = 0.0f;
        mount.reload_time = 3.0f;
    }
    return battery;
}

} // namespace

// =============================================================================
// Layout
// =============================================================================

TEST_CASE("Weapons: battery layout spreads mounts along both beams", "[weapons]") {
    std::mt19937 rng{seeds::DEFAULT_TEST_SEED};
    const Hull hull{140.0f, 48.0f};
    const WeaponBattery battery = WeaponSystem::make_battery(hull, 4, rng);

    REQUIRE(battery.mounts.size() == 8);
    REQUIRE(battery.port.mounts.size() == 4);
    REQUIRE(battery.starboard.mounts.size() == 4);

    const float margin = 140.0f * 0.18f;
    for (std::size_t i : battery.starboard.mounts) {
        const auto& m = battery.mounts[i];
        REQUIRE(m.side == Side::Starboard);
        REQUIRE(approx_equal(m.offset.y, 24.0f));
        REQUIRE(m.offset.x >= -70.0f + margin - 1e-3f);
        REQUIRE(m.offset.x <= 70.0f - margin + 1e-3f);
        REQUIRE(m.reload_time >= 2.2f);
        REQUIRE(m.reload_time <= 3.6f);
        REQUIRE(m.cooldown == 0.0f);
    }

    for (std::size_t k = 0; k < 4; ++k) {
        const auto& star = battery.mounts[battery.starboard.mounts[k]];
        const auto& port = battery.mounts[battery.port.mounts[k]];
        REQUIRE(port.side == Side::Port);
        REQUIRE(approx_equal(port.offset.y, -24.0f));
        REQUIRE(approx_equal(port.offset.x, star.offset.x));
        const float skew = port.reload_time / star.reload_time;
        REQUIRE(skew >= 0.9f - 1e-4f);
        REQUIRE(skew <= 1.1f + 1e-4f);
    }
}

TEST_CASE("Weapons: zero pairs gives an empty battery", "[weapons]") {
    std::mt19937 rng{seeds::DEFAULT_TEST_SEED};
    WeaponBattery battery = WeaponSystem::make_battery(Hull{}, 0, rng);

    REQUIRE(battery.mounts.empty());
    REQUIRE_FALSE(WeaponSystem::try_fire_side(battery, Side::Port).has_value());
}

TEST_CASE("Weapons: outward normals point off the beams", "[weapons]") {
    REQUIRE(approx_equal_vec(WeaponSystem::outward_normal(0.0f, Side::Starboard), Vector2{0.0f, 1.0f}, 1e-5f));
    REQUIRE(approx_equal_vec(WeaponSystem::outward_normal(0.0f, Side::Port), Vector2{0.0f, -1.0f}, 1e-5f));
    REQUIRE(approx_equal_vec(WeaponSystem::outward_normal(math::kHalfPi, Side::Starboard), Vector2{-1.0f, 0.0f}, 1e-5f));
}

// =============================================================================
// Firing order
// =============================================================================

TEST_CASE("Weapons: round-robin fires every mount once before repeating", "[weapons]") {
    WeaponBattery battery = loaded_battery(4);
    std::set<std::size_t> fired;

    for (int shot = 0; shot < 4; ++shot) {
        auto index = WeaponSystem::try_fire_side(battery, Side::Starboard);
        REQUIRE(index.has_value());
        REQUIRE(fired.insert(*index).second);
        WeaponSystem::tick_cooldowns(battery, battery.inter_shot_delay);
    }

    REQUIRE(fired.size() == 4);
    // Nothing reloaded yet
    REQUIRE_FALSE(WeaponSystem::try_fire_side(battery, Side::Starboard).has_value());
}

TEST_CASE("Weapons: round-robin resumes after the last mount that fired", "[weapons]") {
    WeaponBattery battery = loaded_battery(3);
    const auto& order = battery.starboard.mounts;

    auto first = WeaponSystem::try_fire_side(battery, Side::Starboard);
    REQUIRE(first == order[0]);

    // Second mount still loading; the scan skips it.
    battery.mounts[order[1]].cooldown = 1.0f;
    WeaponSystem::tick_cooldowns(battery, battery.inter_shot_delay);

    auto second = WeaponSystem::try_fire_side(battery, Side::Starboard);
    REQUIRE(second == order[2]);
    REQUIRE(battery.starboard.cursor == 0);
}

TEST_CASE("Weapons: one side waits the inter-shot delay", "[weapons]") {
    WeaponBattery battery = loaded_battery(3);

    REQUIRE(WeaponSystem::try_fire_side(battery, Side::Port).has_value());
    REQUIRE_FALSE(WeaponSystem::try_fire_side(battery, Side::Port).has_value());

    // The other side is independent
    REQUIRE(WeaponSystem::try_fire_side(battery, Side::Starboard).has_value());

    WeaponSystem::tick_cooldowns(battery, 0.05f);
    REQUIRE_FALSE(WeaponSystem::try_fire_side(battery, Side::Port).has_value());

    WeaponSystem::tick_cooldowns(battery, 0.05f);
    REQUIRE(WeaponSystem::try_fire_side(battery, Side::Port).has_value());
}

TEST_CASE("Weapons: fired mount reloads over its own duration", "[weapons]") {
    WeaponBattery battery = loaded_battery(1);

    auto index = WeaponSystem::try_fire_side(battery, Side::Starboard);
    REQUIRE(index.has_value());
    REQUIRE(approx_equal(battery.mounts[*index].cooldown, 3.0f));

    WeaponSystem::tick_cooldowns(battery, 2.0f);
    REQUIRE(approx_equal(battery.mounts[*index].cooldown, 1.0f));
    REQUIRE_FALSE(WeaponSystem::try_fire_side(battery, Side::Starboard).has_value());

    WeaponSystem::tick_cooldowns(battery, 5.0f);
    REQUIRE(battery.mounts[*index].cooldown == 0.0f);
    REQUIRE(WeaponSystem::try_fire_side(battery, Side::Starboard) == index);
}

// =============================================================================
// System pass
// =============================================================================

TEST_CASE("Weapons: a held trigger fires at most one shot per side per tick", "[weapons]") {
    entt::registry registry;
    WeaponSystem weapons{seeds::DEFAULT_TEST_SEED};

    auto vessel = make_vessel(registry, {0.0f, 0.0f});
    registry.get<Helm>(vessel).intent.fire = true;

    weapons.update(registry, 0.016f);
    auto shots = weapons.drain_fired();
    REQUIRE(shots.size() == 2);
    REQUIRE(weapons.drain_fired().empty());

    // Pacing: the next tick is inside the inter-shot delay
    weapons.update(registry, 0.016f);
    REQUIRE(weapons.drain_fired().empty());

    weapons.update(registry, 0.08f);
    REQUIRE(weapons.drain_fired().size() == 2);
}

TEST_CASE("Weapons: shots leave the beam at muzzle speed plus ship velocity", "[weapons]") {
    entt::registry registry;
    WeaponSystem weapons{seeds::DEFAULT_TEST_SEED};

    auto vessel = make_vessel(registry, {100.0f, 200.0f});
    set_velocity(registry, vessel, {50.0f, 0.0f});
    registry.get<Helm>(vessel).intent.fire = true;

    weapons.update(registry, 0.0f);
    const auto shots = weapons.drain_fired();
    REQUIRE(shots.size() == 2);

    for (const auto& shot : shots) {
        REQUIRE(shot.owner == vessel);
        REQUIRE(approx_equal_vec(shot.origin, shot.position));
        REQUIRE(approx_equal(std::abs(shot.position.y - 200.0f), 22.0f, 1e-3f));

        const Vector2 relative = math::sub(shot.velocity, Vector2{50.0f, 0.0f});
        REQUIRE(approx_equal(math::length(relative), 380.0f, 1e-2f));

        const Side side = shot.position.y > 200.0f ? Side::Starboard : Side::Port;
        const float off_axis = math::angle_between(math::angle_of(WeaponSystem::outward_normal(0.0f, side)),
                                                   math::angle_of(relative));
        REQUIRE(std::abs(off_axis) <= 0.02f + 1e-5f);
    }
}

TEST_CASE("Weapons: sinking vessels hold fire but keep reloading", "[weapons]") {
    entt::registry registry;
    WeaponSystem weapons{seeds::DEFAULT_TEST_SEED};

    auto vessel = make_vessel(registry, {0.0f, 0.0f});
    registry.get<Helm>(vessel).intent.fire = true;
    registry.get<Sinking>(vessel).active = true;

    auto& battery = registry.get<WeaponBattery>(vessel);
    battery.mounts[0].cooldown = 1.0f;

    weapons.update(registry, 0.25f);

    REQUIRE(weapons.drain_fired().empty());
    REQUIRE(approx_equal(battery.mounts[0].cooldown, 0.75f));
}

// =============================================================================
// Torpedoes
// =============================================================================

TEST_CASE("Weapons: torpedo arms, launches from the bow, then reloads", "[weapons]") {
    entt::registry registry;
    WeaponSystem weapons{seeds::DEFAULT_TEST_SEED};

    auto vessel = make_vessel(registry, {0.0f, 0.0f});
    registry.emplace<TorpedoBay>(vessel, WeaponSystem::make_torpedo_bay(1));
    auto& helm = registry.get<Helm>(vessel);

    helm.intent.launch_torpedo = true;
    weapons.update(registry, 0.016f);
    helm.intent.launch_torpedo = false;

    auto& tube = registry.get<TorpedoBay>(vessel).tubes[0];
    REQUIRE(approx_equal(tube.arming, 1.0f));
    REQUIRE(weapons.drain_fired().empty());

    weapons.update(registry, 0.5f);
    REQUIRE(weapons.drain_fired().empty());

    weapons.update(registry, 0.5f);
    const auto shots = weapons.drain_fired();
    REQUIRE(shots.size() == 1);

    const auto& torpedo = shots.front();
    REQUIRE(torpedo.profile.kind == DamageProfile::Kind::Heavy);
    REQUIRE(approx_equal_vec(torpedo.position, Vector2{120.0f * 0.55f, 0.0f}, 1e-3f));
    REQUIRE(approx_equal_vec(torpedo.velocity, Vector2{120.0f, 0.0f}, 1e-3f));
    REQUIRE(approx_equal(tube.cooldown, 15.0f));

    // Reloading: a new request does not arm the tube
    helm.intent.launch_torpedo = true;
    weapons.update(registry, 0.016f);
    REQUIRE(tube.arming == 0.0f);
}

TEST_CASE("Weapons: sinking vessels do not launch an armed torpedo", "[weapons]") {
    entt::registry registry;
    WeaponSystem weapons{seeds::DEFAULT_TEST_SEED};

    auto vessel = make_vessel(registry, {0.0f, 0.0f});
    auto& bay = registry.emplace<TorpedoBay>(vessel, WeaponSystem::make_torpedo_bay(1));
    bay.tubes[0].arming = 0.5f;
    registry.get<Sinking>(vessel).active = true;

    weapons.update(registry, 1.0f);

    REQUIRE(weapons.drain_fired().empty());
    REQUIRE(registry.get<TorpedoBay>(vessel).tubes[0].idle());
}
