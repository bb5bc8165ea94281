/**
 * @file test_collision.cpp
 * @brief Unit tests for hull contacts, ramming and projectile hits.
 */

#include <catch2/catch_test_macros.hpp>

#include "broadside/ai/helmsman.hpp"
#include "broadside/ecs/systems/collision2d_system.hpp"
#include "broadside/ecs/systems/projectile_system.hpp"
#include "broadside/math/vec2.hpp"
#include "helpers/test_utils.hpp"

using namespace broadside;
using namespace broadside::ecs;
using namespace test_helpers;

namespace {

void set_health(entt::registry& registry, entt::entity vessel, float value) {
    auto& health = registry.get<Health>(vessel);
    health.current = value;
    health.max = value;
}

/// Two 120x44 hulls, 80 px apart on the x axis (radii sum is 82).
struct Pair {
    entt::registry registry;
    entt::entity a{entt::null};
    entt::entity b{entt::null};

    Pair(float heading_a, float heading_b) {
        a = make_vessel(registry, {0.0f, 0.0f}, heading_a);
        b = make_vessel(registry, {80.0f, 0.0f}, heading_b);
    }
};

entt::entity spawn_shot(entt::registry& registry, Vector2 position, entt::entity owner) {
    auto entity = registry.create();
    registry.emplace<Projectile>(entity, ProjectileSystem::make_cannonball(position, {0.0f, 0.0f}, owner));
    return entity;
}

} // namespace

// =============================================================================
// Ship-ship contact
// =============================================================================

TEST_CASE("Collision: bow strike at 200 px/s splits 134 / 44.67", "[collision]") {
    Pair pair(0.0f, math::kHalfPi);
    set_velocity(pair.registry, pair.a, {200.0f, 0.0f});

    Collision2DSystem collision;
    REQUIRE(collision.resolve_pair(pair.registry, pair.a, pair.b));

    REQUIRE(collision.ram_events().size() == 1);
    const RamEvent& ram = collision.ram_events().front();
    REQUIRE(ram.a == pair.a);
    REQUIRE(ram.b == pair.b);
    REQUIRE(approx_equal(ram.relative_speed, 200.0f, 1e-3f));
    REQUIRE(approx_equal(ram.damage_b, 134.0f, 1e-3f));
    REQUIRE(approx_equal(ram.damage_a, 134.0f / 3.0f, 1e-3f));

    REQUIRE(approx_equal(pair.registry.get<Health>(pair.a).current, 100.0f - 134.0f / 3.0f, 1e-3f));
    REQUIRE(pair.registry.get<Health>(pair.b).current == 0.0f);
    REQUIRE(pair.registry.get<Sinking>(pair.b).active);
}

TEST_CASE("Collision: ram damage does not depend on argument order", "[collision]") {
    Pair forward(0.0f, math::kHalfPi);
    Pair reversed(0.0f, math::kHalfPi);
    set_velocity(forward.registry, forward.a, {200.0f, 0.0f});
    set_velocity(reversed.registry, reversed.a, {200.0f, 0.0f});

    Collision2DSystem c1;
    Collision2DSystem c2;
    c1.resolve_pair(forward.registry, forward.a, forward.b);
    c2.resolve_pair(reversed.registry, reversed.b, reversed.a);

    for (auto [e1, e2] : {std::pair{forward.a, reversed.a}, std::pair{forward.b, reversed.b}}) {
        const auto& t1 = forward.registry.get<Transform2D>(e1);
        const auto& t2 = reversed.registry.get<Transform2D>(e2);
        const auto& v1 = forward.registry.get<Velocity2D>(e1);
        const auto& v2 = reversed.registry.get<Velocity2D>(e2);

        REQUIRE(t1.position.x == t2.position.x);
        REQUIRE(t1.position.y == t2.position.y);
        REQUIRE(v1.linear.x == v2.linear.x);
        REQUIRE(v1.linear.y == v2.linear.y);
        REQUIRE(v1.angular == v2.angular);
        REQUIRE(forward.registry.get<Health>(e1).current == reversed.registry.get<Health>(e2).current);
    }
}

TEST_CASE("Collision: equal hulls get equal and opposite corrections", "[collision]") {
    Pair pair(0.0f, math::kPi);
    set_health(pair.registry, pair.a, 10000.0f);
    set_health(pair.registry, pair.b, 10000.0f);
    set_velocity(pair.registry, pair.a, {50.0f, 10.0f});
    set_velocity(pair.registry, pair.b, {-30.0f, -5.0f});

    Collision2DSystem collision;
    collision.resolve_pair(pair.registry, pair.b, pair.a);

    const auto& ta = pair.registry.get<Transform2D>(pair.a);
    const auto& tb = pair.registry.get<Transform2D>(pair.b);
    // Moved 0.5 px each out of a 2 px overlap
    REQUIRE(approx_equal(ta.position.x, -0.5f, 1e-4f));
    REQUIRE(approx_equal(tb.position.x, 80.5f, 1e-4f));

    // Momentum is unchanged
    const auto& va = pair.registry.get<Velocity2D>(pair.a).linear;
    const auto& vb = pair.registry.get<Velocity2D>(pair.b).linear;
    REQUIRE(approx_equal(va.x + vb.x, 20.0f, 1e-3f));
    REQUIRE(approx_equal(va.y + vb.y, 5.0f, 1e-3f));

    // Closing speed reversed and scaled by restitution
    REQUIRE(approx_equal(vb.x - va.x, 0.2f * 80.0f, 1e-3f));
}

TEST_CASE("Collision: glancing contact spins the hulls in opposite directions", "[collision]") {
    Pair pair(0.0f, 0.0f);
    set_velocity(pair.registry, pair.a, {100.0f, 0.0f});
    set_velocity(pair.registry, pair.b, {0.0f, 50.0f});

    Collision2DSystem collision;
    REQUIRE(collision.resolve_pair(pair.registry, pair.a, pair.b));

    // Tangential slip of 50 px/s along +y
    const float spin_a = pair.registry.get<Velocity2D>(pair.a).angular;
    const float spin_b = pair.registry.get<Velocity2D>(pair.b).angular;
    REQUIRE(spin_a < 0.0f);
    REQUIRE(spin_b > 0.0f);
    REQUIRE(spin_a == -spin_b);
    REQUIRE(approx_equal(spin_b, 0.0008f * 50.0f, 1e-6f));
}

TEST_CASE("Collision: heavier hull is pushed less", "[collision]") {
    entt::registry registry;
    auto small = make_vessel(registry, {0.0f, 0.0f}, 0.0f, 100.0f, 40.0f);
    auto large = make_vessel(registry, {60.0f, 0.0f}, 0.0f, 200.0f, 60.0f);

    Collision2DSystem collision;
    REQUIRE(collision.resolve_pair(registry, small, large));

    const float moved_small = std::abs(registry.get<Transform2D>(small).position.x);
    const float moved_large = std::abs(registry.get<Transform2D>(large).position.x - 60.0f);
    REQUIRE(moved_small > moved_large);
}

TEST_CASE("Collision: separated hulls are left alone", "[collision]") {
    entt::registry registry;
    auto a = make_vessel(registry, {0.0f, 0.0f});
    auto b = make_vessel(registry, {100.0f, 0.0f});
    set_velocity(registry, a, {100.0f, 0.0f});

    Collision2DSystem collision;
    REQUIRE_FALSE(collision.resolve_pair(registry, a, b));
    REQUIRE(collision.ram_events().empty());
    REQUIRE(registry.get<Velocity2D>(a).linear.x == 100.0f);
}

TEST_CASE("Collision: separating hulls are corrected but not rammed", "[collision]") {
    Pair pair(0.0f, 0.0f);
    set_velocity(pair.registry, pair.b, {50.0f, 0.0f});

    Collision2DSystem collision;
    REQUIRE(collision.resolve_pair(pair.registry, pair.a, pair.b));

    REQUIRE(collision.ram_events().empty());
    REQUIRE(pair.registry.get<Velocity2D>(pair.b).linear.x == 50.0f);
    REQUIRE(pair.registry.get<Health>(pair.a).current == 100.0f);
}

TEST_CASE("Collision: coincident centres are nudged apart along x", "[collision]") {
    entt::registry registry;
    auto a = make_vessel(registry, {10.0f, 10.0f});
    auto b = make_vessel(registry, {10.0f, 10.0f});

    Collision2DSystem collision;
    REQUIRE(collision.resolve_pair(registry, b, a));

    const auto& ta = registry.get<Transform2D>(a);
    const auto& tb = registry.get<Transform2D>(b);
    REQUIRE(math::is_finite(ta.position));
    REQUIRE(math::is_finite(tb.position));
    REQUIRE(ta.position.x < 10.0f);
    REQUIRE(tb.position.x > 10.0f);
    REQUIRE(approx_equal(ta.position.y, 10.0f));
    REQUIRE(approx_equal(tb.position.y, 10.0f));
}

TEST_CASE("Collision: ram damage split rules", "[collision]") {
    const CollisionTuning tuning;

    SECTION("first hull's bow strikes") {
        auto [first, second] = Collision2DSystem::ram_damage(tuning, true, false, 200.0f);
        REQUIRE(approx_equal(second, 134.0f, 1e-3f));
        REQUIRE(approx_equal(first, 134.0f / 3.0f, 1e-3f));
    }

    SECTION("slow bow strike still deals the minimum") {
        auto [first, second] = Collision2DSystem::ram_damage(tuning, false, true, 10.0f);
        REQUIRE(approx_equal(first, 20.0f));
        REQUIRE(approx_equal(second, 20.0f / 3.0f, 1e-4f));
    }

    SECTION("side by side or bow to bow") {
        auto [a1, b1] = Collision2DSystem::ram_damage(tuning, false, false, 200.0f);
        REQUIRE(approx_equal(a1, 50.0f));
        REQUIRE(approx_equal(b1, 50.0f));

        auto [a2, b2] = Collision2DSystem::ram_damage(tuning, true, true, 120.0f);
        REQUIRE(approx_equal(a2, 30.0f));
        REQUIRE(approx_equal(b2, 30.0f));
    }
}

TEST_CASE("Collision: a pair rams once per cooldown under continuous contact", "[collision]") {
    Pair pair(0.0f, math::kHalfPi);
    set_health(pair.registry, pair.a, 10000.0f);
    set_health(pair.registry, pair.b, 10000.0f);

    Collision2DSystem collision;

    auto press = [&]() {
        pair.registry.get<Transform2D>(pair.a).position = Vector2{0.0f, 0.0f};
        pair.registry.get<Transform2D>(pair.b).position = Vector2{80.0f, 0.0f};
        set_velocity(pair.registry, pair.a, {100.0f, 0.0f});
        set_velocity(pair.registry, pair.b, {0.0f, 0.0f});
    };

    press();
    collision.update(pair.registry, 0.0f);
    REQUIRE(collision.ram_events().size() == 1);
    REQUIRE(approx_equal(collision.ram_cooldown_remaining(pair.a, pair.b), 4.0f));

    for (int i = 0; i < 3; ++i) {
        press();
        collision.update(pair.registry, 1.0f);
        REQUIRE(collision.ram_events().empty());
    }

    press();
    collision.update(pair.registry, 1.0f);
    REQUIRE(collision.ram_events().size() == 1);
}

TEST_CASE("Collision: pair key is symmetric", "[collision]") {
    entt::registry registry;
    auto a = registry.create();
    auto b = registry.create();

    REQUIRE(Collision2DSystem::pair_key(a, b) == Collision2DSystem::pair_key(b, a));
    REQUIRE(Collision2DSystem::pair_key(a, b) != Collision2DSystem::pair_key(a, a));
}

TEST_CASE("Collision: fully sunk hulls take no part", "[collision]") {
    Pair pair(0.0f, math::kHalfPi);
    auto& sinking = pair.registry.get<Sinking>(pair.b);
    sinking.active = true;
    sinking.timer = sinking.duration;

    Collision2DSystem collision;
    REQUIRE_FALSE(collision.resolve_pair(pair.registry, pair.a, pair.b));
}

// =============================================================================
// Projectile hits
// =============================================================================

TEST_CASE("Collision: projectile hits the hull and is spent", "[collision]") {
    entt::registry registry;
    auto shooter = make_vessel(registry, {-2000.0f, 0.0f});
    auto target = make_vessel(registry, {0.0f, 0.0f});
    auto shot = spawn_shot(registry, {0.0f, 20.0f}, shooter);

    Collision2DSystem collision;
    collision.update(registry, 0.016f);

    REQUIRE(collision.hits().size() == 1);
    const ProjectileHit& hit = collision.hits().front();
    REQUIRE(hit.owner == shooter);
    REQUIRE(hit.hull == target);
    REQUIRE(approx_equal(hit.damage, 12.0f));
    REQUIRE_FALSE(hit.lethal);
    REQUIRE(hit.kind == DamageProfile::Kind::Standard);

    REQUIRE(registry.all_of<DeadTag>(shot));
    REQUIRE(approx_equal(registry.get<Health>(target).current, 88.0f));
}

TEST_CASE("Collision: a shot never hits its own hull", "[collision]") {
    entt::registry registry;
    auto vessel = make_vessel(registry, {0.0f, 0.0f});
    auto shot = spawn_shot(registry, {0.0f, 0.0f}, vessel);

    Collision2DSystem collision;
    collision.resolve_projectiles(registry);

    REQUIRE(collision.hits().empty());
    REQUIRE_FALSE(registry.all_of<DeadTag>(shot));
    REQUIRE(registry.get<Health>(vessel).current == 100.0f);
}

TEST_CASE("Collision: near miss off the tapered bow", "[collision]") {
    entt::registry registry;
    make_vessel(registry, {0.0f, 0.0f});
    auto shot = spawn_shot(registry, {55.0f, 20.0f}, entt::null);

    Collision2DSystem collision;
    collision.resolve_projectiles(registry);

    REQUIRE(collision.hits().empty());
    REQUIRE_FALSE(registry.all_of<DeadTag>(shot));
}

TEST_CASE("Collision: finishing blow starts the sinking", "[collision]") {
    entt::registry registry;
    auto target = make_vessel(registry, {0.0f, 0.0f});
    registry.get<Health>(target).current = 10.0f;
    spawn_shot(registry, {0.0f, 0.0f}, entt::null);

    Collision2DSystem collision;
    collision.resolve_projectiles(registry);

    REQUIRE(collision.hits().size() == 1);
    REQUIRE(collision.hits().front().lethal);
    REQUIRE(registry.get<Health>(target).current == 0.0f);
    REQUIRE(registry.get<Sinking>(target).active);
}

TEST_CASE("Collision: hitting a sinking hull hurries it down", "[collision]") {
    entt::registry registry;
    auto target = make_vessel(registry, {0.0f, 0.0f});
    registry.get<Health>(target).current = 0.0f;
    auto& sinking = registry.get<Sinking>(target);
    sinking.active = true;
    sinking.timer = 2.0f;

    auto shot = spawn_shot(registry, {0.0f, 0.0f}, entt::null);

    Collision2DSystem collision;
    collision.resolve_projectiles(registry);

    REQUIRE(registry.all_of<DeadTag>(shot));
    REQUIRE(approx_equal(registry.get<Sinking>(target).timer, 3.0f));
    REQUIRE_FALSE(collision.hits().front().lethal);
}

TEST_CASE("Collision: sinking timer is capped at its duration", "[collision]") {
    entt::registry registry;
    auto target = make_vessel(registry, {0.0f, 0.0f});
    auto& sinking = registry.get<Sinking>(target);
    sinking.active = true;
    sinking.timer = 9.5f;

    spawn_shot(registry, {0.0f, 0.0f}, entt::null);

    Collision2DSystem collision;
    collision.resolve_projectiles(registry);

    REQUIRE(approx_equal(registry.get<Sinking>(target).timer, 10.0f));
}

TEST_CASE("Collision: damage wakes up a passive helmsman", "[collision][ai]") {
    entt::registry registry;
    auto target = make_vessel(registry, {0.0f, 0.0f});
    auto& agent = registry.emplace<ai::AiAgent>(target);
    agent.travel_destination = Vector2{1000.0f, 1000.0f};

    spawn_shot(registry, {0.0f, 0.0f}, entt::null);

    Collision2DSystem collision;
    collision.resolve_projectiles(registry);

    const auto& after = registry.get<ai::AiAgent>(target);
    REQUIRE(after.aggressive);
    REQUIRE_FALSE(after.travel_destination.has_value());
}
