#include "ai_system.hpp"

#include <raylib.h>

namespace broadside::ecs {

std::optional<ai::VesselSnapshot> AISystem::snapshot_of(const entt::registry& registry, entt::entity entity) {
    if (entity == entt::null || !registry.valid(entity)) return std::nullopt;
    if (!registry.all_of<VesselTag, Transform2D, Velocity2D, Hull, Movement2D, Sinking>(entity)) {
        return std::nullopt;
    }
    if (registry.all_of<DeadTag>(entity) || registry.get<Sinking>(entity).active) {
        return std::nullopt;
    }

    const auto& transform = registry.get<Transform2D>(entity);
    const auto& velocity = registry.get<Velocity2D>(entity);
    return ai::VesselSnapshot{
        entity,
        transform.position,
        velocity.linear,
        transform.rotation,
        registry.get<Hull>(entity).length,
        registry.get<Movement2D>(entity).max_speed,
    };
}

void AISystem::collect_snapshots(const entt::registry& registry) {
    snapshots_.clear();

    // Sinking hulls are still obstacles until they are gone.
    auto view = registry.view<VesselTag, const Transform2D, const Velocity2D,
                              const Hull, const Movement2D, const Sinking>(entt::exclude<DeadTag>);
    for (auto [entity, transform, velocity, hull, movement, sinking] : view.each()) {
        if (sinking.fully_sunk()) continue;
        snapshots_.push_back(ai::VesselSnapshot{
            entity, transform.position, velocity.linear, transform.rotation, hull.length, movement.max_speed});
    }
}

void AISystem::update(entt::registry& registry, float dt) {
    collect_snapshots(registry);

    auto view = registry.view<VesselTag, ai::AiAgent, Helm, const Transform2D, const Velocity2D,
                              const Hull, const Movement2D, const Sinking>(entt::exclude<DeadTag>);
    for (auto [entity, agent, helm, transform, velocity, hull, movement, sinking] : view.each()) {
        if (sinking.active) {
            helm.intent = ControlIntent{};
            continue;
        }

        const ai::VesselSnapshot self{
            entity, transform.position, velocity.linear, transform.rotation, hull.length, movement.max_speed};
        const auto target = snapshot_of(registry, agent.target);

        const bool was_aggressive = agent.aggressive;
        helm.intent = helmsman_.decide(agent, self, dt, target, snapshots_, bounds_);

        if (was_aggressive != agent.aggressive) {
            TraceLog(LOG_DEBUG, "[ai] vessel %u is now %s", static_cast<unsigned>(entt::to_integral(entity)),
                     agent.aggressive ? "aggressive" : "passive");
        }
    }
}

} // namespace broadside::ecs
