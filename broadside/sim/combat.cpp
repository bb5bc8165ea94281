#include "combat.hpp"

#include "broadside/ai/helmsman.hpp"
#include "broadside/ecs/components/naval.hpp"

#include <raylib.h>

#include <algorithm>
#include <cmath>

namespace broadside::sim {

DamageOutcome apply_damage(entt::registry& registry, entt::entity vessel, float amount) {
    DamageOutcome outcome;
    if (!std::isfinite(amount) || amount <= 0.0f) return outcome;
    if (!registry.valid(vessel)) return outcome;

    auto* health = registry.try_get<ecs::Health>(vessel);
    if (!health) return outcome;

    const float before = health->current;
    health->current = std::clamp(before - amount, 0.0f, health->max);
    outcome.applied = before - health->current;

    auto* sinking = registry.try_get<ecs::Sinking>(vessel);
    if (sinking && !sinking->active && health->current <= 0.0f) {
        sinking->active = true;
        sinking->timer = 0.0f;
        outcome.lethal = true;
        TraceLog(LOG_INFO, "[combat] vessel %u is sinking", static_cast<unsigned>(entt::to_integral(vessel)));
    }

    if (auto* agent = registry.try_get<ai::AiAgent>(vessel)) {
        ai::Helmsman::notify_damage(*agent, amount);
    }

    return outcome;
}

} // namespace broadside::sim
