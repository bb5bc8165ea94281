#pragma once

// =============================================================================
// Combat - the one place a vessel loses health
// =============================================================================

#include <entt/entt.hpp>

namespace broadside::sim {

struct DamageOutcome {
    float applied{0.0f};   // health actually removed
    bool lethal{false};    // this hit started the sinking
};

/// Remove health from a vessel, start sinking at zero and wake up its AI.
/// Non-positive or non-finite amounts and non-vessels are ignored.
DamageOutcome apply_damage(entt::registry& registry, entt::entity vessel, float amount);

} // namespace broadside::sim
