#include "astrofield/systems/movement.hpp"

#include "astrofield/components/basic.hpp"
#include "astrofield/core/debug.hpp"
#include "astrofield/core/profile.hpp"
#include "astrofield/entities/asteroid_factory.hpp"

namespace Systems {

void MovementSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("MovementSystem");

    const Components::FieldState *state = Entities::findFieldState(registry);
    if (!state) {
        return;
    }
    double const dt = state->frameScale;

    auto view = registry.view<Components::Position, Components::Drift>();
    for (auto &&[entity, pos, drift] : view.each()) {
        pos += drift * dt;
        DebugStats::recordSpeed(drift.length());
    }
}

} // namespace Systems
