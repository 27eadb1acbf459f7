/**
 * @file rotation.cpp
 * @brief Implementation of the spin integrator
 */

#include "astrofield/systems/rotation.hpp"

#include "astrofield/components/basic.hpp"
#include "astrofield/core/profile.hpp"
#include "astrofield/entities/asteroid_factory.hpp"

namespace Systems {

void RotationSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("RotationSystem");

    const Components::FieldState *state = Entities::findFieldState(registry);
    if (!state) {
        return;
    }
    double const dt = state->frameScale;

    auto view = registry.view<Components::Rotation, Components::Spin>();
    for (auto &&[entity, rotation, spin] : view.each()) {
        rotation.degrees += spin.degreesPerFrame * dt;
    }
}

} // namespace Systems
