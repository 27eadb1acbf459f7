/**
 * @file movement.hpp
 * @brief System for advancing body positions by their drift
 *
 * Required components:
 * - Position (to modify)
 * - Drift (to read)
 *
 * The step length is FieldState::frameScale nominal frames.
 */

#ifndef ASTROFIELD_MOVEMENT_SYSTEM_HPP
#define ASTROFIELD_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "astrofield/systems/i_system.hpp"

namespace Systems {

class MovementSystem : public ISystem {
public:
    MovementSystem() = default;
    ~MovementSystem() override = default;

    /**
     * @brief Moves every body by drift * frameScale
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;
};

} // namespace Systems

#endif
