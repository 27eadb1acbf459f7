/**
 * @file rotation.hpp
 * @brief System for spinning bodies by their angular velocity
 *
 * Required components:
 * - Rotation (to modify)
 * - Spin (to read)
 */

#pragma once

#include <entt/entt.hpp>
#include "astrofield/systems/i_system.hpp"

namespace Systems {

/**
 * @class RotationSystem
 * @brief Adds spin * frameScale degrees to every body's rotation
 *
 * Rotation is left unbounded; trigonometry downstream does the wrapping.
 */
class RotationSystem : public ISystem {
public:
    RotationSystem() = default;
    ~RotationSystem() override = default;

    void update(entt::registry &registry) override;
};

} // namespace Systems
