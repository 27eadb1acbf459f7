/**
 * @file boundary.hpp
 * @brief System keeping every body and its label inside the viewport
 *
 * This system handles:
 * - Deriving the allowed centre rectangle from viewport size, body radius
 *   and label size
 * - Mirroring bodies that left the rectangle back inside
 * - Reflecting the offending drift component with light restitution
 *
 * Required components:
 * - Position (to read/modify)
 * - Drift (to read/modify)
 * - CollisionRadius (to read)
 */

#ifndef ASTROFIELD_BOUNDARY_SYSTEM_HPP
#define ASTROFIELD_BOUNDARY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "astrofield/components/basic.hpp"
#include "astrofield/components/field.hpp"
#include "astrofield/systems/i_system.hpp"

namespace Systems {

/**
 * @struct BoundaryConfig
 * @brief Configuration parameters specific to the boundary system
 */
struct BoundaryConfig {
    // Margin from each viewport edge in pixels
    double paddingPixels = 40.0;

    // Fraction of the height below which neither body nor label may reach
    double depthBias = 0.72;

    // Vertical travel kept available even when the depth bias would remove it
    double minVerticalTravel = 50.0;

    // Fraction of the drift component kept when bouncing off a wall
    double restitution = 0.98;

    // Extra distance past the bound after mirroring, to avoid re-sticking
    double pushOutEpsilon = 0.35;
};

/**
 * @struct Bounds
 * @brief Allowed rectangle for a body centre
 */
struct Bounds {
    double minX;
    double maxX;
    double minY;
    double maxY;
};

/**
 * @class BoundarySystem
 * @brief Clamps bodies into the padded, depth-biased viewport
 */
class BoundarySystem : public ConfigurableSystem<BoundaryConfig> {
public:
    BoundarySystem() = default;
    explicit BoundarySystem(const BoundaryConfig& config);
    ~BoundarySystem() override = default;

    /**
     * @brief Clamps every body in the registry
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;

    /**
     * @brief Allowed centre rectangle for a body of the given radius
     *
     * Horizontal extent is the larger of the radius and half the label
     * width; vertical extent covers the radius above and radius, gap and
     * label height below.
     */
    static Bounds computeBounds(double radius,
                                const Components::FieldState &state,
                                const BoundaryConfig &config);

    /**
     * @brief Mirrors a body back inside its bounds
     *
     * @param pos Body centre, modified in place
     * @param drift Body drift, the offending component is reflected
     * @param radius Collision radius of the body
     * @param state Current viewport and label layout
     * @param config Boundary tunables
     * @return true if the body was moved
     */
    static bool clampBody(Components::Position &pos,
                          Components::Drift &drift,
                          double radius,
                          const Components::FieldState &state,
                          const BoundaryConfig &config);
};

} // namespace Systems

#endif
