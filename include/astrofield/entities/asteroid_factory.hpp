#pragma once

#include <cstddef>
#include <random>
#include <vector>

#include <entt/entt.hpp>

#include "astrofield/components/basic.hpp"
#include "astrofield/components/field.hpp"
#include "astrofield/core/project_seed.hpp"

namespace Entities {

/**
 * @struct SilhouetteConfig
 * @brief Shape of the procedural wobble applied to every asteroid outline
 *
 * radius(angle) = size/2 * (base + ampA*sin(freqA*angle + phase)
 *                                 + ampB*cos(freqB*angle + phaseScaleB*phase))
 */
struct SilhouetteConfig {
    int vertexCount = 18;
    double base = 0.92;
    double ampA = 0.06;
    double freqA = 2.0;
    double ampB = 0.05;
    double freqB = 3.2;
    double phaseScaleB = 0.7;
};

/**
 * @struct SpawnConfig
 * @brief Ranges used when turning a seed into a live body
 */
struct SpawnConfig {
    // Vertical spawn fraction = clamp(seed.y * yScale, yMin, yMax)
    double yScale = 0.75;
    double yMin = 0.06;
    double yMax = 0.45;

    // Uniform half-ranges around zero, per nominal frame
    double driftXRange = 0.16;
    double driftYRange = 0.19;
    double spinRange = 0.225;

    SilhouetteConfig silhouette;
};

/**
 * @brief Generates the local outline of an asteroid
 *
 * @param size Diameter in pixels
 * @param phase Per-body wobble phase in radians
 * @param config Wobble parameters
 * @return Polygon vertexCount vertices, ordered by increasing angle
 */
Polygon generateSilhouette(double size, double phase, const SilhouetteConfig &config = SilhouetteConfig());

/**
 * @class AsteroidFactory
 * @brief Creates asteroid body entities with their full component set
 */
class AsteroidFactory {
public:
    /**
     * @brief Creates a body with explicit kinematics
     *
     * @param registry The entity registry
     * @param seed Project the body represents
     * @param index Definition order of the body
     * @param position Centre in viewport pixels
     * @param drift Velocity in pixels per nominal frame
     * @param rotationDegrees Initial rotation
     * @param spinDegrees Angular velocity in degrees per nominal frame
     * @param silhouette Local outline
     * @return The created entity
     */
    static entt::entity createAsteroid(entt::registry &registry,
                                       const ProjectSeed &seed,
                                       std::size_t index,
                                       const Components::Position &position,
                                       const Components::Drift &drift,
                                       double rotationDegrees,
                                       double spinDegrees,
                                       Polygon silhouette);

    /**
     * @brief Creates a body from a seed using the spawn rule and random kinematics
     *
     * @param registry The entity registry
     * @param seed Project the body represents
     * @param index Definition order of the body
     * @param width Viewport width in pixels
     * @param height Viewport height in pixels
     * @param generator Random source for rotation, drift, spin and wobble phase
     * @param config Spawn ranges
     */
    static entt::entity spawnFromSeed(entt::registry &registry,
                                      const ProjectSeed &seed,
                                      std::size_t index,
                                      double width,
                                      double height,
                                      std::default_random_engine &generator,
                                      const SpawnConfig &config = SpawnConfig());
};

/**
 * @brief All asteroid bodies sorted by BodyIndex
 */
std::vector<entt::entity> bodiesInOrder(const entt::registry &registry);

/**
 * @brief Returns the field state entity, creating it if absent
 */
Components::FieldState &fieldState(entt::registry &registry);

/**
 * @brief Returns the field state, or nullptr when the registry has none
 */
const Components::FieldState *findFieldState(const entt::registry &registry);

} // namespace Entities
