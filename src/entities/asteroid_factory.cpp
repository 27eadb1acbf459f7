#include "astrofield/entities/asteroid_factory.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "astrofield/core/constants.hpp"

namespace Entities {

Polygon generateSilhouette(double size, double phase, const SilhouetteConfig &config) {
    Polygon vertices;
    vertices.reserve(static_cast<size_t>(std::max(0, config.vertexCount)));

    for (int i = 0; i < config.vertexCount; ++i) {
        double const angle = (static_cast<double>(i) / config.vertexCount) * 2.0 * FieldConstants::Pi;
        double const wobble = config.base
                            + std::sin(angle * config.freqA + phase) * config.ampA
                            + std::cos(angle * config.freqB + phase * config.phaseScaleB) * config.ampB;
        double const rr = (size / 2.0) * wobble;
        vertices.emplace_back(std::cos(angle) * rr, std::sin(angle) * rr);
    }
    return vertices;
}

entt::entity AsteroidFactory::createAsteroid(entt::registry &registry,
                                             const ProjectSeed &seed,
                                             std::size_t index,
                                             const Components::Position &position,
                                             const Components::Drift &drift,
                                             double rotationDegrees,
                                             double spinDegrees,
                                             Polygon silhouette) {
    auto e = registry.create();

    registry.emplace<Components::Position>(e, position);
    registry.emplace<Components::Drift>(e, drift);
    registry.emplace<Components::Rotation>(e, rotationDegrees);
    registry.emplace<Components::Spin>(e, spinDegrees);
    registry.emplace<Components::Silhouette>(e, Components::Silhouette{std::move(silhouette)});
    registry.emplace<Components::CollisionRadius>(e, seed.asteroid.size / 2.0);
    registry.emplace<Components::BodyIndex>(e, index);

    Components::ProjectRef ref;
    ref.id = seed.id;
    ref.seedIndex = index;
    ref.color = seed.asteroid.color;
    ref.size = seed.asteroid.size;
    registry.emplace<Components::ProjectRef>(e, std::move(ref));

    return e;
}

entt::entity AsteroidFactory::spawnFromSeed(entt::registry &registry,
                                            const ProjectSeed &seed,
                                            std::size_t index,
                                            double width,
                                            double height,
                                            std::default_random_engine &generator,
                                            const SpawnConfig &config) {
    std::uniform_real_distribution<> rotation_dist(0.0, 360.0);
    std::uniform_real_distribution<> driftx_dist(-config.driftXRange, config.driftXRange);
    std::uniform_real_distribution<> drifty_dist(-config.driftYRange, config.driftYRange);
    std::uniform_real_distribution<> spin_dist(-config.spinRange, config.spinRange);
    std::uniform_real_distribution<> phase_dist(0.0, 2.0 * FieldConstants::Pi);

    double const spawnY = std::clamp(seed.asteroid.y * config.yScale, config.yMin, config.yMax);
    Components::Position const pos(seed.asteroid.x * width, spawnY * height);

    double const rotation = rotation_dist(generator);
    Components::Drift const drift(driftx_dist(generator), drifty_dist(generator));
    double const spin = spin_dist(generator);
    Polygon outline = generateSilhouette(seed.asteroid.size, phase_dist(generator), config.silhouette);

    return createAsteroid(registry, seed, index, pos, drift, rotation, spin, std::move(outline));
}

std::vector<entt::entity> bodiesInOrder(const entt::registry &registry) {
    auto view = registry.view<const Components::BodyIndex>();
    std::vector<entt::entity> bodies(view.begin(), view.end());
    std::sort(bodies.begin(), bodies.end(), [&registry](entt::entity a, entt::entity b) {
        return registry.get<Components::BodyIndex>(a).value < registry.get<Components::BodyIndex>(b).value;
    });
    return bodies;
}

Components::FieldState &fieldState(entt::registry &registry) {
    auto view = registry.view<Components::FieldState>();
    if (view.begin() != view.end()) {
        return registry.get<Components::FieldState>(*view.begin());
    }
    auto e = registry.create();
    return registry.emplace<Components::FieldState>(e);
}

const Components::FieldState *findFieldState(const entt::registry &registry) {
    auto view = registry.view<const Components::FieldState>();
    if (view.begin() == view.end()) {
        return nullptr;
    }
    return &registry.get<Components::FieldState>(*view.begin());
}

} // namespace Entities
