/**
 * @file overlap_solver.cpp
 * @brief Position and drift correction for overlapping asteroid colliders
 *
 * Bodies are gathered from the registry into a flat array in definition
 * order, solved in place, and written back once at the end.
 */

#include "astrofield/systems/collision/overlap_solver.hpp"

#include "astrofield/algo/sat.hpp"
#include "astrofield/core/debug.hpp"
#include "astrofield/core/profile.hpp"
#include "astrofield/entities/asteroid_factory.hpp"
#include "astrofield/systems/collision/collider_builder.hpp"

namespace Systems {

OverlapSolver::OverlapSolver(const OverlapConfig &config, const BoundaryConfig &boundary)
    : ConfigurableSystem<OverlapConfig>(config)
    , boundaryConfig(boundary) {}

/**
 * @brief Loads every body into a working array sorted by BodyIndex
 */
static std::vector<SolverBody> gatherBodies(entt::registry &registry) {
    std::vector<SolverBody> bodies;
    for (auto e : Entities::bodiesInOrder(registry)) {
        if (!registry.all_of<Components::Position, Components::Drift, Components::Rotation,
                             Components::CollisionRadius, Components::Silhouette>(e)) {
            continue;
        }
        SolverBody b;
        b.e = e;
        b.pos = registry.get<Components::Position>(e);
        b.drift = registry.get<Components::Drift>(e);
        b.rotation = registry.get<Components::Rotation>(e).degrees;
        b.radius = registry.get<Components::CollisionRadius>(e).value;
        b.silhouette = &registry.get<Components::Silhouette>(e);
        bodies.push_back(b);
    }
    return bodies;
}

/**
 * @brief Writes solved positions and drifts back to the registry
 */
static void storeBodies(entt::registry &registry, const std::vector<SolverBody> &bodies) {
    for (const auto &b : bodies) {
        registry.replace<Components::Position>(b.e, b.pos);
        registry.replace<Components::Drift>(b.e, b.drift);
    }
}

/**
 * @brief Separates one overlapping pair and exchanges drift impulses
 */
static void resolvePair(SolverBody &A, SolverBody &B, const Mtv &mtv, const OverlapConfig &config) {
    const Vector n = mtv.normal;

    // Symmetric positional correction, A backwards and B forwards
    const double push = (mtv.overlap + config.separationSlack) * 0.5;
    A.pos -= n * push;
    B.pos += n * push;

    const Vector rv = B.drift - A.drift;
    const double relN = rv.dotProduct(n);
    if (relN >= 0.0) {
        return;  // already separating
    }

    // Normal impulse, shared equally
    const double j = -(1.0 + config.restitution) * relN * 0.5;
    A.drift -= n * j;
    B.drift += n * j;

    // Light tangential friction against endless sliding
    const Vector t = n.perp();
    const double relT = rv.dotProduct(t);
    const double jt = -relT * config.tangentialFriction * 0.5;
    A.drift -= t * jt;
    B.drift += t * jt;
}

int OverlapSolver::resolve(std::vector<SolverBody> &bodies,
                           const Components::FieldState &state,
                           const OverlapConfig &config,
                           const BoundaryConfig &boundary,
                           int iterations) {
    int corrected = 0;

    for (int it = 0; it < iterations; ++it) {
        for (size_t i = 0; i < bodies.size(); ++i) {
            for (size_t k = i + 1; k < bodies.size(); ++k) {
                SolverBody &A = bodies[i];
                SolverBody &B = bodies[k];

                const Polygon polyA = Collision::mergedCollider(*A.silhouette, A.pos, A.rotation, A.radius, state.label);
                const Polygon polyB = Collision::mergedCollider(*B.silhouette, B.pos, B.rotation, B.radius, state.label);

                auto mtv = satCollide(polyA, polyB);
                if (!mtv) {
                    continue;
                }
                DEBUG_MSG(DEBUG_LEVEL_BASIC, "[OverlapSolver] pair " << i << "/" << k
                          << " overlap " << mtv->overlap << "\n");
                resolvePair(A, B, *mtv, config);
                ++corrected;
            }
        }

        // Clamp once per pass, after every pair has been visited
        for (auto &b : bodies) {
            BoundarySystem::clampBody(b.pos, b.drift, b.radius, state, boundary);
        }
    }
    return corrected;
}

void OverlapSolver::solve(entt::registry &registry, int iterations) const {
    PROFILE_SCOPE("OverlapSolver");

    const Components::FieldState *state = Entities::findFieldState(registry);
    if (!state) {
        return;
    }

    std::vector<SolverBody> bodies = gatherBodies(registry);
    if (bodies.empty()) {
        return;
    }

    int const corrected = resolve(bodies, *state, specificConfig, boundaryConfig, iterations);
    DebugStats::recordContacts(corrected);
    storeBodies(registry, bodies);
}

void OverlapSolver::update(entt::registry &registry) {
    solve(registry, specificConfig.iterations);
}

} // namespace Systems
