/**
 * @file overlap_solver.hpp
 * @brief Pairwise overlap resolution between merged asteroid colliders
 *
 * Each pass visits every unordered pair in definition order:
 * 1. Build both merged colliders and run the separating-axis test
 * 2. Push the bodies apart symmetrically along the MTV normal
 * 3. If they are closing, exchange a near-elastic normal impulse plus a
 *    small tangential friction impulse on their drifts
 * After all pairs, every body is clamped to the viewport bounds.
 */

#ifndef ASTROFIELD_OVERLAP_SOLVER_HPP
#define ASTROFIELD_OVERLAP_SOLVER_HPP

#include <vector>

#include <entt/entt.hpp>

#include "astrofield/components/basic.hpp"
#include "astrofield/components/field.hpp"
#include "astrofield/systems/boundary.hpp"
#include "astrofield/systems/i_system.hpp"

namespace Systems {

/**
 * @struct OverlapConfig
 * @brief Configuration parameters specific to the overlap solver
 */
struct OverlapConfig {
    // Passes per update() call
    int iterations = 2;

    // Extra spacing added to every positional correction
    double separationSlack = 0.25;

    // 0 = sticky, 1 = perfectly elastic
    double restitution = 0.97;

    // Fraction of relative tangential drift removed per contact
    double tangentialFriction = 0.01;
};

/**
 * @brief Working copy of one body used while solving
 */
struct SolverBody {
    entt::entity e;
    Components::Position pos;
    Components::Drift drift;
    double rotation;
    double radius;
    const Components::Silhouette *silhouette;
};

/**
 * @class OverlapSolver
 * @brief Keeps merged colliders apart and inside the viewport
 */
class OverlapSolver : public ConfigurableSystem<OverlapConfig> {
public:
    OverlapSolver() = default;
    OverlapSolver(const OverlapConfig &config, const BoundaryConfig &boundary);
    ~OverlapSolver() override = default;

    /**
     * @brief Runs the configured number of passes over all bodies
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;

    /**
     * @brief Runs an explicit number of passes, overriding the config
     */
    void solve(entt::registry &registry, int iterations) const;

    /**
     * @brief Resolves overlaps on a working set of bodies
     *
     * @param bodies Bodies in pair-visiting order, modified in place
     * @param state Viewport and label layout
     * @param config Solver tunables
     * @param boundary Wall tunables used for the per-pass clamp
     * @param iterations Number of passes
     * @return Number of overlapping pairs corrected over all passes
     */
    static int resolve(std::vector<SolverBody> &bodies,
                       const Components::FieldState &state,
                       const OverlapConfig &config,
                       const BoundaryConfig &boundary,
                       int iterations);

private:
    BoundaryConfig boundaryConfig;
};

} // namespace Systems

#endif // ASTROFIELD_OVERLAP_SOLVER_HPP
