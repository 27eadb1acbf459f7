#include "astrofield/systems/boundary.hpp"

#include <algorithm>
#include <cmath>

#include "astrofield/core/debug.hpp"
#include "astrofield/core/profile.hpp"
#include "astrofield/entities/asteroid_factory.hpp"

namespace Systems {

BoundarySystem::BoundarySystem(const BoundaryConfig& config)
    : ConfigurableSystem<BoundaryConfig>(config) {}

Bounds BoundarySystem::computeBounds(double radius,
                                     const Components::FieldState &state,
                                     const BoundaryConfig &config) {
    const double padding = config.paddingPixels;
    const double extentX = std::max(radius, state.label.width / 2.0);
    const double extentYTop = radius;
    const double extentYBottom = radius + state.label.gap + state.label.height;

    Bounds b{};
    b.minX = padding + extentX;
    b.maxX = state.width - padding - extentX;
    b.minY = padding + extentYTop;
    b.maxY = std::max(b.minY + config.minVerticalTravel,
                      state.height * config.depthBias - extentYBottom);
    return b;
}

/**
 * @brief Mirrors one coordinate back into [lo, hi] and reflects its velocity
 */
static bool clampAxis(double &p, double &v, double lo, double hi, const BoundaryConfig &config) {
    // No free travel left: pin to the middle of the collapsed range
    if (hi < lo) {
        double const mid = 0.5 * (lo + hi);
        bool const moved = (p != mid);
        p = mid;
        return moved;
    }

    if (p < lo) {
        double const pen = lo - p;
        p = std::min(hi, lo + pen + config.pushOutEpsilon);
        v = std::abs(v) * config.restitution;
        return true;
    }
    if (p > hi) {
        double const pen = p - hi;
        p = std::max(lo, hi - pen - config.pushOutEpsilon);
        v = -std::abs(v) * config.restitution;
        return true;
    }
    return false;
}

bool BoundarySystem::clampBody(Components::Position &pos,
                               Components::Drift &drift,
                               double radius,
                               const Components::FieldState &state,
                               const BoundaryConfig &config) {
    Bounds const b = computeBounds(radius, state, config);
    bool const movedX = clampAxis(pos.x, drift.x, b.minX, b.maxX, config);
    bool const movedY = clampAxis(pos.y, drift.y, b.minY, b.maxY, config);
    return movedX || movedY;
}

void BoundarySystem::update(entt::registry &registry) {
    PROFILE_SCOPE("BoundarySystem");

    const Components::FieldState *state = Entities::findFieldState(registry);
    if (!state) {
        return;
    }

    auto view = registry.view<Components::Position, Components::Drift, Components::CollisionRadius>();
    for (auto &&[entity, pos, drift, radius] : view.each()) {
        if (clampBody(pos, drift, radius.value, *state, specificConfig)) {
            DebugStats::recordWallClamp();
        }
    }
}

} // namespace Systems
