#include "astrofield/systems/collision/collider_builder.hpp"

namespace Collision {

std::array<Vector, 4> LabelRect::corners() const {
    return {Vector(x, y), Vector(x + w, y), Vector(x + w, y + h), Vector(x, y + h)};
}

Components::LabelLayout labelLayoutFor(double viewportWidth,
                                       double breakpoint,
                                       const Components::LabelLayout &desktop,
                                       const Components::LabelLayout &compact) {
    return viewportWidth >= breakpoint ? desktop : compact;
}

LabelRect labelRect(const Components::Position &pos, double radius, const Components::LabelLayout &layout) {
    return {pos.x - layout.width / 2.0, pos.y + radius + layout.gap, layout.width, layout.height};
}

Polygon worldSilhouette(const Components::Silhouette &silhouette,
                        const Components::Position &pos,
                        double rotationDegrees) {
    return transformToWorld(silhouette.vertices, pos, rotationDegrees);
}

Polygon mergedCollider(const Components::Silhouette &silhouette,
                       const Components::Position &pos,
                       double rotationDegrees,
                       double radius,
                       const Components::LabelLayout &layout) {
    Polygon points = worldSilhouette(silhouette, pos, rotationDegrees);
    auto const label = labelRect(pos, radius, layout).corners();
    points.insert(points.end(), label.begin(), label.end());
    return convexHull(points);
}

} // namespace Collision
