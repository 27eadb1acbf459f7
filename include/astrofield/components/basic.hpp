#ifndef ASTROFIELD_COMPONENTS_BASIC_HPP
#define ASTROFIELD_COMPONENTS_BASIC_HPP

#include <cstddef>
#include <string>
#include "astrofield/math/polygon.hpp"
#include "astrofield/core/project_seed.hpp"

namespace Components {

    // Body centre in viewport pixels
    using Position = ::Position;

    // Linear velocity in pixels per nominal frame
    using Drift = ::Vector;

    struct Rotation {
        double degrees = 0.0; // not normalised, wraps implicitly

        explicit Rotation(double d = 0.0) : degrees(d) {}
    };

    struct Spin {
        double degreesPerFrame = 0.0;

        explicit Spin(double d = 0.0) : degreesPerFrame(d) {}
    };

    // Local-space outline, generated once per body and never rotated in place
    struct Silhouette {
        Polygon vertices;
    };

    struct CollisionRadius {
        double value = 0.0; // half of the seed size

        explicit CollisionRadius(double v = 0.0) : value(v) {}
    };

    // Definition order of the body; pair resolution and hit testing follow it
    struct BodyIndex {
        std::size_t value = 0;

        explicit BodyIndex(std::size_t v = 0) : value(v) {}
    };

    // Link back to the seed this body was spawned from
    struct ProjectRef {
        std::string id;
        std::size_t seedIndex = 0;
        AsteroidColor color = AsteroidColor::Primary;
        double size = 0.0;
    };

    // Tag: pointer is currently over this body
    struct Hovered {};

} // namespace Components

#endif
