#include "astrofield/core/constants.hpp"

#include <algorithm>

namespace FieldConstants {

    const double Pi = 3.14159265358979323846;

    const double NominalFrameMs = 16.67;

    // Display
    const unsigned int DefaultViewportWidth  = 1280;
    const unsigned int DefaultViewportHeight = 720;
    const unsigned int TargetFramesPerSecond = 60;

    double frameScale(double elapsedMs, double minScale, double maxScale) {
        return std::min(maxScale, std::max(minScale, elapsedMs / NominalFrameMs));
    }

} // namespace FieldConstants
