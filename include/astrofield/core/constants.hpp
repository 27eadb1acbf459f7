#ifndef ASTROFIELD_CONSTANTS_HPP
#define ASTROFIELD_CONSTANTS_HPP

namespace FieldConstants {

    // Truly global constants
    extern const double Pi;

    /// Nominal animation frame interval; drift and spin are expressed per frame of this length.
    extern const double NominalFrameMs;

    // Window used by the demo host
    extern const unsigned int DefaultViewportWidth;
    extern const unsigned int DefaultViewportHeight;
    extern const unsigned int TargetFramesPerSecond;

    /**
     * @brief Converts an elapsed time into a frame multiplier relative to NominalFrameMs
     * @param elapsedMs Milliseconds since the previous frame
     * @param minScale Lower clamp for the multiplier
     * @param maxScale Upper clamp for the multiplier
     */
    double frameScale(double elapsedMs, double minScale, double maxScale);
}

#endif // ASTROFIELD_CONSTANTS_HPP
