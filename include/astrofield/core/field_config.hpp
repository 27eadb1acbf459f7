/**
 * @file field_config.hpp
 * @brief Configuration for an asteroid field instance.
 */

#pragma once

#include "astrofield/components/field.hpp"
#include "astrofield/entities/asteroid_factory.hpp"
#include "astrofield/interaction/pointer_interaction.hpp"
#include "astrofield/systems/boundary.hpp"
#include "astrofield/systems/collision/overlap_solver.hpp"

/**
 * @struct LabelConfig
 * @brief Label rectangle sizes per viewport breakpoint
 */
struct LabelConfig {
    Components::LabelLayout desktop{18.0, 280.0, 44.0};
    Components::LabelLayout compact{18.0, 240.0, 40.0};

    // Viewport widths at or above this use the desktop layout
    double desktopBreakpoint = 1024.0;
};

/**
 * @struct LifecycleConfig
 * @brief Timing of the settle, frame and resize phases
 */
struct LifecycleConfig {
    // Pre-solve: rounds x passes, each round followed by an extra clamp
    int presolveRounds = 60;
    int presolvePasses = 2;

    // Width change (pixels) below which resize notifications are ignored
    double resizeThresholdPixels = 2.0;

    // Change (pixels) in either dimension that hides labels until re-settled
    double labelResetThresholdPixels = 1.0;

    // Frames simulated at a stable size before labels are revealed
    int labelRevealFrames = 2;

    // Clamp of the per-frame dt multiplier, in nominal frames
    double minFrameScale = 0.5;
    double maxFrameScale = 2.0;

    // Quiet period before a zoom/scale request is applied
    double resizeDebounceMs = 150.0;
};

/**
 * @brief Container for every tunable of a FieldSimulator.
 *
 * All defaults reproduce the portfolio's asteroid field.
 */
struct FieldConfig {
    LabelConfig label;
    LifecycleConfig lifecycle;
    Systems::BoundaryConfig boundary;
    Systems::OverlapConfig overlap;
    Entities::SpawnConfig spawn;
    InteractionConfig interaction;

    // 0 seeds from the clock; anything else gives reproducible spawns
    unsigned int randomSeed = 0;

    // Place once, then stop integrating
    bool reducedMotion = false;

    // Include merged colliders in snapshots
    bool debugColliders = false;

    // Round label anchors to device pixels
    bool snapLabelsToDevicePixels = false;
    double devicePixelRatio = 1.0;
};
