#pragma once

namespace Components {

    /**
     * @brief Lifecycle of the body set owned by a FieldSimulator
     */
    enum class LifecyclePhase {
        Uninitialized,
        Settling,
        Live
    };

    /**
     * @brief Label rectangle dimensions for the current viewport breakpoint
     */
    struct LabelLayout {
        double gap = 18.0;     // vertical gap between body edge and label
        double width = 280.0;
        double height = 44.0;
    };

    /**
     * @brief Field-wide state stored on a single entity in the registry
     */
    struct FieldState {
        double width = 0.0;         // viewport frame in pixels
        double height = 0.0;
        LabelLayout label;
        double frameScale = 1.0;    // dt multiplier for the current frame
        LifecyclePhase phase = LifecyclePhase::Uninitialized;

        explicit FieldState(double w = 0.0, double h = 0.0, LabelLayout l = LabelLayout())
            : width(w)
            , height(h)
            , label(l) {}
    };
}
