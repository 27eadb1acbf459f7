/**
 * @file simulator.hpp
 * @brief Driver that owns the asteroid field registry and its lifecycle.
 */

#pragma once

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "astrofield/components/field.hpp"
#include "astrofield/core/field_config.hpp"
#include "astrofield/core/frame_scheduler.hpp"
#include "astrofield/core/project_seed.hpp"
#include "astrofield/core/snapshot.hpp"
#include "astrofield/interaction/pointer_interaction.hpp"
#include "astrofield/systems/boundary.hpp"
#include "astrofield/systems/collision/overlap_solver.hpp"
#include "astrofield/systems/i_system.hpp"

/**
 * @class FieldSimulator
 * @brief Owns every body of one asteroid field and advances it per frame.
 *
 * Lifecycle: Uninitialized -> Settling (pre-solve) -> Live. A layout resize
 * beyond the threshold goes back through Uninitialized and re-seeds; a
 * viewport resize only rescales positions. All state lives in this
 * instance, so independent simulators never interfere.
 */
class FieldSimulator {
public:
    explicit FieldSimulator(const FieldConfig& config = FieldConfig());
    ~FieldSimulator();

    FieldSimulator(const FieldSimulator&) = delete;
    FieldSimulator& operator=(const FieldSimulator&) = delete;

    /**
     * @brief Replaces the project list; takes effect on the next init()
     */
    void setProjects(const std::vector<ProjectSeed>& seeds);
    const std::vector<ProjectSeed>& getProjects() const { return projects; }
    const ProjectSeed* findProject(const std::string& id) const;

    /**
     * @brief Creates fresh bodies for the given frame and pre-solves them
     * @return false if the frame has no area (nothing is created)
     */
    bool init(double width, double height);

    /**
     * @brief Advances the field by one frame
     *
     * Applies any due debounced scale request, integrates drift and spin
     * with the clamped dt multiplier, resolves overlaps and clamps to the
     * walls. With reduced motion only label bookkeeping runs.
     *
     * @param timestampMs Monotonic frame timestamp
     * @return false if the field is not live
     */
    bool tick(double timestampMs);

    /**
     * @brief One integrate/resolve/clamp step of frameScale nominal frames
     */
    void step(double frameScale);

    /**
     * @brief Viewport (window) size change: proportional rescale only
     *
     * Width changes below the resize threshold only move the walls.
     */
    void onViewportResize(double width, double height);

    /**
     * @brief Container layout change: full re-initialisation when the width moved
     * @return true if the bodies were re-created; a collapsed (zero-area)
     *         container keeps the previous bodies
     */
    bool onLayoutResize(double width, double height);

    /**
     * @brief Zoom / visual viewport scale change, applied after the debounce window
     */
    void onViewportScale(double width, double height, double nowMs);

    /**
     * @brief Registers the recurring frame callback with a scheduler
     * @return false if already running or not initialised
     */
    bool start(IFrameScheduler& frameScheduler);

    /**
     * @brief Cancels the frame callback, pending resizes and pointer listeners
     */
    void stop();

    bool isRunning() const { return scheduler != nullptr; }

    // Pointer input, in container pixels
    std::optional<std::string> pointerMove(double x, double y);
    std::optional<std::string> pointerDown(double x, double y);
    void pointerLeave();

    PointerInteraction& getInteraction() { return interaction; }

    /**
     * @brief Copies the current pose of every body for rendering
     */
    FieldSnapshot snapshot() const;

    Components::LifecyclePhase getPhase() const;
    bool labelsVisible() const { return labelsReady; }
    bool hasPendingScale() const { return pendingScale.has_value(); }

    const FieldConfig& getConfig() const { return config; }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    struct PendingScale {
        double width;
        double height;
        double requestedAtMs;
    };

    void createSystems();
    void presolve();
    void applyFrame(double width, double height);
    void rescale(double width, double height);
    void noteFrameSize(double width, double height);
    void flushPendingScale(double nowMs);
    void scheduleNextFrame();
    void onFrame(double timestampMs);

    FieldConfig config;
    entt::registry registry;
    std::vector<ProjectSeed> projects;

    // Frame pipeline, run in order by step()
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    Systems::OverlapSolver* overlapSolver = nullptr;
    Systems::BoundarySystem* boundarySystem = nullptr;

    std::default_random_engine generator;
    PointerInteraction interaction;

    IFrameScheduler* scheduler = nullptr;
    std::optional<FrameHandle> pendingFrame;
    std::optional<double> lastTimestampMs;
    std::optional<PendingScale> pendingScale;

    // Last applied frame, used for proportional rescaling
    double lastWidth = 0.0;
    double lastHeight = 0.0;

    // Label reveal bookkeeping
    double stableWidth = 0.0;
    double stableHeight = 0.0;
    int stableFrames = 0;
    bool labelsReady = false;
};
