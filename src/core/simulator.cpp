/**
 * @fileoverview simulator.cpp
 * @brief Implementation of FieldSimulator.
 */

#include "astrofield/core/simulator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <utility>

#include "astrofield/components/basic.hpp"
#include "astrofield/core/constants.hpp"
#include "astrofield/core/debug.hpp"
#include "astrofield/core/profile.hpp"
#include "astrofield/entities/asteroid_factory.hpp"
#include "astrofield/systems/collision/collider_builder.hpp"
#include "astrofield/systems/movement.hpp"
#include "astrofield/systems/rotation.hpp"

FieldSimulator::FieldSimulator(const FieldConfig& cfg)
    : config(cfg)
    , interaction(cfg.interaction)
{
    unsigned int seed = config.randomSeed;
    if (seed == 0) {
        seed = static_cast<unsigned int>(
            std::chrono::system_clock::now().time_since_epoch().count());
    }
    generator.seed(seed);

    createSystems();
}

FieldSimulator::~FieldSimulator() {
    stop();
}

void FieldSimulator::createSystems() {
    systems.clear();

    auto solver = std::make_unique<Systems::OverlapSolver>(config.overlap, config.boundary);
    auto boundary = std::make_unique<Systems::BoundarySystem>(config.boundary);
    overlapSolver = solver.get();
    boundarySystem = boundary.get();

    systems.push_back(std::make_unique<Systems::MovementSystem>());
    systems.push_back(std::make_unique<Systems::RotationSystem>());
    systems.push_back(std::move(solver));
    systems.push_back(std::move(boundary));
}

void FieldSimulator::setProjects(const std::vector<ProjectSeed>& seeds) {
    projects = sanitizeSeeds(seeds);
}

const ProjectSeed* FieldSimulator::findProject(const std::string& id) const {
    for (const auto& p : projects) {
        if (p.id == id) {
            return &p;
        }
    }
    return nullptr;
}

Components::LifecyclePhase FieldSimulator::getPhase() const {
    const Components::FieldState* state = Entities::findFieldState(registry);
    return state ? state->phase : Components::LifecyclePhase::Uninitialized;
}

void FieldSimulator::applyFrame(double width, double height) {
    auto& state = Entities::fieldState(registry);
    state.width = width;
    state.height = height;
    state.label = Collision::labelLayoutFor(width,
                                            config.label.desktopBreakpoint,
                                            config.label.desktop,
                                            config.label.compact);
}

bool FieldSimulator::init(double width, double height) {
    PROFILE_SCOPE("FieldSimulator::init");

    if (!(width > 0.0) || !(height > 0.0)) {
        std::cerr << "[FieldSimulator] init skipped: frame " << width << "x" << height
                  << " has no area" << std::endl;
        return false;
    }

    registry.clear();
    applyFrame(width, height);
    Entities::fieldState(registry).phase = Components::LifecyclePhase::Settling;

    for (std::size_t i = 0; i < projects.size(); ++i) {
        Entities::AsteroidFactory::spawnFromSeed(registry, projects[i], i, width, height,
                                                 generator, config.spawn);
    }

    presolve();
    Entities::fieldState(registry).phase = Components::LifecyclePhase::Live;

    lastWidth = width;
    lastHeight = height;
    lastTimestampMs.reset();
    pendingScale.reset();

    // Fresh bodies always start with hidden labels
    stableWidth = width;
    stableHeight = height;
    stableFrames = 0;
    labelsReady = false;

    interaction.reapplyHover(registry);

    std::cout << "[FieldSimulator] init " << width << "x" << height
              << " with " << projects.size() << " bodies" << std::endl;
    return true;
}

void FieldSimulator::presolve() {
    PROFILE_SCOPE("FieldSimulator::presolve");

    for (int k = 0; k < config.lifecycle.presolveRounds; ++k) {
        overlapSolver->solve(registry, config.lifecycle.presolvePasses);
        boundarySystem->update(registry);
    }
}

void FieldSimulator::step(double frameScale) {
    if (getPhase() != Components::LifecyclePhase::Live) {
        return;
    }
    Entities::fieldState(registry).frameScale = frameScale;

    for (auto& system : systems) {
        system->update(registry);
    }
}

bool FieldSimulator::tick(double timestampMs) {
    PROFILE_SCOPE("FieldSimulator::tick");

    if (getPhase() != Components::LifecyclePhase::Live) {
        return false;
    }

    flushPendingScale(timestampMs);

    double dt = 1.0;
    if (lastTimestampMs) {
        dt = FieldConstants::frameScale(timestampMs - *lastTimestampMs,
                                        config.lifecycle.minFrameScale,
                                        config.lifecycle.maxFrameScale);
    }
    lastTimestampMs = timestampMs;

    if (!config.reducedMotion) {
        step(dt);
    }

    if (!labelsReady) {
        stableFrames += 1;
        if (stableFrames >= config.lifecycle.labelRevealFrames) {
            labelsReady = true;
        }
    }

    DebugStats::recordFrame();
    return true;
}

void FieldSimulator::noteFrameSize(double width, double height) {
    double const threshold = config.lifecycle.labelResetThresholdPixels;
    if (std::abs(width - stableWidth) > threshold || std::abs(height - stableHeight) > threshold) {
        stableWidth = width;
        stableHeight = height;
        stableFrames = 0;
        labelsReady = false;
    }
}

void FieldSimulator::rescale(double width, double height) {
    double const sx = width / lastWidth;
    double const sy = height / lastHeight;

    auto view = registry.view<Components::Position>();
    for (auto &&[entity, pos] : view.each()) {
        pos.x *= sx;
        pos.y *= sy;
    }

    applyFrame(width, height);
    lastWidth = width;
    lastHeight = height;
    noteFrameSize(width, height);

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[FieldSimulator] rescaled by (" << sx << ", " << sy << ")\n");
}

void FieldSimulator::onViewportResize(double width, double height) {
    if (getPhase() == Components::LifecyclePhase::Uninitialized) {
        return;
    }
    if (!(width > 0.0) || !(height > 0.0)) {
        return;
    }
    if (std::abs(width - lastWidth) >= config.lifecycle.resizeThresholdPixels) {
        rescale(width, height);
        return;
    }

    // Jitter (URL bar, keyboard): walls follow the frame, bodies stay put and
    // the rescale reference is kept so slow width creep still triggers later
    applyFrame(width, height);
    noteFrameSize(width, height);
}

bool FieldSimulator::onLayoutResize(double width, double height) {
    if (getPhase() != Components::LifecyclePhase::Uninitialized &&
        std::abs(width - lastWidth) < config.lifecycle.resizeThresholdPixels) {
        return false;
    }
    return init(width, height);
}

void FieldSimulator::onViewportScale(double width, double height, double nowMs) {
    if (getPhase() == Components::LifecyclePhase::Uninitialized) {
        return;
    }
    pendingScale = PendingScale{width, height, nowMs};
}

void FieldSimulator::flushPendingScale(double nowMs) {
    if (!pendingScale) {
        return;
    }
    if (nowMs - pendingScale->requestedAtMs < config.lifecycle.resizeDebounceMs) {
        return;
    }
    PendingScale const request = *pendingScale;
    pendingScale.reset();
    onViewportResize(request.width, request.height);
}

bool FieldSimulator::start(IFrameScheduler& frameScheduler) {
    if (scheduler) {
        std::cerr << "[FieldSimulator] start ignored: already running" << std::endl;
        return false;
    }
    if (getPhase() == Components::LifecyclePhase::Uninitialized) {
        std::cerr << "[FieldSimulator] start ignored: call init() first" << std::endl;
        return false;
    }
    scheduler = &frameScheduler;
    lastTimestampMs.reset();
    scheduleNextFrame();
    return true;
}

void FieldSimulator::stop() {
    if (scheduler && pendingFrame) {
        scheduler->cancelFrame(*pendingFrame);
    }
    pendingFrame.reset();
    scheduler = nullptr;
    pendingScale.reset();
    interaction.clearListeners();
}

void FieldSimulator::scheduleNextFrame() {
    pendingFrame = scheduler->requestFrame([this](double timestampMs) {
        onFrame(timestampMs);
    });
}

void FieldSimulator::onFrame(double timestampMs) {
    pendingFrame.reset();
    tick(timestampMs);

    // tick() never stops the simulator, but a listener fired from the host may have
    if (scheduler) {
        scheduleNextFrame();
    }
}

std::optional<std::string> FieldSimulator::pointerMove(double x, double y) {
    return interaction.handlePointerMove(registry, x, y);
}

std::optional<std::string> FieldSimulator::pointerDown(double x, double y) {
    return interaction.handlePointerDown(registry, x, y);
}

void FieldSimulator::pointerLeave() {
    interaction.handlePointerLeave(registry);
}

FieldSnapshot FieldSimulator::snapshot() const {
    FieldSnapshot snap;
    snap.hoveredId = interaction.getHoveredId();
    snap.labelsVisible = labelsReady;

    const Components::FieldState* state = Entities::findFieldState(registry);
    if (!state) {
        return snap;
    }
    snap.width = state->width;
    snap.height = state->height;
    snap.phase = state->phase;
    snap.label = state->label;

    double const dpr = std::max(1.0, config.devicePixelRatio);
    auto snap_px = [dpr](double v) { return std::round(v * dpr) / dpr; };

    for (auto e : Entities::bodiesInOrder(registry)) {
        const auto& pos = registry.get<Components::Position>(e);
        const auto& rotation = registry.get<Components::Rotation>(e);
        const auto& silhouette = registry.get<Components::Silhouette>(e);
        const auto& radius = registry.get<Components::CollisionRadius>(e);
        const auto& ref = registry.get<Components::ProjectRef>(e);

        BodySnapshot body;
        body.projectId = ref.id;
        body.seedIndex = ref.seedIndex;
        body.position = pos;
        body.rotationDegrees = rotation.degrees;
        body.radius = radius.value;
        body.size = ref.size;
        body.color = ref.color;
        body.hovered = registry.all_of<Components::Hovered>(e);
        body.localSilhouette = silhouette.vertices;
        body.worldSilhouette = Collision::worldSilhouette(silhouette, pos, rotation.degrees);

        Position anchor(pos.x, pos.y + ref.size / 2.0 + state->label.gap);
        if (config.snapLabelsToDevicePixels) {
            anchor.x = snap_px(anchor.x);
            anchor.y = snap_px(anchor.y);
        }
        body.labelAnchor = anchor;

        if (config.debugColliders) {
            body.collider = Collision::mergedCollider(silhouette, pos, rotation.degrees,
                                                      radius.value, state->label);
        }
        snap.bodies.push_back(std::move(body));
    }
    return snap;
}
