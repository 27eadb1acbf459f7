/**
 * @file pointer_interaction.hpp
 * @brief Pointer hit testing and hover/selection dispatch for asteroids
 */
#pragma once

#include <functional>
#include <optional>
#include <string>

#include <entt/entt.hpp>

/**
 * @struct InteractionConfig
 * @brief Tunables for pointer hit testing
 */
struct InteractionConfig {
    // Added to the collision radius so small rocks stay easy to hit
    double hitPadding = 12.0;
};

/**
 * @class PointerInteraction
 * @brief Turns pointer coordinates into hovered and selected project ids
 *
 * Bodies are approximated by circles of radius collisionRadius + hitPadding.
 * The first body in definition order wins when circles overlap. The hovered
 * body carries the Components::Hovered tag for the renderer.
 */
class PointerInteraction {
public:
    using SelectionListener = std::function<void(const std::string& projectId)>;
    using HoverListener = std::function<void(const std::optional<std::string>& projectId)>;

    explicit PointerInteraction(const InteractionConfig& config = InteractionConfig());

    /**
     * @brief Finds the first body whose padded circle contains the point
     *
     * @param registry Registry holding the bodies
     * @param x Pointer x in container pixels
     * @param y Pointer y in container pixels
     * @param padding Extra radius added to every body
     * @return The hit entity, or std::nullopt
     */
    static std::optional<entt::entity> hitTest(const entt::registry& registry,
                                               double x, double y,
                                               double padding);

    /**
     * @brief Updates the hovered body; notifies the hover listener on change
     * @return Id of the hovered project, if any
     */
    std::optional<std::string> handlePointerMove(entt::registry& registry, double x, double y);

    /**
     * @brief Selects the project under the pointer, if any
     * @return Id of the selected project, if any
     */
    std::optional<std::string> handlePointerDown(entt::registry& registry, double x, double y);

    /**
     * @brief Clears hover when the pointer leaves the container
     */
    void handlePointerLeave(entt::registry& registry);

    /**
     * @brief Re-tags the body of the hovered project after bodies were re-created
     *
     * Hover is tracked by project id, so it survives re-initialisation. If
     * the project no longer exists the hover is dropped and listeners are
     * notified.
     */
    void reapplyHover(entt::registry& registry);

    const std::optional<std::string>& getHoveredId() const { return hoveredId; }

    void setSelectionListener(SelectionListener listener) { onSelect = std::move(listener); }
    void setHoverListener(HoverListener listener) { onHover = std::move(listener); }

    /**
     * @brief Deregisters both listeners
     */
    void clearListeners();

private:
    void setHovered(entt::registry& registry, std::optional<entt::entity> hit);

    InteractionConfig interactionConfig;
    std::optional<std::string> hoveredId;
    SelectionListener onSelect;
    HoverListener onHover;
};
