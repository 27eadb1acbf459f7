#include "astrofield/interaction/pointer_interaction.hpp"

#include <cmath>

#include "astrofield/components/basic.hpp"
#include "astrofield/entities/asteroid_factory.hpp"

PointerInteraction::PointerInteraction(const InteractionConfig& config)
    : interactionConfig(config) {}

std::optional<entt::entity> PointerInteraction::hitTest(const entt::registry& registry,
                                                        double x, double y,
                                                        double padding) {
    for (auto e : Entities::bodiesInOrder(registry)) {
        if (!registry.all_of<Components::Position, Components::CollisionRadius>(e)) {
            continue;
        }
        const auto& pos = registry.get<Components::Position>(e);
        double const r = registry.get<Components::CollisionRadius>(e).value;
        if (std::hypot(x - pos.x, y - pos.y) < r + padding) {
            return e;
        }
    }
    return std::nullopt;
}

void PointerInteraction::setHovered(entt::registry& registry, std::optional<entt::entity> hit) {
    registry.clear<Components::Hovered>();

    std::optional<std::string> next;
    if (hit) {
        registry.emplace<Components::Hovered>(*hit);
        if (const auto* ref = registry.try_get<Components::ProjectRef>(*hit)) {
            next = ref->id;
        }
    }

    if (next != hoveredId) {
        hoveredId = next;
        if (onHover) {
            onHover(hoveredId);
        }
    }
}

std::optional<std::string> PointerInteraction::handlePointerMove(entt::registry& registry, double x, double y) {
    setHovered(registry, hitTest(registry, x, y, interactionConfig.hitPadding));
    return hoveredId;
}

std::optional<std::string> PointerInteraction::handlePointerDown(entt::registry& registry, double x, double y) {
    auto hit = hitTest(registry, x, y, interactionConfig.hitPadding);
    if (!hit) {
        return std::nullopt;
    }
    const auto* ref = registry.try_get<Components::ProjectRef>(*hit);
    if (!ref) {
        return std::nullopt;
    }
    std::string const id = ref->id;
    if (onSelect) {
        onSelect(id);
    }
    return id;
}

void PointerInteraction::handlePointerLeave(entt::registry& registry) {
    setHovered(registry, std::nullopt);
}

void PointerInteraction::reapplyHover(entt::registry& registry) {
    if (!hoveredId) {
        return;
    }
    std::optional<entt::entity> match;
    for (auto e : Entities::bodiesInOrder(registry)) {
        const auto* ref = registry.try_get<Components::ProjectRef>(e);
        if (ref && ref->id == *hoveredId) {
            match = e;
            break;
        }
    }
    setHovered(registry, match);
}

void PointerInteraction::clearListeners() {
    onSelect = nullptr;
    onHover = nullptr;
}
