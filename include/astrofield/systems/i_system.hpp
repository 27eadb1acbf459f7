/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems advancing the asteroid field
 */

#pragma once

#include <entt/entt.hpp>

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * A system is a step function over the registry: it reads the field state
 * and body components and writes the next state back. Systems never touch
 * rendering or host resources.
 */
class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;
};

/**
 * @brief Template for systems carrying their own tunables
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    ConfigurableSystem() = default;
    explicit ConfigurableSystem(const SpecificConfig& config) : specificConfig(config) {}

    /**
     * @brief Sets the system-specific configuration
     *
     * @param config System-specific configuration parameters
     */
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
