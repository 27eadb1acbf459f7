/**
 * @file demo_manager.cpp
 * @brief Implementation of DemoManager, which drives the field inside an SFML window.
 */

#include "astrofield/app/demo_manager.hpp"

#include <iostream>

#include <SFML/Window/Event.hpp>

#include "astrofield/core/debug.hpp"
#include "astrofield/core/profile.hpp"

DemoManager::DemoManager(const DemoOptions& options)
    : options(options)
    , renderer(options.width, options.height, options.fontPath)
{
}

double DemoManager::nowMs() const {
    return static_cast<double>(clock.getElapsedTime().asMicroseconds()) / 1000.0;
}

bool DemoManager::init() {
    if (!renderer.init()) {
        std::cerr << "Renderer initialization failed." << std::endl;
        return false;
    }

    CatalogType type = CatalogType::PORTFOLIO;
    if (!catalogManager.findByName(options.catalogName, type)) {
        std::cerr << "[Demo] unknown catalog '" << options.catalogName
                  << "', using portfolio" << std::endl;
    }
    selectCatalog(type);
    return simulator != nullptr;
}

void DemoManager::selectCatalog(CatalogType type) {
    if (simulator) {
        simulator->stop();
    }
    selectedId.reset();

    std::unique_ptr<IProjectCatalog> catalog = catalogManager.createCatalog(type);
    FieldConfig config = catalog->getConfig();
    config.reducedMotion = config.reducedMotion || options.reducedMotion;
    config.debugColliders = config.debugColliders || options.debugColliders;

    simulator = std::make_unique<FieldSimulator>(config);
    simulator->setProjects(catalog->getProjects());

    sf::Vector2u const size = renderer.getWindow().getSize();
    if (!simulator->init(size.x, size.y)) {
        simulator.reset();
        return;
    }

    simulator->getInteraction().setSelectionListener([this](const std::string& id) {
        selectedId = id;
        std::cout << "[Demo] selected " << id << std::endl;
    });
    simulator->start(frames);
}

bool DemoManager::handleEvents() {
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event)) {
        switch (event.type) {
            case sf::Event::Closed:
                running = false;
                break;

            case sf::Event::Resized:
                renderer.resize(event.size.width, event.size.height);
                // The window is the container here, so a resize is a layout change.
                // Height-only changes fall below the threshold and only move the walls.
                if (!simulator->onLayoutResize(event.size.width, event.size.height)) {
                    simulator->onViewportResize(event.size.width, event.size.height);
                }
                break;

            case sf::Event::MouseMoved:
                simulator->pointerMove(event.mouseMove.x, event.mouseMove.y);
                break;

            case sf::Event::MouseLeft:
                simulator->pointerLeave();
                break;

            case sf::Event::MouseButtonPressed:
                if (event.mouseButton.button == sf::Mouse::Left) {
                    simulator->pointerDown(event.mouseButton.x, event.mouseButton.y);
                }
                break;

            case sf::Event::KeyPressed:
                switch (event.key.code) {
                    case sf::Keyboard::Escape:
                        if (selectedId) {
                            selectedId.reset();
                        } else {
                            running = false;
                        }
                        break;
                    case sf::Keyboard::R: {
                        sf::Vector2u const size = window.getSize();
                        if (!simulator->init(size.x, size.y)) {
                            std::cerr << "[Demo] reset skipped" << std::endl;
                        }
                        break;
                    }
                    case sf::Keyboard::Num1:
                        selectCatalog(CatalogType::PORTFOLIO);
                        break;
                    case sf::Keyboard::Num2:
                        selectCatalog(CatalogType::CROWDED_BELT);
                        break;
                    default:
                        break;
                }
                break;

            default:
                break;
        }
        if (!simulator) {
            running = false;
            break;
        }
    }
    return running;
}

void DemoManager::render(float fps) {
    renderer.clear();
    renderer.renderField(simulator->snapshot(), simulator->getProjects());
    renderer.renderFPS(fps);
    renderer.renderSelection(selectedId ? simulator->findProject(*selectedId) : nullptr);
    renderer.present();
}

void DemoManager::run() {
    sf::Clock fpsClock;
    sf::Clock statsClock;
    int framesSinceFps = 0;
    float fps = 0.0f;

    while (handleEvents()) {
        frames.runFrame(nowMs());

        framesSinceFps++;
        float const elapsed = fpsClock.getElapsedTime().asSeconds();
        if (elapsed >= 1.0f) {
            fps = static_cast<float>(framesSinceFps) / elapsed;
            framesSinceFps = 0;
            fpsClock.restart();
        }

        render(fps);

        if (options.printStats && statsClock.getElapsedTime().asSeconds() >= 5.0f) {
            Profiling::Profiler::printStats();
            DebugStats::printStats();
            DebugStats::reset();
            statsClock.restart();
        }
    }

    if (simulator) {
        simulator->stop();
    }
}
