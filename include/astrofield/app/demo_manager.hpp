/**
 * @fileoverview demo_manager.hpp
 * @brief High-level controller for the interactive asteroid field window.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <SFML/System/Clock.hpp>

#include "astrofield/core/constants.hpp"
#include "astrofield/core/frame_scheduler.hpp"
#include "astrofield/core/simulator.hpp"
#include "astrofield/rendering/field_renderer.hpp"
#include "astrofield/scenarios/catalog_manager.hpp"

/**
 * @brief Command-line switches of the demo
 */
struct DemoOptions {
    std::string catalogName = "portfolio";
    std::string fontPath = "assets/fonts/DejaVuSans.ttf";
    unsigned int width = FieldConstants::DefaultViewportWidth;
    unsigned int height = FieldConstants::DefaultViewportHeight;
    bool reducedMotion = false;
    bool debugColliders = false;
    bool printStats = false;
};

/**
 * @class DemoManager
 * @brief Owns the window, the field and the frame queue, and runs the main loop.
 */
class DemoManager {
 public:
  explicit DemoManager(const DemoOptions& options);

  /**
   * @brief Creates the window, loads the catalog and places the bodies.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs until the window is closed.
   */
  void run();

  /**
   * @brief Processes window, pointer and keyboard events for the current frame.
   * @return false if the application should quit, true otherwise.
   */
  bool handleEvents();

  /**
   * @brief Draws the latest snapshot, labels and status text.
   * @param fps The current frames-per-second.
   */
  void render(float fps);

  /**
   * @brief Replaces the field with a freshly seeded one for another catalog.
   */
  void selectCatalog(CatalogType type);

 private:
  double nowMs() const;

  DemoOptions options;
  FieldRenderer renderer;
  CatalogManager catalogManager;
  FrameQueue frames;
  std::unique_ptr<FieldSimulator> simulator;
  std::optional<std::string> selectedId;

  sf::Clock clock;
  bool running = true;
};
