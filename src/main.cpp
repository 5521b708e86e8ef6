/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/SimulationConfig.hpp"
#include "managers/SettingsManager.hpp"
#include "managers/TemplateManager.hpp"
#include "utils/JsonReader.hpp"
#include "world/World.hpp"

#include <cstdint>
#include <format>
#include <iostream>
#include <memory>
#include <string>

namespace {

const std::string CONFIG_PATH{"res/config/realmforge.json"};
constexpr uint64_t DEMO_SEED{42};
constexpr int DEMO_DAYS{3};

// Everything the demo owns, torn down in reverse order
struct AppContext {
  Realmforge::SettingsManager settings;
  Realmforge::SimulationConfig config;
  std::shared_ptr<Realmforge::TemplateManager> templates;
  std::unique_ptr<Realmforge::World> world;
};

void printSummary(const Realmforge::WorldSummary &summary) {
  std::cout << std::format("{} | {} | {} locations, {} NPCs ({} active), "
                           "{} queued events\n",
                           summary.name, summary.dateTime,
                           summary.locationCount, summary.npcCount,
                           summary.activeNpcCount, summary.eventsInQueue);
}

} // namespace

// maybe_unused is just a hint to the compiler that the variable is not used.
// with -Wall -Wextra flags
int main([[maybe_unused]] int argc, [[maybe_unused]] char *argv[]) {
  using namespace Realmforge;

  AppContext app;
  if (!app.settings.loadFromFile(CONFIG_PATH)) {
    REALM_WARN("Realmforge", "Failed to load " + CONFIG_PATH + " - using defaults");
  }
  app.config = SimulationConfig::fromSettings(app.settings);

  app.templates = std::make_shared<TemplateManager>();
  if (!app.templates->loadFromDirectory(app.config.dataDirectory)) {
    REALM_CRITICAL("Realmforge",
                   "Could not load template data from " + app.config.dataDirectory);
    return -1;
  }

  try {
    app.world = World::createNew(app.templates, app.config.defaultLocationCount,
                                 DEMO_SEED, "Demo Realm", app.config);
  } catch (const std::exception &e) {
    REALM_CRITICAL("Realmforge", std::format("World generation failed: {}", e.what()));
    return -1;
  }

  World &world = *app.world;
  world.getEvents().subscribe(EventTypeId::ItemCrafted, [](const Event &event) {
    const JsonValue data(event.data);
    std::cout << std::format("[{}] {} crafted {}\n",
                             event.timestamp.value_or(0),
                             data["crafter"].tryAsString().value_or("?"),
                             data["item"]["name"].tryAsString().value_or("?"));
  });
  world.getEvents().subscribe(EventTypeId::DayPassed, [&world](const Event &) {
    std::cout << "-- " << world.getTime().formatDateTime() << " --\n";
  });

  printSummary(world.getSummary());

  size_t failures = 0;
  for (int hour = 0; hour < DEMO_DAYS * 24; ++hour) {
    TickReport report = world.step(60);
    failures += report.failures.size();
  }

  printSummary(world.getSummary());
  for (const auto &event : world.getEvents().getRecentEvents(5)) {
    std::cout << "  " << event << "\n";
  }
  if (failures > 0) {
    REALM_WARN("Realmforge", std::format("{} failures during simulation", failures));
  }

  if (auto path = world.save("demo_realm")) {
    std::cout << "Saved to " << *path << "\n";
  } else {
    REALM_ERROR("Realmforge", "Saving the demo world failed");
    return -1;
  }

  return 0;
}
