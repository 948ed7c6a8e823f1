/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/AppContext.hpp"
#include "core/CoreErrors.hpp"
#include "core/Logger.hpp"
#include "host/HostInterfaces.hpp"
#include "metabolism/MetabolismModule.hpp"
#include "metabolism/MetabolismService.hpp"

#include <SDL3/SDL.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>

namespace {

// Stand-in for a game server: players wander, sprint and rest in turns
class DemoActivitySource : public Lifeline::ActivitySource {
public:
  Lifeline::MovementFlags sample(const std::string& /*worldId*/,
                                 const std::string& playerId) override {
    uint64_t step = m_samples.fetch_add(1, std::memory_order_relaxed);
    Lifeline::MovementFlags flags;
    switch ((step + playerId.size()) % 4) {
    case 0:
      break;
    case 1:
      flags.walking = true;
      break;
    case 2:
      flags.sprinting = true;
      break;
    default:
      throw Lifeline::ActivityClassificationUnavailable("no movement sample for " + playerId);
    }
    return flags;
  }

private:
  std::atomic<uint64_t> m_samples{0};
};

class ConsoleEffectSink : public Lifeline::EffectSink {
public:
  void onEffectChanged(const std::string& worldId, const std::string& playerId,
                       const std::string& effect, bool active) override {
    std::printf("[%s] %s %s %s\n", worldId.c_str(), playerId.c_str(),
                active ? "gained" : "lost", effect.c_str());
  }

  void onStatusLine(const std::string& worldId, const std::string& playerId,
                    const std::string& line) override {
    std::printf("[%s] %s: %s\n", worldId.c_str(), playerId.c_str(), line.c_str());
  }
};

std::filesystem::path defaultBaseDir() {
  char* prefPath = SDL_GetPrefPath("HammerForged", LIFELINE_APP_NAME);
  if (prefPath == nullptr) {
    CORE_WARN(std::string("SDL_GetPrefPath failed: ") + SDL_GetError() +
              "; using the working directory");
    return std::filesystem::current_path() / "lifeline";
  }
  std::filesystem::path base(prefPath);
  SDL_free(prefPath);
  return base;
}

void printUsage(const char* program) {
  std::printf("Usage: %s [--config DIR] [--data DIR] [--world ID] [--players N] "
              "[--seconds N]\n",
              program);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
  std::filesystem::path baseDir = defaultBaseDir();
  std::filesystem::path configDir = baseDir / "config";
  std::filesystem::path dataDir = baseDir / "worlds";
  std::string worldId = "demo-world";
  int playerCount = 3;
  int seconds = 10;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool hasValue = (i + 1 < argc);
    if (arg == "--config" && hasValue) {
      configDir = argv[++i];
    } else if (arg == "--data" && hasValue) {
      dataDir = argv[++i];
    } else if (arg == "--world" && hasValue) {
      worldId = argv[++i];
    } else if (arg == "--players" && hasValue) {
      playerCount = std::atoi(argv[++i]);
    } else if (arg == "--seconds" && hasValue) {
      seconds = std::atoi(argv[++i]);
    } else {
      printUsage(argv[0]);
      return arg == "--help" ? 0 : 2;
    }
  }

  CORE_INFO("Starting " + std::string(LIFELINE_APP_NAME) + " with config " +
            configDir.string() + " and data " + dataDir.string());

  Lifeline::AppContext app(configDir, dataDir);
  app.getServices().add<Lifeline::ActivitySource>(
      "host", std::make_shared<DemoActivitySource>());
  app.getServices().add<Lifeline::EffectSink>("host", std::make_shared<ConsoleEffectSink>());
  app.registerModuleFactory(Lifeline::MetabolismModule::MODULE_ID,
                            []() { return std::make_unique<Lifeline::MetabolismModule>(); });

  if (!app.init()) {
    CORE_CRITICAL("Initialization failed");
    return 1;
  }

  if (!app.onWorldAdded(worldId)) {
    CORE_CRITICAL("World '" + worldId + "' could not be added");
    app.shutdown();
    return 1;
  }
  for (int i = 0; i < playerCount; ++i) {
    app.onPlayerJoin("player-" + std::to_string(i + 1), worldId);
  }

  std::this_thread::sleep_for(std::chrono::seconds(seconds > 0 ? seconds : 0));

  if (auto metabolism = app.getServices().get<Lifeline::MetabolismService>()) {
    metabolism->forceFlush(worldId);
    for (int i = 0; i < playerCount; ++i) {
      std::string playerId = "player-" + std::to_string(i + 1);
      if (auto stats = metabolism->getStats(playerId)) {
        std::printf("%s final:", playerId.c_str());
        for (const auto& [name, stat] : *stats) {
          std::printf(" %s=%.2f", name.c_str(), stat.value);
        }
        std::printf("\n");
      }
    }
  }

  app.onPlayerLeave("player-1");
  app.shutdown();
  CORE_INFO("Shutdown complete");
  return 0;
}
