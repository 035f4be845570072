// World generator
// Generates a tile world, prints terrain/content statistics and writes a debug PNG

#include "WorldImage.h"
#include "exclusion_zone/config/SettingsJson.h"
#include "exclusion_zone/generation/WorldGenerator.h"
#include "exclusion_zone/utils/Errors.h"
#include "exclusion_zone/world/TileMatrix.h"
#include <SDL3/SDL_log.h>
#include <random>
#include <stdexcept>
#include <string>

using namespace exclusion_zone;

struct ToolConfig {
    size_t size = 1000;
    uint32_t seed = 0;
    bool randomSeed = true;
    std::string configPath;         // Optional JSON overrides
    std::string dumpConfigPath;     // Optional: write the effective settings
    std::string outputPath = "world.png";
    uint32_t scale = 1;             // Pixels per tile
};

void printUsage(const char* programName) {
    SDL_Log("Usage: %s [options]", programName);
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --size <n>            World size in tiles (default: 1000, minimum: %zu)",
            generation::MIN_WORLD_SIZE);
    SDL_Log("  --seed <n>            Noise seed (default: random)");
    SDL_Log("  --config <path>       JSON settings overriding the size-derived defaults (a \"size\" key rescales them)");
    SDL_Log("  --dump-config <path>  Write the effective settings as JSON");
    SDL_Log("  --output <path>       Output PNG path (default: world.png)");
    SDL_Log("  --scale <n>           Pixels per tile (default: 1)");
    SDL_Log("  --help                Show this help");
}

int main(int argc, char* argv[]) {
    ToolConfig options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--size" && i + 1 < argc) {
                options.size = std::stoul(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                options.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
                options.randomSeed = false;
            } else if (arg == "--config" && i + 1 < argc) {
                options.configPath = argv[++i];
            } else if (arg == "--dump-config" && i + 1 < argc) {
                options.dumpConfigPath = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                options.outputPath = argv[++i];
            } else if (arg == "--scale" && i + 1 < argc) {
                options.scale = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown option: %s", arg.c_str());
                printUsage(argv[0]);
                return 1;
            }
        } catch (const std::logic_error&) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid value for %s", arg.c_str());
            return 1;
        }
    }

    if (options.scale == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "--scale must be at least 1");
        return 1;
    }

    if (options.randomSeed) {
        std::random_device device;
        options.seed = device();
    }

    auto settings = generation::WorldGeneratorSettings::defaultFor(options.size, options.seed);
    if (!options.configPath.empty() && !config::loadScaledSettingsJson(options.configPath, settings)) {
        return 1;
    }

    SDL_Log("Exclusion Zone World Generator");
    SDL_Log("==============================");
    SDL_Log("Size: %zu x %zu", settings.size, settings.size);
    SDL_Log("Seed: %u", settings.noise.seed);
    SDL_Log("Threads: %u", utils::getThreadCount());
    SDL_Log("Output: %s", options.outputPath.c_str());

    if (!options.dumpConfigPath.empty() && !config::saveSettingsJson(options.dumpConfigPath, settings)) {
        return 1;
    }

    generation::WorldGenerator generator(settings);
    try {
        auto generated = generator.generate([](float progress, const std::string& status) {
            SDL_Log("[%3.0f%%] %s", progress * 100.0f, status.c_str());
        });

        if (!world::checkWorld(generated.tiles)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Generated world breaks a tile capability rule");
        }

        SDL_Log("Terrain:");
        for (const auto& [type, share] : world::terrainPercentages(generated.tiles)) {
            SDL_Log("  %-14s %6.2f%%", world::getTileTypeName(type), share * 100.0);
        }
        SDL_Log("Content:");
        for (const auto& [kind, share] : world::contentPercentages(generated.tiles)) {
            SDL_Log("  %-14s %6.2f%%", world::getContentKindName(kind), share * 100.0);
        }
        SDL_Log("Spawn point: (%zu, %zu)", generated.spawnPoint.row, generated.spawnPoint.col);

        if (!tools::writeWorldPng(options.outputPath, generated.tiles, generated.spawnPoint, options.scale)) {
            return 1;
        }
    } catch (const ConfigError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid settings: %s", e.what());
        return 1;
    } catch (const GeometryError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Street network failed: %s", e.what());
        return 1;
    }

    SDL_Log("Done!");
    return 0;
}
