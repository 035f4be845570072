#include "exclusion_zone/config/SettingsJson.h"
#include <SDL3/SDL_log.h>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace exclusion_zone {
namespace config {

using namespace generation;

namespace {

template<typename T>
json rangeToJson(const utils::Range<T>& range) {
    return json{{"start", range.start}, {"end", range.end}};
}

template<typename T>
void readRange(const json& j, const char* key, utils::Range<T>& range) {
    if (!j.contains(key)) return;
    const auto& r = j[key];
    range.start = r.value("start", range.start);
    range.end = r.value("end", range.end);
}

json blobToJson(const BlobSettings& blob) {
    return json{
        {"tiles", rangeToJson(blob.tiles)},
        {"blobs", rangeToJson(blob.blobs)},
        {"radius", rangeToJson(blob.radius)},
        {"variation", rangeToJson(blob.variation)},
        {"sparsity", blob.sparsity}
    };
}

void readBlob(const json& j, const char* key, BlobSettings& blob) {
    if (!j.contains(key)) return;
    const auto& b = j[key];
    readRange(b, "tiles", blob.tiles);
    readRange(b, "blobs", blob.blobs);
    readRange(b, "radius", blob.radius);
    readRange(b, "variation", blob.variation);
    blob.sparsity = b.value("sparsity", blob.sparsity);
}

void readContainer(const json& j, const char* key, ContainerSettings& container) {
    if (!j.contains(key)) return;
    container.spawnPoints = j[key].value("spawnPoints", container.spawnPoints);
}

} // namespace

json settingsToJson(const WorldGeneratorSettings& settings) {
    json j;
    j["size"] = settings.size;

    j["noise"] = {
        {"seed", settings.noise.seed},
        {"octaves", settings.noise.octaves},
        {"frequency", settings.noise.frequency},
        {"lacunarity", settings.noise.lacunarity},
        {"persistence", settings.noise.persistence},
        {"attenuation", settings.noise.attenuation}
    };

    j["thresholds"] = {
        {"deepWater", settings.thresholds.deepWater},
        {"shallowWater", settings.thresholds.shallowWater},
        {"sand", settings.thresholds.sand},
        {"grass", settings.thresholds.grass},
        {"hill", settings.thresholds.hill},
        {"mountain", settings.thresholds.mountain}
    };

    j["streets"] = {
        {"sliceCount", settings.streets.sliceCount},
        {"lowerThreshold", settings.streets.lowerThreshold},
        {"bandWidth", settings.streets.bandWidth}
    };

    j["lava"] = {
        {"spawnPoints", settings.lava.spawnPoints},
        {"flowRange", rangeToJson(settings.lava.flowRange)}
    };

    j["fire"] = blobToJson(settings.fire);
    j["trees"] = blobToJson(settings.trees);

    j["garbage"] = {
        {"totalQuantity", settings.garbage.totalQuantity},
        {"pileSize", rangeToJson(settings.garbage.pileSize)},
        {"perTileQuantity", rangeToJson(settings.garbage.perTileQuantity)},
        {"spawnProbability", settings.garbage.spawnProbability},
        {"probabilityStep", settings.garbage.probabilityStep}
    };

    j["rocks"] = {
        {"probabilities", settings.rocks.probabilities},
        {"maxRocks", settings.rocks.maxRocks}
    };

    j["coins"] = {{"spawnPoints", settings.coins.spawnPoints}};
    j["bins"] = {{"spawnPoints", settings.bins.spawnPoints}};
    j["crates"] = {{"spawnPoints", settings.crates.spawnPoints}};
    j["banks"] = {{"spawnPoints", settings.banks.spawnPoints}};
    j["water"] = {{"coverage", settings.water.coverage}};

    json order = json::array();
    for (SpawnKind kind : settings.spawnOrder) {
        order.push_back(getSpawnKindName(kind));
    }
    j["spawnOrder"] = order;

    return j;
}

bool loadSettingsJsonString(const std::string& text, WorldGeneratorSettings& settings) {
    WorldGeneratorSettings loaded = settings;

    try {
        json j = json::parse(text);

        loaded.size = j.value("size", loaded.size);

        if (j.contains("noise")) {
            const auto& n = j["noise"];
            loaded.noise.seed = n.value("seed", loaded.noise.seed);
            loaded.noise.octaves = n.value("octaves", loaded.noise.octaves);
            loaded.noise.frequency = n.value("frequency", loaded.noise.frequency);
            loaded.noise.lacunarity = n.value("lacunarity", loaded.noise.lacunarity);
            loaded.noise.persistence = n.value("persistence", loaded.noise.persistence);
            loaded.noise.attenuation = n.value("attenuation", loaded.noise.attenuation);
        }

        if (j.contains("thresholds")) {
            const auto& t = j["thresholds"];
            loaded.thresholds.deepWater = t.value("deepWater", loaded.thresholds.deepWater);
            loaded.thresholds.shallowWater = t.value("shallowWater", loaded.thresholds.shallowWater);
            loaded.thresholds.sand = t.value("sand", loaded.thresholds.sand);
            loaded.thresholds.grass = t.value("grass", loaded.thresholds.grass);
            loaded.thresholds.hill = t.value("hill", loaded.thresholds.hill);
            loaded.thresholds.mountain = t.value("mountain", loaded.thresholds.mountain);
        }

        if (j.contains("streets")) {
            const auto& s = j["streets"];
            loaded.streets.sliceCount = s.value("sliceCount", loaded.streets.sliceCount);
            loaded.streets.lowerThreshold = s.value("lowerThreshold", loaded.streets.lowerThreshold);
            loaded.streets.bandWidth = s.value("bandWidth", loaded.streets.bandWidth);
        }

        if (j.contains("lava")) {
            const auto& l = j["lava"];
            loaded.lava.spawnPoints = l.value("spawnPoints", loaded.lava.spawnPoints);
            readRange(l, "flowRange", loaded.lava.flowRange);
        }

        readBlob(j, "fire", loaded.fire);
        readBlob(j, "trees", loaded.trees);

        if (j.contains("garbage")) {
            const auto& g = j["garbage"];
            loaded.garbage.totalQuantity = g.value("totalQuantity", loaded.garbage.totalQuantity);
            readRange(g, "pileSize", loaded.garbage.pileSize);
            readRange(g, "perTileQuantity", loaded.garbage.perTileQuantity);
            loaded.garbage.spawnProbability = g.value("spawnProbability", loaded.garbage.spawnProbability);
            loaded.garbage.probabilityStep = g.value("probabilityStep", loaded.garbage.probabilityStep);
        }

        if (j.contains("rocks")) {
            const auto& r = j["rocks"];
            loaded.rocks.maxRocks = r.value("maxRocks", loaded.rocks.maxRocks);
            if (r.contains("probabilities")) {
                const auto& p = r["probabilities"];
                if (!p.is_array() || p.size() != loaded.rocks.probabilities.size()) {
                    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                                 "Settings: rocks.probabilities must be an array of %zu numbers",
                                 loaded.rocks.probabilities.size());
                    return false;
                }
                for (size_t i = 0; i < p.size(); ++i) {
                    loaded.rocks.probabilities[i] = p[i].get<double>();
                }
            }
        }

        if (j.contains("coins")) {
            loaded.coins.spawnPoints = j["coins"].value("spawnPoints", loaded.coins.spawnPoints);
        }
        readContainer(j, "bins", loaded.bins);
        readContainer(j, "crates", loaded.crates);
        readContainer(j, "banks", loaded.banks);

        if (j.contains("water")) {
            loaded.water.coverage = j["water"].value("coverage", loaded.water.coverage);
        }

        if (j.contains("spawnOrder")) {
            SpawnOrder order;
            for (const auto& entry : j["spawnOrder"]) {
                std::string name = entry.get<std::string>();
                SpawnKind kind;
                if (!parseSpawnKind(name, kind)) {
                    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Settings: unknown spawn kind '%s'", name.c_str());
                    return false;
                }
                order.push_back(kind);
            }
            loaded.spawnOrder = order;
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Settings: JSON parse error: %s", e.what());
        return false;
    }

    settings = loaded;
    return true;
}

bool loadScaledSettingsJsonString(const std::string& text, WorldGeneratorSettings& settings) {
    WorldGeneratorSettings loaded = settings;
    if (!loadSettingsJsonString(text, loaded)) {
        return false;
    }

    if (loaded.size != settings.size) {
        // Rebuild the size-derived defaults, then let the file override them again
        WorldGeneratorSettings rescaled = WorldGeneratorSettings::defaultFor(loaded.size, loaded.noise.seed);
        if (!loadSettingsJsonString(text, rescaled)) {
            return false;
        }
        SDL_Log("Settings: size changed from %zu to %zu, defaults rescaled", settings.size, loaded.size);
        loaded = rescaled;
    }

    settings = loaded;
    return true;
}

namespace {

bool readTextFile(const std::string& path, std::string& content) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Settings: Failed to open file: %s", path.c_str());
        return false;
    }

    content.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return true;
}

} // namespace

bool loadSettingsJson(const std::string& path, WorldGeneratorSettings& settings) {
    std::string content;
    if (!readTextFile(path, content) || !loadSettingsJsonString(content, settings)) {
        return false;
    }

    SDL_Log("Settings: Loaded %s (size %zu, seed %u)", path.c_str(), settings.size, settings.noise.seed);
    return true;
}

bool loadScaledSettingsJson(const std::string& path, WorldGeneratorSettings& settings) {
    std::string content;
    if (!readTextFile(path, content) || !loadScaledSettingsJsonString(content, settings)) {
        return false;
    }

    SDL_Log("Settings: Loaded %s (size %zu, seed %u)", path.c_str(), settings.size, settings.noise.seed);
    return true;
}

bool saveSettingsJson(const std::string& path, const WorldGeneratorSettings& settings) {
    std::ofstream file(path);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to write settings: %s", path.c_str());
        return false;
    }

    file << settingsToJson(settings).dump(2);
    SDL_Log("Saved settings to: %s", path.c_str());
    return true;
}

} // namespace config
} // namespace exclusion_zone
