// Tests for generator settings JSON load/save

#include <doctest/doctest.h>
#include "exclusion_zone/config/SettingsJson.h"
#include <cstdio>
#include <filesystem>
#include <string>

using namespace exclusion_zone;
using namespace exclusion_zone::generation;

TEST_SUITE("SettingsJson") {
    TEST_CASE("present keys override, missing keys keep their value") {
        WorldGeneratorSettings settings = WorldGeneratorSettings::defaultFor(200, 9);
        const size_t coinsBefore = settings.coins.spawnPoints;

        const char* text = R"({
            "size": 300,
            "noise": {"seed": 77, "octaves": 6},
            "lava": {"flowRange": {"start": 2, "end": 40}},
            "fire": {"sparsity": 0.25, "radius": {"end": 5.5}},
            "water": {"coverage": 0.5}
        })";

        REQUIRE(config::loadSettingsJsonString(text, settings));
        CHECK(settings.size == 300);
        CHECK(settings.noise.seed == 77);
        CHECK(settings.noise.octaves == 6);
        CHECK(settings.noise.frequency == doctest::Approx(2.5));
        CHECK(settings.lava.flowRange == utils::Range<size_t>(2, 40));
        CHECK(settings.fire.sparsity == doctest::Approx(0.25));
        CHECK(settings.fire.radius.end == doctest::Approx(5.5));
        CHECK(settings.water.coverage == doctest::Approx(0.5));
        CHECK(settings.coins.spawnPoints == coinsBefore);
    }

    TEST_CASE("spawn order is read by name") {
        WorldGeneratorSettings settings;
        REQUIRE(config::loadSettingsJsonString(R"({"spawnOrder": ["Rock", "Street", "Rock"]})", settings));
        REQUIRE(settings.spawnOrder.size() == 3);
        CHECK(settings.spawnOrder[0] == SpawnKind::Rock);
        CHECK(settings.spawnOrder[1] == SpawnKind::Street);
    }

    TEST_CASE("failures leave the settings untouched") {
        WorldGeneratorSettings settings = WorldGeneratorSettings::defaultFor(150, 1);

        CHECK_FALSE(config::loadSettingsJsonString("{ not json", settings));
        CHECK_FALSE(config::loadSettingsJsonString(R"({"size": 500, "spawnOrder": ["Volcano"]})", settings));
        CHECK_FALSE(config::loadSettingsJsonString(R"({"size": 500, "rocks": {"probabilities": [0.1, 0.2]}})", settings));
        CHECK_FALSE(config::loadSettingsJsonString(R"({"size": "large"})", settings));

        CHECK(settings.size == 150);
        CHECK(settings.spawnOrder == defaultSpawnOrder());
    }

    TEST_CASE("a new size rescales the size-derived defaults") {
        WorldGeneratorSettings settings = WorldGeneratorSettings::defaultFor(1000, 4);
        REQUIRE(config::loadScaledSettingsJsonString(R"({"size": 200, "noise": {"seed": 12}, "coins": {"spawnPoints": 7}})", settings));

        WorldGeneratorSettings expected = WorldGeneratorSettings::defaultFor(200, 12);
        CHECK(settings.size == 200);
        CHECK(settings.noise.seed == 12);
        CHECK(settings.coins.spawnPoints == 7);
        CHECK(settings.lava.spawnPoints == expected.lava.spawnPoints);
        CHECK(settings.lava.flowRange == expected.lava.flowRange);
        CHECK(settings.trees.blobs == expected.trees.blobs);
        CHECK(settings.garbage.totalQuantity == expected.garbage.totalQuantity);
        CHECK(settings.rocks.maxRocks == expected.rocks.maxRocks);
        CHECK(settings.streets.bandWidth == expected.streets.bandWidth);
    }

    TEST_CASE("same size keeps the current defaults") {
        WorldGeneratorSettings settings = WorldGeneratorSettings::defaultFor(300, 4);
        settings.garbage.totalQuantity = 5;
        REQUIRE(config::loadScaledSettingsJsonString(R"({"size": 300})", settings));
        CHECK(settings.garbage.totalQuantity == 5);
        CHECK_FALSE(config::loadScaledSettingsJsonString("{ not json", settings));
    }

    TEST_CASE("missing file fails") {
        WorldGeneratorSettings settings;
        CHECK_FALSE(config::loadSettingsJson("/nonexistent/settings.json", settings));
    }

    TEST_CASE("saved settings load back") {
        WorldGeneratorSettings saved = WorldGeneratorSettings::defaultFor(250, 31337);
        saved.rocks.probabilities[2] = 0.33;
        saved.spawnOrder = {SpawnKind::Water, SpawnKind::Coin};
        saved.garbage.pileSize = utils::Range<size_t>(5, 11);

        std::string path = (std::filesystem::temp_directory_path() / "exclusion_zone_settings_test.json").string();
        REQUIRE(config::saveSettingsJson(path, saved));

        WorldGeneratorSettings loaded;
        REQUIRE(config::loadSettingsJson(path, loaded));
        std::remove(path.c_str());

        CHECK(loaded.size == 250);
        CHECK(loaded.noise.seed == 31337);
        CHECK(loaded.rocks.probabilities[2] == doctest::Approx(0.33));
        CHECK(loaded.garbage.pileSize == saved.garbage.pileSize);
        CHECK(loaded.trees.blobs == saved.trees.blobs);
        CHECK(loaded.streets.bandWidth == saved.streets.bandWidth);
        CHECK(loaded.spawnOrder == saved.spawnOrder);
        CHECK(config::settingsToJson(loaded) == config::settingsToJson(saved));
    }
}
