// End-to-end tests for the world generator

#include <doctest/doctest.h>
#include "exclusion_zone/generation/WorldGenerator.h"
#include "exclusion_zone/utils/Errors.h"
#include <algorithm>
#include <limits>
#include <string>

using namespace exclusion_zone;
using namespace exclusion_zone::generation;
using world::ContentKind;
using world::TileType;

namespace {

// Defaults for a small world with a street cutoff every slice peak passes
WorldGeneratorSettings smallWorld(uint32_t seed) {
    WorldGeneratorSettings settings = WorldGeneratorSettings::defaultFor(MIN_WORLD_SIZE, seed);
    settings.streets.lowerThreshold = std::numeric_limits<double>::lowest();
    return settings;
}

size_t countType(const world::TileMatrix& tiles, TileType type) {
    size_t count = 0;
    for (const auto& tile : tiles.data()) {
        if (tile.type == type) ++count;
    }
    return count;
}

} // namespace

TEST_SUITE("WorldGenerator") {
    TEST_CASE("worlds below the minimum size are rejected") {
        WorldGeneratorSettings settings = smallWorld(1);
        settings.size = MIN_WORLD_SIZE - 1;
        WorldGenerator generator(settings);
        CHECK_THROWS_AS(generator.generate(), ConfigError);
        CHECK(generator.getStage() == GenerationStage::Idle);
    }

    TEST_CASE("generated world is consistent") {
        WorldGenerator generator(smallWorld(42));
        GeneratedWorld generated = generator.generate();

        CHECK(generator.getStage() == GenerationStage::Done);
        REQUIRE(generated.tiles.size() == MIN_WORLD_SIZE);
        CHECK(generator.getElevationField().size() == MIN_WORLD_SIZE);
        CHECK(world::checkWorld(generated.tiles));
        CHECK(countType(generated.tiles, TileType::Street) > 0);
        CHECK(world::isWalkable(generated.tiles.at(generated.spawnPoint).type));
    }

    TEST_CASE("same settings give the same world") {
        GeneratedWorld a = WorldGenerator(smallWorld(7)).generate();
        GeneratedWorld b = WorldGenerator(smallWorld(7)).generate();

        REQUIRE(a.tiles.data().size() == b.tiles.data().size());
        bool identical = true;
        for (size_t i = 0; i < a.tiles.data().size(); ++i) {
            if (a.tiles.data()[i].type != b.tiles.data()[i].type ||
                a.tiles.data()[i].content != b.tiles.data()[i].content) {
                identical = false;
                break;
            }
        }
        CHECK(identical);
        CHECK(a.spawnPoint == b.spawnPoint);
    }

    TEST_CASE("empty spawn order leaves bare terrain") {
        WorldGeneratorSettings settings = smallWorld(3);
        settings.spawnOrder.clear();
        GeneratedWorld generated = WorldGenerator(settings).generate();

        CHECK(countType(generated.tiles, TileType::Street) == 0);
        CHECK(countType(generated.tiles, TileType::Lava) == 0);
        for (const auto& tile : generated.tiles.data()) {
            CHECK(tile.content.isNone());
        }
    }

    TEST_CASE("only phases in the order are validated") {
        WorldGeneratorSettings settings = smallWorld(3);
        settings.lava.flowRange = utils::Range<size_t>(0, 5);

        settings.spawnOrder = {SpawnKind::Street, SpawnKind::Coin};
        CHECK_NOTHROW(validateWorldSettings(settings));

        settings.spawnOrder.push_back(SpawnKind::Lava);
        CHECK_THROWS_AS(validateWorldSettings(settings), ConfigError);
    }

    TEST_CASE("streets overwrite earlier content when ordered last") {
        WorldGeneratorSettings settings = smallWorld(11);
        settings.spawnOrder = {SpawnKind::Tree, SpawnKind::Street};
        GeneratedWorld generated = WorldGenerator(settings).generate();

        for (const auto& tile : generated.tiles.data()) {
            if (tile.type == TileType::Street) {
                CHECK(tile.content.kind != ContentKind::Tree);
            }
        }
        CHECK(world::checkWorld(generated.tiles));
    }

    TEST_CASE("progress ends at completion") {
        float highest = 0.0f;
        float last = 0.0f;
        WorldGenerator generator(smallWorld(5));
        generator.generate([&](float progress, const std::string&) {
            highest = std::max(highest, progress);
            last = progress;
        });
        CHECK(highest == doctest::Approx(1.0f));
        CHECK(last == doctest::Approx(1.0f));
    }

    TEST_CASE("default conditions accompany every world") {
        GeneratedWorld generated = WorldGenerator(smallWorld(2)).generate();
        auto expected = world::EnvironmentalConditions::generatorDefault();
        CHECK(generated.conditions.getForecast() == expected.getForecast());
        CHECK(generated.conditions.getTickLengthMinutes() == expected.getTickLengthMinutes());
        CHECK(generated.conditions.getInitialHour() == expected.getInitialHour());
    }
}

TEST_SUITE("SpawnPoint") {
    TEST_CASE("first walkable tile in row-major order") {
        world::TileMatrix tiles(5, world::Tile{TileType::DeepWater, world::Content{}});
        tiles.at(3, 1).type = TileType::Sand;
        tiles.at(2, 4).type = TileType::Lava;
        tiles.at(4, 0).type = TileType::Grass;
        CHECK(findSpawnPoint(tiles) == world::Coordinate(3, 1));
    }

    TEST_CASE("no walkable tile falls back to the origin") {
        world::TileMatrix tiles(5, world::Tile{TileType::Lava, world::Content{}});
        CHECK(findSpawnPoint(tiles) == world::Coordinate(0, 0));
    }
}

TEST_SUITE("GenerationStage") {
    TEST_CASE("stage names") {
        CHECK(std::string(getGenerationStageName(GenerationStage::Idle)) == "Idle");
        CHECK(std::string(getGenerationStageName(GenerationStage::Done)) == "Done");
    }
}
