// Tests for elevation synthesis and terrain classification

#include <doctest/doctest.h>
#include "exclusion_zone/generation/ElevationField.h"
#include "exclusion_zone/generation/TerrainClassifier.h"
#include <algorithm>
#include <atomic>

using namespace exclusion_zone;
using namespace exclusion_zone::generation;
using world::TileType;

TEST_SUITE("ElevationField") {
    TEST_CASE("same seed gives the same field") {
        NoiseSettings settings = NoiseSettings::fromSeed(7);
        settings.octaves = 4;
        ElevationField a = generateElevationField(32, settings);
        ElevationField b = generateElevationField(32, settings);
        CHECK(a.data() == b.data());
    }

    TEST_CASE("different seeds differ") {
        NoiseSettings s1 = NoiseSettings::fromSeed(1);
        NoiseSettings s2 = NoiseSettings::fromSeed(2);
        s1.octaves = s2.octaves = 4;
        CHECK(generateElevationField(32, s1).data() != generateElevationField(32, s2).data());
    }

    TEST_CASE("progress callback reaches completion") {
        std::atomic<int> calls{0};
        float highest = 0.0f;
        NoiseSettings settings = NoiseSettings::fromSeed(3);
        settings.octaves = 2;
        generateElevationField(64, settings, [&](float progress, const std::string&) {
            ++calls;
            highest = std::max(highest, progress);
        });
        CHECK(calls.load() > 0);
        CHECK(highest == doctest::Approx(1.0f));
    }

    TEST_CASE("empty size gives an empty field") {
        CHECK(generateElevationField(0, NoiseSettings{}).empty());
    }
}

TEST_SUITE("TerrainClassifier") {
    TEST_CASE("percentage maps onto the observed range") {
        ElevationRange range{-1.0, 3.0};
        CHECK(percentageToValue(0.0, range) == doctest::Approx(-1.0));
        CHECK(percentageToValue(50.0, range) == doctest::Approx(1.0));
        CHECK(percentageToValue(100.0, range) == doctest::Approx(3.0));
    }

    TEST_CASE("1x1 zero field with zero thresholds is snow") {
        ElevationField field(1, 0.0);
        TerrainThresholds zero{0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
        auto tiles = classifyTerrain(field, zero);
        REQUIRE(tiles.size() == 1);
        CHECK(tiles.at(0, 0).type == TileType::Snow);
        CHECK(tiles.at(0, 0).content.isNone());
    }

    TEST_CASE("classification is monotonic in the raw value") {
        const size_t size = 20;
        ElevationField field(size);
        for (size_t i = 0; i < size * size; ++i) {
            field.data()[i] = static_cast<double>(i) / static_cast<double>(size * size - 1);
        }
        auto tiles = classifyTerrain(field, TerrainThresholds{});

        for (size_t i = 1; i < size * size; ++i) {
            CHECK(static_cast<int>(tiles.data()[i - 1].type) <= static_cast<int>(tiles.data()[i].type));
        }
        CHECK(tiles.data().front().type == TileType::DeepWater);
        CHECK(tiles.data().back().type == TileType::Snow);
    }

    TEST_CASE("bare classified terrain passes the world check") {
        const size_t size = 100;
        ElevationField field(size);
        for (size_t i = 0; i < size * size; ++i) {
            field.data()[i] = static_cast<double>(i);
        }
        auto tiles = classifyTerrain(field, TerrainThresholds{});

        size_t water = 0;
        for (const auto& tile : tiles.data()) {
            if (tile.type == TileType::DeepWater || tile.type == TileType::ShallowWater) ++water;
        }
        CHECK(water > 0);
        CHECK(world::checkWorld(tiles));
    }

    TEST_CASE("default bands on a linear ramp") {
        ElevationRange range{0.0, 100.0};
        TerrainThresholds t;
        CHECK(classifyValue(3.9, t, range) == TileType::DeepWater);
        CHECK(classifyValue(4.5, t, range) == TileType::ShallowWater);
        CHECK(classifyValue(12.0, t, range) == TileType::Sand);
        CHECK(classifyValue(30.0, t, range) == TileType::Grass);
        CHECK(classifyValue(50.0, t, range) == TileType::Hill);
        CHECK(classifyValue(70.0, t, range) == TileType::Mountain);
        CHECK(classifyValue(80.0, t, range) == TileType::Snow);
    }
}
