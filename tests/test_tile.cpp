// Tests for tile/content property tables, world checks and statistics

#include <doctest/doctest.h>
#include "exclusion_zone/utils/Errors.h"
#include "exclusion_zone/world/EnvironmentalConditions.h"
#include "exclusion_zone/world/TileMatrix.h"
#include <unordered_set>

using namespace exclusion_zone;
using namespace exclusion_zone::world;

TEST_SUITE("Coordinate") {
    TEST_CASE("ordering is row first") {
        CHECK(Coordinate(0, 5) < Coordinate(1, 0));
        CHECK(Coordinate(2, 1) < Coordinate(2, 3));
        CHECK_FALSE(Coordinate(2, 3) < Coordinate(2, 3));
    }

    TEST_CASE("hash works for unordered containers") {
        std::unordered_set<Coordinate, CoordinateHash> set;
        set.insert({1, 2});
        set.insert({1, 2});
        set.insert({2, 1});
        CHECK(set.size() == 2);
    }

    TEST_CASE("manhattan distance") {
        CHECK(manhattanDistance({0, 0}, {3, 4}) == 7);
        CHECK(manhattanDistance({5, 1}, {2, 3}) == 5);
        CHECK(manhattanDistance({4, 4}, {4, 4}) == 0);
    }
}

TEST_SUITE("Grid") {
    TEST_CASE("bounds checks accept negatives") {
        Grid<int> grid(4, 7);
        CHECK(grid.inBounds(0, 0));
        CHECK(grid.inBounds(3, 3));
        CHECK_FALSE(grid.inBounds(-1, 0));
        CHECK_FALSE(grid.inBounds(0, 4));
        CHECK(grid.at(2, 3) == 7);
    }

    TEST_CASE("storage is row-major") {
        Grid<int> grid(3);
        grid.at(1, 2) = 42;
        CHECK(grid.data()[1 * 3 + 2] == 42);
    }
}

TEST_SUITE("TileProperties") {
    TEST_CASE("water tiles only hold water") {
        for (size_t k = 0; k < CONTENT_KIND_COUNT; ++k) {
            ContentKind kind = static_cast<ContentKind>(k);
            bool expected = kind == ContentKind::Water;
            CHECK(canHold(TileType::DeepWater, kind) == expected);
            CHECK(canHold(TileType::ShallowWater, kind) == expected);
        }
    }

    TEST_CASE("lava holds nothing but None") {
        CHECK(canHold(TileType::Lava, ContentKind::None));
        CHECK_FALSE(canHold(TileType::Lava, ContentKind::Fire));
        CHECK_FALSE(canHold(TileType::Lava, ContentKind::Rock));
    }

    TEST_CASE("streets cannot hold trees or fire") {
        CHECK_FALSE(canHold(TileType::Street, ContentKind::Tree));
        CHECK_FALSE(canHold(TileType::Street, ContentKind::Fire));
        CHECK(canHold(TileType::Street, ContentKind::Coin));
    }

    TEST_CASE("walkability") {
        CHECK_FALSE(isWalkable(TileType::DeepWater));
        CHECK_FALSE(isWalkable(TileType::Lava));
        CHECK(isWalkable(TileType::Grass));
        CHECK(isWalkable(TileType::Street));
    }

    TEST_CASE("content maxima") {
        CHECK(maxQuantity(ContentKind::Rock) == 4);
        CHECK(maxQuantity(ContentKind::Tree) == 5);
        CHECK(maxQuantity(ContentKind::Garbage) == 3);
        CHECK(maxQuantity(ContentKind::Fire) == 0);
        CHECK(maxQuantity(ContentKind::Coin) == 10);
        CHECK(maxQuantity(ContentKind::Bin) == 10);
        CHECK(maxQuantity(ContentKind::Crate) == 20);
        CHECK(maxQuantity(ContentKind::Bank) == 50);
        CHECK(maxQuantity(ContentKind::Water) == 20);
    }

    TEST_CASE("content amount follows its kind") {
        CHECK(Content::rock(3).amount() == 3);
        CHECK(Content::bank(utils::Range<uint32_t>(1, 30)).amount() == 30);
        CHECK(Content::fire().amount() == 0);
        CHECK(Content::none().isNone());
        CHECK(Content::coin(2) != Content::coin(3));
    }
}

TEST_SUITE("checkWorld") {
    TEST_CASE("fresh grass world is valid") {
        TileMatrix tiles(8);
        CHECK(checkWorld(tiles));
    }

    TEST_CASE("empty water tiles are valid") {
        TileMatrix tiles(8);
        for (size_t c = 0; c < 8; ++c) {
            tiles.at(0, c).type = TileType::DeepWater;
            tiles.at(1, c).type = TileType::ShallowWater;
        }
        CHECK(canHold(TileType::DeepWater, ContentKind::None));
        CHECK(canHold(TileType::ShallowWater, ContentKind::None));
        CHECK(checkWorld(tiles));
    }

    TEST_CASE("content on a tile that cannot hold it is rejected") {
        TileMatrix tiles(8);
        tiles.at(2, 2).type = TileType::Lava;
        tiles.at(2, 2).content = Content::tree(1);
        CHECK_FALSE(checkWorld(tiles));
    }

    TEST_CASE("quantity above the maximum is rejected") {
        TileMatrix tiles(8);
        tiles.at(1, 1).content = Content::rock(maxQuantity(ContentKind::Rock) + 1);
        CHECK_FALSE(checkWorld(tiles));
    }
}

TEST_SUITE("Percentages") {
    TEST_CASE("shares sum to one") {
        TileMatrix tiles(10);
        for (size_t c = 0; c < 10; ++c) {
            tiles.at(0, c).type = TileType::Sand;
        }
        tiles.at(5, 5).content = Content::coin(1);

        auto terrain = terrainPercentages(tiles);
        CHECK(terrain[TileType::Sand] == doctest::Approx(0.1));
        CHECK(terrain[TileType::Grass] == doctest::Approx(0.9));

        auto content = contentPercentages(tiles);
        CHECK(content[ContentKind::Coin] == doctest::Approx(0.01));
        CHECK(content[ContentKind::None] == doctest::Approx(0.99));
    }

    TEST_CASE("empty world yields no entries") {
        TileMatrix tiles;
        CHECK(terrainPercentages(tiles).empty());
        CHECK(contentPercentages(tiles).empty());
    }
}

TEST_SUITE("EnvironmentalConditions") {
    TEST_CASE("generator default forecast") {
        auto conditions = EnvironmentalConditions::generatorDefault();
        REQUIRE(conditions.getForecast().size() == 5);
        CHECK(conditions.getForecast()[0] == WeatherType::Rainy);
        CHECK(conditions.getForecast()[4] == WeatherType::TrentinoSnow);
        CHECK(conditions.getTickLengthMinutes() == 1);
        CHECK(conditions.getInitialHour() == 9);
    }

    TEST_CASE("invalid values are rejected") {
        CHECK_THROWS_AS(EnvironmentalConditions({}, 1, 9), ConfigError);
        CHECK_THROWS_AS(EnvironmentalConditions({WeatherType::Sunny}, 0, 9), ConfigError);
        CHECK_THROWS_AS(EnvironmentalConditions({WeatherType::Sunny}, 1, 24), ConfigError);
    }
}
