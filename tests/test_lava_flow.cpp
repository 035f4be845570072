// Tests for the lava flow walk

#include <doctest/doctest.h>
#include "exclusion_zone/generation/LavaFlow.h"
#include "exclusion_zone/utils/Errors.h"

using namespace exclusion_zone;
using namespace exclusion_zone::generation;
using world::Coordinate;
using world::TileType;

namespace {

// Bowl: lowest at the center, rising towards every edge
ElevationField bowlField(size_t size) {
    ElevationField field(size);
    double mid = static_cast<double>(size - 1) / 2.0;
    for (size_t r = 0; r < size; ++r) {
        for (size_t c = 0; c < size; ++c) {
            double dr = static_cast<double>(r) - mid;
            double dc = static_cast<double>(c) - mid;
            field.at(r, c) = dr * dr + dc * dc;
        }
    }
    return field;
}

size_t countLava(const world::TileMatrix& tiles) {
    size_t count = 0;
    for (const auto& tile : tiles.data()) {
        if (tile.type == TileType::Lava) ++count;
    }
    return count;
}

} // namespace

TEST_SUITE("LavaFlow") {
    TEST_CASE("ties prefer up, down, left, right") {
        ElevationField flat(5, 1.0);
        CHECK(lowestNeighbour(flat, {2, 2}) == Coordinate(1, 2));
        CHECK(lowestNeighbour(flat, {0, 2}) == Coordinate(1, 2));
        CHECK(lowestNeighbour(flat, {4, 4}) == Coordinate(3, 4));
    }

    TEST_CASE("lowest neighbour wins even when it is uphill") {
        ElevationField field(3, 5.0);
        field.at(1, 1) = 0.0;
        field.at(1, 2) = 2.0;
        CHECK(lowestNeighbour(field, {1, 1}) == Coordinate(1, 2));
    }

    TEST_CASE("zero steps marks only the start tile and clears its content") {
        world::TileMatrix tiles(5);
        tiles.at(2, 2).type = TileType::Mountain;
        tiles.at(2, 2).content = world::Content::rock(2);

        auto chain = flowFrom(tiles, bowlField(5), {2, 2}, 0);
        REQUIRE(chain.size() == 1);
        CHECK(tiles.at(2, 2).type == TileType::Lava);
        CHECK(tiles.at(2, 2).content.isNone());
        CHECK(countLava(tiles) == 1);
    }

    TEST_CASE("walk descends into the bowl") {
        world::TileMatrix tiles(9);
        auto chain = flowFrom(tiles, bowlField(9), {0, 4}, 4);
        REQUIRE(chain.size() == 5);
        CHECK(chain.back() == Coordinate(4, 4));
        for (size_t i = 1; i < chain.size(); ++i) {
            CHECK(world::manhattanDistance(chain[i - 1], chain[i]) == 1);
        }
    }

    TEST_CASE("range 1..1 marks exactly the chosen mountain tiles") {
        world::TileMatrix tiles(10);
        tiles.at(1, 1).type = TileType::Mountain;
        tiles.at(5, 5).type = TileType::Mountain;
        tiles.at(8, 2).type = TileType::Mountain;

        LavaSettings settings;
        settings.spawnPoints = 5;
        settings.flowRange = utils::Range<size_t>(1, 1);

        utils::Rng rng(11);
        LavaStats stats = spawnLava(tiles, bowlField(10), settings, rng);

        CHECK(stats.chains == 3);
        CHECK(countLava(tiles) == 3);
        CHECK(tiles.at(1, 1).type == TileType::Lava);
        CHECK(tiles.at(5, 5).type == TileType::Lava);
        CHECK(tiles.at(8, 2).type == TileType::Lava);
    }

    TEST_CASE("each chain stays within the flow range end") {
        world::TileMatrix tiles(20);
        ElevationField field = bowlField(20);
        for (size_t start = 1; start <= 4; ++start) {
            for (size_t end = start; end <= 12; end += 3) {
                auto chain = flowFrom(tiles, field, {0, 0}, end - start);
                CHECK(chain.size() <= end);
            }
        }
    }

    TEST_CASE("malformed ranges are rejected") {
        LavaSettings zeroStart;
        zeroStart.flowRange = utils::Range<size_t>(0, 5);
        CHECK_THROWS_AS(validateLavaSettings(zeroStart), ConfigError);

        LavaSettings inverted;
        inverted.flowRange = utils::Range<size_t>(6, 5);
        CHECK_THROWS_AS(validateLavaSettings(inverted), ConfigError);

        CHECK_NOTHROW(validateLavaSettings(LavaSettings::defaultFor(100)));
    }
}
