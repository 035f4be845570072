// Tests for spawn phase names and ordering

#include <doctest/doctest.h>
#include "exclusion_zone/generation/SpawnOrder.h"

using namespace exclusion_zone::generation;

TEST_SUITE("SpawnOrder") {
    TEST_CASE("default order") {
        SpawnOrder order = defaultSpawnOrder();
        REQUIRE(order.size() == 11);
        CHECK(order.front() == SpawnKind::Street);
        CHECK(order[1] == SpawnKind::Lava);
        CHECK(order[2] == SpawnKind::Water);
        CHECK(order.back() == SpawnKind::Coin);
    }

    TEST_CASE("names parse back to their kind") {
        for (SpawnKind kind : defaultSpawnOrder()) {
            SpawnKind parsed = SpawnKind::Coin;
            REQUIRE(parseSpawnKind(getSpawnKindName(kind), parsed));
            CHECK(parsed == kind);
        }
    }

    TEST_CASE("unknown and wrongly cased names are rejected") {
        SpawnKind parsed = SpawnKind::Street;
        CHECK_FALSE(parseSpawnKind("Volcano", parsed));
        CHECK_FALSE(parseSpawnKind("street", parsed));
        CHECK_FALSE(parseSpawnKind("", parsed));
        CHECK(parsed == SpawnKind::Street);
    }

    TEST_CASE("duplicates keep the first occurrence") {
        SpawnOrder order = {SpawnKind::Rock, SpawnKind::Street, SpawnKind::Rock,
                            SpawnKind::Coin, SpawnKind::Street};
        SpawnOrder result = deduplicateSpawnOrder(order);
        REQUIRE(result.size() == 3);
        CHECK(result[0] == SpawnKind::Rock);
        CHECK(result[1] == SpawnKind::Street);
        CHECK(result[2] == SpawnKind::Coin);
    }

    TEST_CASE("empty order stays empty") {
        CHECK(deduplicateSpawnOrder({}).empty());
    }
}
