#include "data/value.hpp"
#include "errors/errors.hpp"
#include <catch2/catch_all.hpp>

// NOLINTBEGIN
SCENARIO("Value truthiness", "[data]") {
    GIVEN("Falsy values") {
        THEN("null, false, zero and the empty string are falsy") {
            REQUIRE_FALSE(data::Value{}.truthy());
            REQUIRE_FALSE(data::Value{false}.truthy());
            REQUIRE_FALSE(data::Value{0}.truthy());
            REQUIRE_FALSE(data::Value{0.0}.truthy());
            REQUIRE_FALSE(data::Value{""}.truthy());
        }
    }
    GIVEN("Containers") {
        THEN("They are truthy even when empty") {
            REQUIRE(data::Value{std::make_shared<data::List>()}.truthy());
            REQUIRE(data::Value{std::make_shared<data::Map>()}.truthy());
        }
    }
    GIVEN("A string") {
        THEN("Any text is truthy, including false words") {
            REQUIRE(data::Value{"false"}.truthy());
        }
    }
}

SCENARIO("Value accessors", "[data]") {
    GIVEN("A string value") {
        data::Value value{"text"};
        THEN("Asking for another type fails") {
            REQUIRE_THROWS_AS(value.getInt(), errors::ValueTypeError);
            REQUIRE_THROWS_AS(value.getMap(), errors::ValueTypeError);
        }
    }
    GIVEN("A null container pointer") {
        data::Value value{std::shared_ptr<data::Map>{}};
        THEN("It is a null value") {
            REQUIRE(value.isNull());
        }
    }
}

SCENARIO("Ordered maps", "[data]") {
    GIVEN("A map with entries") {
        auto map = data::Map::of({{"b", 1}, {"a", 2}});
        WHEN("An existing key is replaced") {
            map->put("b", 3);
            THEN("It keeps its position") {
                REQUIRE(map->size() == 2);
                REQUIRE(map->begin()->first == "b");
                REQUIRE(map->get("b").getInt() == 3);
            }
        }
        WHEN("A missing key is read") {
            THEN("It is null") {
                REQUIRE_FALSE(map->hasKey("c"));
                REQUIRE(map->get("c").isNull());
            }
        }
        WHEN("The map is copied") {
            auto copy = map->copy();
            copy->put("c", 4);
            THEN("The original is unchanged") {
                REQUIRE(map->size() == 2);
                REQUIRE(copy->size() == 3);
            }
        }
    }
}
// NOLINTEND
