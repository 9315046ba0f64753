#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/Observation.hpp"
#include <limits>
#include <stdexcept>

using namespace beergame;
using Catch::Approx;

TEST_CASE("Observation: Positional values map in order", "[observation]") {
    std::vector<double> values = {10.0, 2.0, 5.0, 3.0, 1.0, 2.5};
    Observation obs = Observation::fromArray(values);

    REQUIRE(obs.inventory == 10.0);
    REQUIRE(obs.backorders == 2.0);
    REQUIRE(obs.orders == 5.0);
    REQUIRE(obs.incomingShipments == 3.0);
    REQUIRE(obs.holdingCost == 1.0);
    REQUIRE(obs.backorderCost == 2.5);
    REQUIRE(obs.netInventory() == Approx(8.0));
}

TEST_CASE("Observation: Wrong value count is rejected", "[observation]") {
    std::vector<double> tooFew = {10.0, 2.0, 5.0};
    std::vector<double> tooMany = {1, 2, 3, 4, 5, 6, 7};

    REQUIRE_THROWS_AS(Observation::fromArray(tooFew), std::invalid_argument);
    REQUIRE_THROWS_AS(Observation::fromArray(tooMany), std::invalid_argument);
}

TEST_CASE("Observation: Non-finite values are rejected", "[observation]") {
    std::vector<double> values = {10.0, 0.0, std::numeric_limits<double>::quiet_NaN(), 0.0, 1.0, 2.0};
    REQUIRE_THROWS_AS(Observation::fromArray(values), std::invalid_argument);
}

TEST_CASE("Observation: Keyed and positional forms agree", "[observation]") {
    nlohmann::json keyed = {
        {"inventory", 12.0},
        {"backorders", 1.0},
        {"orders", 4.0},
        {"incoming_shipments", 6.0},
        {"holding_cost", 0.5},
        {"backorder_cost", 1.0}
    };
    std::vector<double> values = {12.0, 1.0, 4.0, 6.0, 0.5, 1.0};

    REQUIRE(Observation::fromJson(keyed).toArray() == Observation::fromArray(values).toArray());
    REQUIRE(Observation::fromJson(nlohmann::json(values)).toArray() == Observation::fromArray(values).toArray());
}

TEST_CASE("Observation: Keyed form accepts camelCase and one-element arrays", "[observation]") {
    nlohmann::json keyed = {
        {"inventory", {7.0}},
        {"backorders", {0.0}},
        {"orders", {3.0}},
        {"incomingShipments", 2.0},
        {"holdingCost", 1.0},
        {"backorderCost", 2.0}
    };

    Observation obs = Observation::fromJson(keyed);
    REQUIRE(obs.inventory == 7.0);
    REQUIRE(obs.orders == 3.0);
    REQUIRE(obs.incomingShipments == 2.0);
}

TEST_CASE("Observation: Missing or malformed keyed fields are rejected", "[observation]") {
    nlohmann::json missing = {
        {"inventory", 7.0},
        {"backorders", 0.0},
        {"incoming_shipments", 2.0},
        {"holding_cost", 1.0},
        {"backorder_cost", 2.0}
    };
    REQUIRE_THROWS_AS(Observation::fromJson(missing), std::invalid_argument);

    nlohmann::json wrongType = missing;
    wrongType["orders"] = "five";
    REQUIRE_THROWS_AS(Observation::fromJson(wrongType), std::invalid_argument);

    REQUIRE_THROWS_AS(Observation::fromJson(nlohmann::json(42)), std::invalid_argument);
}

TEST_CASE("Observation: JSON export uses snake_case keys", "[observation]") {
    Observation obs;
    obs.inventory = 3.0;
    obs.incomingShipments = 4.0;

    auto j = obs.toJson();
    REQUIRE(j["inventory"].get<double>() == 3.0);
    REQUIRE(j["incoming_shipments"].get<double>() == 4.0);
    REQUIRE(Observation::fromJson(j).incomingShipments == 4.0);
}

TEST_CASE("Observation: Validate flags non-finite fields", "[observation]") {
    Observation obs;
    REQUIRE_NOTHROW(obs.validate());

    obs.backorderCost = std::numeric_limits<double>::infinity();
    REQUIRE_THROWS_AS(obs.validate(), std::invalid_argument);
}
