#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/RollingWindow.hpp"
#include <stdexcept>

using namespace beergame;
using Catch::Approx;

TEST_CASE("RollingWindow: Starts empty", "[window]") {
    RollingWindow<double, 4> w;

    REQUIRE(w.empty());
    REQUIRE(w.size() == 0);
    REQUIRE(w.capacity() == 4);
    REQUIRE(w.sum() == 0.0);
    REQUIRE(w.toVector().empty());
    REQUIRE_THROWS_AS(w.back(), std::out_of_range);
}

TEST_CASE("RollingWindow: Keeps insertion order below capacity", "[window]") {
    RollingWindow<double, 4> w;
    w.push(1.0);
    w.push(2.0);
    w.push(3.0);

    REQUIRE(w.size() == 3);
    REQUIRE_FALSE(w.full());
    REQUIRE(w.front() == 1.0);
    REQUIRE(w.back() == 3.0);
    REQUIRE(w.toVector() == std::vector<double>{1.0, 2.0, 3.0});
}

TEST_CASE("RollingWindow: Evicts oldest when full", "[window]") {
    RollingWindow<double, 4> w;
    for (int i = 1; i <= 6; ++i) {
        w.push(static_cast<double>(i));
    }

    REQUIRE(w.size() == 4);
    REQUIRE(w.full());
    REQUIRE(w.front() == 3.0);
    REQUIRE(w.back() == 6.0);
    REQUIRE(w.toVector() == std::vector<double>{3.0, 4.0, 5.0, 6.0});
    REQUIRE(w.sum() == Approx(18.0));
}

TEST_CASE("RollingWindow: Size never exceeds capacity over long runs", "[window]") {
    RollingWindow<double, 8> w;
    for (int i = 0; i < 1000; ++i) {
        w.push(i * 0.5);
        REQUIRE(w.size() <= 8);
    }
    REQUIRE(w.back() == Approx(999 * 0.5));
    REQUIRE(w.front() == Approx(992 * 0.5));
}

TEST_CASE("RollingWindow: Clear resets contents", "[window]") {
    RollingWindow<double, 2> w;
    w.push(5.0);
    w.push(6.0);
    w.push(7.0);
    w.clear();

    REQUIRE(w.empty());
    w.push(8.0);
    REQUIRE(w.front() == 8.0);
    REQUIRE(w.back() == 8.0);
}
