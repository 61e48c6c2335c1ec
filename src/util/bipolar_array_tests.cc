#include "util/bipolar_array.hpp"

#include <doctest.h>

using namespace yamlview;

TEST_CASE("BipolarArray") {
    SUBCASE("negative and positive diagonals") {
        BipolarArray<uint32_t> v(-1, 1);
        v[0] = 7;
        v[-1] = 3;

        REQUIRE(v[0] == 7);
        REQUIRE(v[-1] == 3);
        REQUIRE(v[1] == 0);
    }

    SUBCASE("full range") {
        BipolarArray<int64_t> v(-5, 5);
        for (int64_t k = -5; k <= 5; k++) {
            v[k] = k * 2;
        }
        for (int64_t k = -5; k <= 5; k++) {
            CHECK(v[k] == k * 2);
        }
        REQUIRE(v.min() == -5);
        REQUIRE(v.max() == 5);
    }

    SUBCASE("snapshot is independent") {
        BipolarArray<int> v(-2, 2);
        v[1] = 4;
        auto snapshot = v;
        v[1] = 9;
        REQUIRE(snapshot[1] == 4);
        REQUIRE(v[1] == 9);
    }
}
