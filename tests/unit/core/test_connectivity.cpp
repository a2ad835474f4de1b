#include "field/Connectivity.hpp"
#include "master/Errors.hpp"
#include "mesh_fixture.hpp"
#include <catch2/catch_all.hpp>

using namespace gridflow;
using namespace gridflow::field;
using namespace gridflow_test;

TEST_CASE("Connectivity stores rows of 1-based neighbor indices", "[connectivity]")
{
    const auto conn = e2c();
    CHECK(conn.source() == Cell);
    CHECK(conn.target() == Edge);
    CHECK(conn.rows() == 12);
    CHECK(conn.max_neighbors() == 2);
    CHECK(conn.at(1, 1) == 1);
    CHECK(conn.at(1, 2) == kNoNeighbor);
    CHECK(conn.at(7, 2) == 6);
    CHECK(conn.at(12, 1) == 5);
}

TEST_CASE("Connectivity rejects malformed tables", "[connectivity]")
{
    REQUIRE_THROWS_AS(Connectivity({{1, 2}, {3}}, Cell, Edge, 2), ShapeError);
    REQUIRE_THROWS_AS(Connectivity({{1}}, Cell, Edge, 0), ConnectivityError);

    // an empty table is a valid connectivity with no rows
    Connectivity empty({}, Cell, Edge, 3);
    CHECK(empty.rows() == 0);
}

TEST_CASE("FieldOffset targets: first any kind, the rest local", "[connectivity][offset]")
{
    CHECK(E2C.name() == "E2C");
    CHECK(E2C.source() == Cell);
    CHECK(E2C.target() == Dims{Edge, E2CDim});
    CHECK(Koff.target() == Dims{K});

    REQUIRE_THROWS_AS(FieldOffset("bad", Cell, Dims{Edge, Vertex}), ShapeError);
    REQUIRE_THROWS_AS(FieldOffset("none", Cell, Dims{}), ShapeError);

    const auto slot = E2C[2];
    CHECK(slot.slot == 2);
    CHECK(slot.offset.name() == "E2C");
}
