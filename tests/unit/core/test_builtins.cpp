#include "field/Builtins.hpp"
#include "master/OffsetProvider.hpp"
#include "mesh_fixture.hpp"
#include <catch2/catch_all.hpp>

using namespace gridflow;
using namespace gridflow::field;
using namespace gridflow_test;
using gridflow::master::OffsetProviderScope;

TEST_CASE("neighbor_sum collapses the neighbor axis", "[builtins][reduce]")
{
    const auto offsets = mesh_offsets();
    OffsetProviderScope scope(offsets);

    auto per_edge = neighbor_sum(cell_values()(E2C), E2CDim);
    REQUIRE(per_edge.dims() == Dims{Edge});
    CHECK(values_of(per_edge) ==
          std::vector<double>{5., 7., 7., 8., 3., 4., 9., 11., 13., 14., 11., 7.});

    auto per_cell = neighbor_sum(edge_values()(C2E), C2EDim);
    CHECK(values_of(per_cell) == std::vector<double>{16., 27., 14., 25., 28., 25.});
}

TEST_CASE("max_over and min_over pick extremes along the axis", "[builtins][reduce]")
{
    const auto offsets = mesh_offsets();
    OffsetProviderScope scope(offsets);
    const auto g = edge_values()(C2E);

    CHECK(values_of(max_over(g, C2EDim)) == std::vector<double>{8., 10., 9., 11., 12., 12.});
    CHECK(values_of(min_over(g, C2EDim)) == std::vector<double>{1., 8., 2., 4., 5., 6.});
}

TEST_CASE("Reductions keep remaining axes, origins and broadcast dims", "[builtins][reduce]")
{
    Field<double> f({Cell, K}, {2, 3}, std::vector<double>{1., 2., 3., 4., 5., 6.},
                    {.broadcast_dims = {Cell, K, Edge}, .origin = {{Cell, 4}}});

    auto over_k = neighbor_sum(f, K);
    REQUIRE(over_k.dims() == Dims{Cell});
    CHECK(over_k.range(0) == AxisRange{5, 6});
    CHECK(over_k.broadcast_dims() == Dims{Cell, Edge});
    CHECK(over_k.get({5}) == 9.0);
    CHECK(over_k.get({6}) == 12.0);

    auto over_c = max_over(f, Cell);
    REQUIRE(over_c.dims() == Dims{K});
    CHECK(values_of(over_c) == std::vector<double>{2., 4., 6.});
}

TEST_CASE("Reductions fail on a missing axis", "[builtins][reduce]")
{
    const auto cells = cell_values();
    REQUIRE_THROWS_AS(neighbor_sum(cells, E2CDim), ShapeError);
    REQUIRE_THROWS_AS(max_over(cells, K), ShapeError);
    REQUIRE_THROWS_AS(min_over(cells, Edge), ShapeError);
}

TEST_CASE("Empty reduction axis: zero sum, no extremum", "[builtins][reduce]")
{
    Field<double> f({Cell, E2CDim}, {3, 0});
    auto s = neighbor_sum(f, E2CDim);
    CHECK(values_of(s) == std::vector<double>{0., 0., 0.});
    REQUIRE_THROWS_AS(max_over(f, E2CDim), ShapeError);
    REQUIRE_THROWS_AS(min_over(f, E2CDim), ShapeError);
}

TEST_CASE("broadcast tags fields and scalars with a dimension set", "[builtins][broadcast]")
{
    auto s = broadcast(3.0, {Cell, K});
    CHECK(s.rank() == 0);
    CHECK(s.broadcast_dims() == Dims{Cell, K});

    auto f = broadcast(cell_values(), {Cell, K});
    CHECK(f.dims() == Dims{Cell});
    CHECK(f.broadcast_dims() == Dims{Cell, K});
    REQUIRE_THROWS_AS(broadcast(cell_values(), {K}), ShapeError);

    // a broadcast scalar combines like any other operand
    auto sum = cell_values() + s;
    CHECK(sum.broadcast_dims() == Dims{Cell, K});
    CHECK(values_of(sum) == std::vector<double>{8., 9., 10., 11., 6., 7.});
}
