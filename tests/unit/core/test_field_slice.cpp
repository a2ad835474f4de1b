#include "field/Field.hpp"
#include "mesh_fixture.hpp"
#include <catch2/catch_all.hpp>

using namespace gridflow;
using namespace gridflow::field;
using namespace gridflow_test;

namespace
{

Field<double> numbered()
{
    // value = 10*cell + k
    Field<double> f({Cell, K}, {4, 3});
    for (int c = 1; c <= 4; ++c)
        for (int k = 1; k <= 3; ++k)
            f.set({c, k}, 10.0 * c + k);
    return f;
}

} // namespace

TEST_CASE("Scalar selectors drop axes, range selectors keep them", "[field][slice]")
{
    const auto f = numbered();

    auto col = f.slice({Sel::at(2), Sel::all()});
    REQUIRE(col.dims() == Dims{K});
    CHECK(values_of(col) == std::vector<double>{21., 22., 23.});

    auto block = f.slice({Sel::range(2, 3), Sel::range(2, 3)});
    REQUIRE(block.dims() == Dims{Cell, K});
    CHECK(block.extents() == std::vector<int>{2, 2});
    // re-based to origin 0
    CHECK(block.get({1, 1}) == 22.0);
    CHECK(block.get({2, 2}) == 33.0);

    auto point = f.slice({Sel::at(4), Sel::at(1)});
    CHECK(point.rank() == 0);
    CHECK(point.get(std::span<const int>{}) == 41.0);
}

TEST_CASE("Slices are views onto the parent storage", "[field][slice]")
{
    auto f = numbered();
    auto col = f.slice({Sel::all(), Sel::at(3)});
    REQUIRE(col.shares_storage_with(f));

    col.set({2}, -1.0);
    CHECK(f.get({2, 3}) == -1.0);
}

TEST_CASE("Slices keep the broadcast dims and honour origins", "[field][slice]")
{
    Field<double> f({Cell, K}, {2, 3}, {.broadcast_dims = {Cell, K, Edge}, .origin = {{K, 1}}});
    f.set({1, 4}, 5.0);

    auto s = f.slice({Sel::all(), Sel::range(3, 4)});
    CHECK(s.broadcast_dims() == Dims{Cell, K, Edge});
    CHECK(s.range(1).lo == 1);
    CHECK(s.get({1, 2}) == 5.0);

    REQUIRE_THROWS_AS(f.slice({Sel::all(), Sel::range(1, 2)}), IndexError);
    REQUIRE_THROWS_AS(f.slice({Sel::all(), Sel::range(4, 3)}), IndexError);
    REQUIRE_THROWS_AS(f.slice({Sel::all()}), ShapeError);
}

TEST_CASE("broadcast_to widens the broadcast set without touching data", "[field][broadcast]")
{
    auto f = numbered();
    auto b = f.broadcast_to({Cell, K, Edge});
    CHECK(b.dims() == Dims{Cell, K});
    CHECK(b.broadcast_dims() == Dims{Cell, K, Edge});
    CHECK(b.shares_storage_with(f));

    REQUIRE_THROWS_AS(f.broadcast_to({Cell, Edge}), ShapeError);
}

TEST_CASE("astype and copy produce independent storage", "[field]")
{
    auto f = numbered().slice({Sel::range(2, 3), Sel::all()});

    auto c = f.copy();
    REQUIRE_FALSE(c.shares_storage_with(f));
    CHECK(c.get({1, 2}) == 22.0);
    c.set({1, 2}, 0.0);
    CHECK(f.get({1, 2}) == 22.0);

    auto i = f.astype<std::int64_t>();
    CHECK(i.get({2, 3}) == 33);
    CHECK(i.dims() == f.dims());
}

TEST_CASE("copy_field requires equal dims and extents", "[field][copy]")
{
    Field<double> target({Cell}, {3}, {.origin = {{Cell, 5}}});
    Field<std::int64_t> source({Cell}, {3}, std::vector<std::int64_t>{1, 2, 3});

    // positional copy; origins may differ
    copy_field(target, source);
    CHECK(target.get({6}) == 1.0);
    CHECK(target.get({8}) == 3.0);

    Field<double> wrong_len({Cell}, {4});
    Field<double> wrong_dim({Edge}, {3});
    REQUIRE_THROWS_AS(copy_field(target, wrong_len), ShapeError);
    REQUIRE_THROWS_AS(copy_field(target, wrong_dim), ShapeError);
    CHECK(target.get({6}) == 1.0);
}
