#include "field/Ops.hpp"
#include "mesh_fixture.hpp"
#include <catch2/catch_all.hpp>
#include <cmath>

using namespace gridflow::field;
using namespace gridflow_test;

TEST_CASE("Arithmetic on equal shapes is elementwise", "[ops]")
{
    Field<double> a({Cell}, {3}, std::vector<double>{1., 2., 3.});
    Field<double> b({Cell}, {3}, std::vector<double>{10., 20., 30.});

    CHECK(values_of(a + b) == std::vector<double>{11., 22., 33.});
    CHECK(values_of(b - a) == std::vector<double>{9., 18., 27.});
    CHECK(values_of(a * 2.0) == std::vector<double>{2., 4., 6.});
    CHECK(values_of(6.0 / a) == std::vector<double>{6., 3., 2.});
    CHECK(values_of(-a) == std::vector<double>{-1., -2., -3.});
}

TEST_CASE("Operands are broadcast along missing dims", "[ops][broadcast]")
{
    Field<double> c({Cell}, {2}, std::vector<double>{1., 2.});
    Field<double> k({K}, {3}, std::vector<double>{100., 200., 300.});

    auto s = c + k;
    REQUIRE(s.dims() == Dims{Cell, K});
    CHECK(s.extents() == std::vector<int>{2, 3});
    CHECK(s.get({1, 1}) == 101.0);
    CHECK(s.get({2, 3}) == 302.0);
}

TEST_CASE("Operands are aligned by external index", "[ops][origin]")
{
    // a over K 1..4, b over K 3..5
    Field<double> a({K}, {4}, std::vector<double>{1., 2., 3., 4.});
    Field<double> b({K}, {3}, std::vector<double>{10., 20., 30.}, {.origin = {{K, 2}}});

    auto s = a + b;
    REQUIRE(s.range(0) == AxisRange{3, 4});
    CHECK(s.get({3}) == 13.0);
    CHECK(s.get({4}) == 24.0);

    Field<double> far({K}, {2}, {.origin = {{K, 10}}});
    CHECK((a + far).size() == 0);
}

TEST_CASE("Mixed element types promote like C++ arithmetic", "[ops]")
{
    Field<std::int64_t> i({Cell}, {2}, std::vector<std::int64_t>{1, 2});
    auto d = i * 0.5;
    STATIC_REQUIRE(std::is_same_v<decltype(d), Field<double>>);
    CHECK(values_of(d) == std::vector<double>{0.5, 1.0});
}

TEST_CASE("Comparisons and logic produce boolean fields", "[ops]")
{
    Field<double> a({Cell}, {4}, std::vector<double>{-1., 0., 1., 2.});

    auto pos = greater(a, 0.0);
    CHECK(values_of(pos) == std::vector<bool>{false, false, true, true});
    CHECK(values_of(less_equal(a, 0.0)) == std::vector<bool>{true, true, false, false});
    CHECK(values_of(equal(a, 1.0)) == std::vector<bool>{false, false, true, false});
    CHECK(values_of(logical_and(pos, less(a, 2.0))) ==
          std::vector<bool>{false, false, true, false});
    CHECK(values_of(logical_or(pos, equal(a, -1.0))) ==
          std::vector<bool>{true, false, true, true});
    CHECK(values_of(logical_not(pos)) == std::vector<bool>{true, true, false, false});
}

TEST_CASE("map, minimum and maximum", "[ops]")
{
    Field<double> a({Cell}, {3}, std::vector<double>{0., 4., 9.});
    auto r = map(a, [](double x) { return std::sqrt(x); });
    CHECK(values_of(r) == std::vector<double>{0., 2., 3.});

    CHECK(values_of(minimum(a, 5.0)) == std::vector<double>{0., 4., 5.});
    CHECK(values_of(maximum(a, 5.0)) == std::vector<double>{5., 5., 9.});
}
