#include "field/Dimension.hpp"
#include <catch2/catch_all.hpp>
#include <sstream>
#include <unordered_set>

using namespace gridflow::field;

TEST_CASE("Dimensions compare by name and kind", "[dimension]")
{
    const Dimension Cell{"Cell"};
    const Dimension CellLocal{"Cell", DimensionKind::Local};

    CHECK(Cell == Dimension{"Cell"});
    CHECK(Cell != CellLocal);
    CHECK(Cell != Dimension{"Edge"});
    CHECK(Cell.kind() == DimensionKind::Horizontal);
    CHECK(CellLocal.is_local());

    std::unordered_set<Dimension> set{Cell, CellLocal, Dimension{"Cell"}};
    CHECK(set.size() == 2);
}

TEST_CASE("Dimension printing", "[dimension]")
{
    const Dimension Cell{"Cell"};
    const Dimension K{"K", DimensionKind::Vertical};
    const Dimension E2CDim{"E2CDim", DimensionKind::Local};

    CHECK(to_string(Cell) == "Cell");
    CHECK(to_string(E2CDim) == "E2CDim[local]");
    CHECK(to_string(Dims{Cell, K}) == "(Cell, K[vertical])");

    std::ostringstream os;
    os << E2CDim;
    CHECK(os.str() == "E2CDim[local]");
}

TEST_CASE("Dimension sequence helpers", "[dimension]")
{
    const Dimension Cell{"Cell"}, Edge{"Edge"}, K{"K", DimensionKind::Vertical};

    const Dims cd{Cell, K};
    REQUIRE(axis_index(cd, K).has_value());
    CHECK(*axis_index(cd, K) == 1);
    CHECK_FALSE(axis_index(cd, Edge).has_value());

    CHECK(contains(cd, Cell));
    CHECK(is_subset(Dims{K}, cd));
    CHECK_FALSE(is_subset(Dims{Edge}, cd));
    CHECK(is_subset(Dims{}, cd));

    CHECK(has_duplicates(Dims{Cell, K, Cell}));
    CHECK_FALSE(has_duplicates(cd));

    // first-seen order
    CHECK(merge_dims(Dims{K, Edge}, Dims{Cell, K}) == Dims{K, Edge, Cell});
}
