#include "field/Builtins.hpp"
#include "lang/Interpreter.hpp"
#include "master/FieldOperator.hpp"
#include "mesh_fixture.hpp"
#include <catch2/catch_all.hpp>
#include <memory>
#include <tuple>

using namespace gridflow;
using namespace gridflow::field;
using namespace gridflow::master;
using namespace gridflow_test;

namespace
{

const std::vector<double> kEdgeSums{5., 7., 7., 8., 3., 4., 9., 11., 13., 14., 11., 7.};

auto make_add()
{
    return make_field_operator("add", [](const Field<double>& a, const Field<double>& b)
                               { return a + b; });
}

Field<double> filled_edges(double v)
{
    Field<double> out({Edge}, {12});
    for (int e = 1; e <= 12; ++e)
        out.set({e}, v);
    return out;
}

} // namespace

TEST_CASE("Outermost calls require an out field", "[operator][context]")
{
    const auto add = make_add();
    const auto c = cell_values();

    REQUIRE_THROWS_AS(add(c, c), ContextError);
    REQUIRE_THROWS_AS(add.call(Invocation<Field<double>>{}, c, c), ContextError);
    CHECK(active_offset_provider() == nullptr);

    try
    {
        add(c, c);
        FAIL("expected ContextError");
    }
    catch (const ContextError& e)
    {
        CHECK(std::string(e.what()) == "Must provide an out field to the outermost call of add");
    }
}

TEST_CASE("Outermost call writes the result into out", "[operator]")
{
    const auto add = make_add();
    Field<double> a({Cell}, {3}, std::vector<double>{1., 2., 3.});
    Field<double> out({Cell}, {3});

    const auto r = add.call(into(out), a, a);
    CHECK_FALSE(r.has_value());
    CHECK(values_of(out) == std::vector<double>{2., 4., 6.});
    CHECK(active_offset_provider() == nullptr);
}

TEST_CASE("Operators shift through the provider they are called with", "[operator][gather]")
{
    const auto add = make_add();
    const auto edge_sum = make_field_operator(
        "edge_sum", [&add](const Field<double>& c) { return add(c(E2C[1]), c(E2C[2])); });

    const auto offsets = mesh_offsets();
    auto out = filled_edges(-1.0);
    edge_sum.call(into(out, offsets), cell_values());
    CHECK(values_of(out) == kEdgeSums);
}

TEST_CASE("Nested calls reject out and offset_provider", "[operator][context]")
{
    const auto add = make_add();
    const auto offsets = mesh_offsets();
    Field<double> scratch({Cell}, {6});
    auto out = Field<double>({Cell}, {6});

    SECTION("out")
    {
        const auto bad = make_field_operator("bad", [&](const Field<double>& c)
                                             {
                                                 add.call(into(scratch), c, c);
                                                 return c;
                                             });
        REQUIRE_THROWS_AS(bad.call(into(out, offsets), cell_values()), ContextError);
    }
    SECTION("offset_provider")
    {
        const auto bad = make_field_operator(
            "bad", [&](const Field<double>& c)
            { return *add.call(Invocation<>{nullptr, &offsets}, c, c); });
        REQUIRE_THROWS_AS(bad.call(into(out, offsets), cell_values()), ContextError);
    }
    // the context was released on the error path
    CHECK(active_offset_provider() == nullptr);
}

TEST_CASE("A mismatched out is rejected before anything is written", "[operator]")
{
    const auto add = make_add();
    const auto c = cell_values();

    Field<double> short_out({Cell}, {5});
    for (int i = 1; i <= 5; ++i)
        short_out.set({i}, 7.0);
    REQUIRE_THROWS_AS(add.call(into(short_out), c, c), ShapeError);
    CHECK(values_of(short_out) == std::vector<double>(5, 7.0));

    Field<double> wrong_dims({Edge}, {6});
    REQUIRE_THROWS_AS(add.call(into(wrong_dims), c, c), ShapeError);
    CHECK(active_offset_provider() == nullptr);
}

TEST_CASE("Tuple results fill tuple outs", "[operator][tuple]")
{
    const auto sum_diff = make_field_operator(
        "sum_diff", [](const Field<double>& a, const Field<double>& b)
        { return std::make_tuple(a + b, a - b); });

    Field<double> a({Cell}, {2}, std::vector<double>{5., 7.});
    Field<double> b({Cell}, {2}, std::vector<double>{1., 2.});
    Field<double> s({Cell}, {2});
    Field<double> d({Cell}, {2});
    auto out = std::make_tuple(s, d);

    sum_diff.call(into(out), a, b);
    CHECK(values_of(s) == std::vector<double>{6., 9.});
    CHECK(values_of(d) == std::vector<double>{4., 5.});

    std::tuple<Field<double>> too_short{s};
    REQUIRE_THROWS_AS(sum_diff.call(into(too_short), a, b), ShapeError);
}

TEST_CASE("Scalar results fill the whole out field", "[operator]")
{
    const auto half = make_field_operator("half", [](const Field<double>&) { return 0.5; });
    auto out = filled_edges(0.0);
    half.call(into(out), edge_values());
    CHECK(values_of(out) == std::vector<double>(12, 0.5));
}

TEST_CASE("External backends produce the embedded result", "[operator][backend]")
{
    const lang::Environment env{{"E2C", E2C}, {"E2CDim", E2CDim}};
    const auto edge_sum = make_field_operator(
        "edge_sum",
        [](const Field<double>& c) { return neighbor_sum(c(E2C), E2CDim); },
        "(field_operator edge_sum ((c Field Cell)) (neighbor_sum (c E2C) E2CDim))", env);

    REQUIRE(edge_sum.descriptor().source);
    CHECK(edge_sum.descriptor().captured.count("E2C") == 1);
    CHECK(edge_sum.descriptor().captured.count("neighbor_sum") == 1);

    const auto offsets = mesh_offsets();
    const auto interp = Backend::external(std::make_shared<lang::InterpreterBackend>());

    auto embedded = filled_edges(0.0);
    auto external = filled_edges(0.0);
    edge_sum.call(into(embedded, offsets), cell_values());
    edge_sum.call(into(external, offsets, interp), cell_values());
    CHECK(values_of(embedded) == kEdgeSums);
    CHECK(values_of(external) == values_of(embedded));
    CHECK(active_offset_provider() == nullptr);

    SECTION("out of a non-native element type is written back")
    {
        Field<std::int32_t> narrow({Edge}, {12});
        edge_sum.call(into(narrow, offsets, interp), cell_values());
        CHECK(narrow.get({9}) == 13);
        CHECK(narrow.get({12}) == 7);
    }
    SECTION("nested external call returns its value")
    {
        const auto outer = make_field_operator(
            "outer", [&](const Field<double>& c)
            { return *edge_sum.call(Invocation<>{nullptr, nullptr, interp}, c) * 2.0; });
        auto out = filled_edges(0.0);
        outer.call(into(out, offsets), cell_values());
        CHECK(out.get({7}) == 18.0);
    }
}

TEST_CASE("Source forms must match the operator name", "[operator][source]")
{
    const lang::Environment env;
    auto body = [](const Field<double>& c) { return c; };
    REQUIRE_THROWS_AS(make_field_operator("ident", body,
                                          "(field_operator other ((c Field)) c)", env),
                      ParseError);
    REQUIRE_THROWS_AS(make_field_operator("ident", body, "(field_operator ident (c) c)", env),
                      ClosureError);
    REQUIRE_NOTHROW(make_field_operator("ident", body, "(field_operator ident ((c Field)) c)",
                                        env));
}

TEST_CASE("Operators without source only run embedded", "[operator][backend]")
{
    const auto add = make_add();
    const auto interp = Backend::external(std::make_shared<lang::InterpreterBackend>());
    const auto c = cell_values();
    Field<double> out({Cell}, {6});
    REQUIRE_THROWS_AS(add.call(into(out, interp), c, c), BackendError);
    REQUIRE_THROWS_AS(Backend::external(nullptr), BackendError);
    CHECK(Backend{}.name() == "embedded");
    CHECK(interp.name() == "interpreter");
}
