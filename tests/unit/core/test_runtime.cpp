#include "master/FieldOperator.hpp"
#include "master/Runtime.hpp"
#include "mesh_fixture.hpp"
#include <catch2/catch_all.hpp>

using namespace gridflow;
using namespace gridflow::master;
using namespace gridflow_test;

TEST_CASE("Runtime resolves backend keys", "[runtime]")
{
    Runtime rt;
    CHECK(rt.default_backend().kind() == Backend::Kind::Embedded);
    CHECK(rt.backend("embedded").name() == "embedded");

    auto interp = rt.backend("interpreter");
    CHECK(interp.kind() == Backend::Kind::External);
    CHECK(interp.name() == "interpreter");
    // one instance per key
    CHECK(rt.backend("interpreter").impl() == interp.impl());

    REQUIRE_THROWS_AS(rt.backend("jit"), BackendError);
}

TEST_CASE("Runtime applies the configured default and backend params", "[runtime]")
{
    RuntimeConfig cfg;
    cfg.log.level = "warn";
    cfg.default_backend = "interpreter";
    cfg.backend_params["interpreter"] = {{"trace", "true"}};
    Runtime rt(cfg);

    CHECK(logx::level() == logx::Level::Warn);
    const auto be = rt.default_backend();
    CHECK(be.name() == "interpreter");
    CHECK(rt.config().backend_params.at("interpreter").at("trace") == "true");

    logx::init({});
}

TEST_CASE("Runtime backends run operators end to end", "[runtime]")
{
    Runtime rt;
    const lang::Environment env{{"E2C", E2C}};
    const auto mean = make_field_operator(
        "mean", [](const field::Field<double>& c) { return (c(E2C[1]) + c(E2C[2])) * 0.5; },
        "(field_operator mean ((c Field Cell)) (* (+ (c E2C 1) (c E2C 2)) 0.5))", env);

    const auto offsets = mesh_offsets();
    field::Field<double> a({Edge}, {12});
    field::Field<double> b({Edge}, {12});
    mean.call(into(a, offsets, rt.default_backend()), cell_values());
    mean.call(into(b, offsets, rt.backend("interpreter")), cell_values());
    CHECK(values_of(a) == values_of(b));
    CHECK(b.get({8}) == 5.5);
}

TEST_CASE("Runtime fails fast on missing plugin libraries", "[runtime]")
{
    RuntimeConfig cfg;
    cfg.plugin_libs = {"libgridflow_missing_backend.so"};
    REQUIRE_THROWS_AS(Runtime(cfg), BackendError);
}

TEST_CASE("Runtime rejects an unknown default backend at construction", "[runtime]")
{
    RuntimeConfig cfg;
    cfg.default_backend = "jit";
    REQUIRE_THROWS_WITH(Runtime(cfg), Catch::Matchers::ContainsSubstring("jit"));
    REQUIRE_THROWS_AS(Runtime(cfg), BackendError);
}
