#include "master/Errors.hpp"
#include "master/plugin/Registry.hpp"
#include <catch2/catch_all.hpp>

using namespace gridflow::master::plugin;

namespace
{

struct Constant final : IBackend
{
    explicit Constant(const KV& kv) : value(kv.count("value") ? std::stod(kv.at("value")) : 0.0)
    {
    }
    std::string name() const override { return "constant"; }
    std::optional<gridflow::field::Value>
    execute(const OperatorDescriptor&, const std::vector<gridflow::field::Value>&,
            const gridflow::field::Value*, const gridflow::master::OffsetProvider&) override
    {
        return gridflow::field::Value(value);
    }
    double value;
};

} // namespace

TEST_CASE("Registry builds backends from registered factories", "[plugin][registry]")
{
    Registry reg;
    REQUIRE(reg.keys().empty());

    reg.add_backend("constant", [](const KV& kv) { return std::make_shared<Constant>(kv); });
    REQUIRE(reg.contains("constant"));

    auto b = reg.make_backend("constant", {{"value", "2.5"}});
    REQUIRE(b != nullptr);
    CHECK(b->name() == "constant");
    CHECK(static_cast<Constant&>(*b).value == Catch::Approx(2.5));

    // each call builds a fresh instance
    CHECK(reg.make_backend("constant", {}) != b);
}

TEST_CASE("Registry keys are sorted and re-registration replaces", "[plugin][registry]")
{
    Registry reg;
    reg.add_backend("zeta", [](const KV& kv) { return std::make_shared<Constant>(kv); });
    reg.add_backend("alpha", [](const KV& kv) { return std::make_shared<Constant>(kv); });
    CHECK(reg.keys() == std::vector<std::string>{"alpha", "zeta"});

    reg.add_backend("alpha", [](const KV&) { return std::shared_ptr<IBackend>{}; });
    CHECK(reg.keys().size() == 2);
    REQUIRE_THROWS_AS(reg.make_backend("alpha", {}), gridflow::BackendError);
}

TEST_CASE("Unknown backend keys are reported", "[plugin][registry]")
{
    Registry reg;
    REQUIRE_THROWS_WITH(reg.make_backend("jit", {}),
                        Catch::Matchers::Equals("No backend factory for key: jit"));
}
