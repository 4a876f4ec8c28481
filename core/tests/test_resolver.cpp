#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "stockflow/v1/resolver.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace stockflow::v1;
using Catch::Approx;

namespace {

std::vector<ResolverEntry> make_entries(const std::vector<std::pair<std::string, std::string>>& defs) {
    std::vector<ResolverEntry> entries;
    for (const auto& [name, formula] : defs) {
        entries.push_back({name, CompiledFormula::compile(formula)});
    }
    return entries;
}

// Auxiliaries start at zero, as in the simulator's first step
Scope make_scope(const std::vector<std::string>& aux_names) {
    Scope scope;
    scope.set("Base", Quantity{5.0, "units"});
    for (const auto& name : aux_names) {
        scope.set(name, 0.0);
    }
    return scope;
}

// Declared in reverse dependency order: a reads b, b reads c
const std::vector<std::pair<std::string, std::string>> kReverseChain = {
    {"a", "b + 1"},
    {"b", "c + 1"},
    {"c", "Base.value"},
};

}  // namespace

TEST_CASE("fixed-pass resolves acyclic chains within the pass budget", "[v1][resolver]") {
    const DependencyResolver resolver(make_entries(kReverseChain));
    Scope scope = make_scope({"a", "b", "c"});

    const auto report = resolver.resolve(scope);
    CHECK(report.passes == 5);
    CHECK(report.converged);
    CHECK(report.cyclic_groups == 0);
    CHECK(*scope.number("c") == Approx(5.0));
    CHECK(*scope.number("b") == Approx(6.0));
    CHECK(*scope.number("a") == Approx(7.0));
}

TEST_CASE("fixed-pass writes values back within the same pass", "[v1][resolver]") {
    // forward order: each auxiliary sees the one evaluated just before it
    const DependencyResolver resolver(
        make_entries({{"c", "Base.value"}, {"b", "c + 1"}, {"a", "b + 1"}}),
        ResolverOptions{ResolverStrategy::FixedPass, 1, 1e-9});
    Scope scope = make_scope({"a", "b", "c"});

    (void)resolver.resolve(scope);
    CHECK(*scope.number("a") == Approx(7.0));
}

TEST_CASE("fixed-pass leaves stale values when the chain is deeper than the budget", "[v1][resolver]") {
    const DependencyResolver resolver(make_entries(kReverseChain),
                                      ResolverOptions{ResolverStrategy::FixedPass, 1, 1e-9});
    Scope scope = make_scope({"a", "b", "c"});

    const auto report = resolver.resolve(scope);
    CHECK(report.passes == 1);
    CHECK_FALSE(report.converged);
    CHECK(*scope.number("a") == Approx(1.0));
    CHECK(*scope.number("b") == Approx(1.0));
    CHECK(*scope.number("c") == Approx(5.0));
}

TEST_CASE("resolving a converged scope again changes nothing", "[v1][resolver]") {
    for (const auto strategy : {ResolverStrategy::FixedPass, ResolverStrategy::Ordered}) {
        const DependencyResolver resolver(make_entries(kReverseChain),
                                          ResolverOptions{strategy, 5, 1e-9});
        Scope scope = make_scope({"a", "b", "c"});
        (void)resolver.resolve(scope);
        const Real a = *scope.number("a");
        const Real b = *scope.number("b");
        const Real c = *scope.number("c");

        const auto report = resolver.resolve(scope);
        CHECK(report.converged);
        CHECK(*scope.number("a") == a);
        CHECK(*scope.number("b") == b);
        CHECK(*scope.number("c") == c);
    }
}

TEST_CASE("ordered strategy evaluates acyclic auxiliaries once in dependency order", "[v1][resolver]") {
    const DependencyResolver resolver(make_entries(kReverseChain),
                                      ResolverOptions{ResolverStrategy::Ordered, 1, 1e-9});
    Scope scope = make_scope({"a", "b", "c"});

    const auto report = resolver.resolve(scope);
    CHECK(report.passes == 1);
    CHECK(report.converged);
    CHECK(*scope.number("a") == Approx(7.0));

    const auto& groups = resolver.groups();
    REQUIRE(groups.size() == 3);
    CHECK(resolver.entries()[groups[0].members.front()].name == "c");
    CHECK(resolver.entries()[groups[1].members.front()].name == "b");
    CHECK(resolver.entries()[groups[2].members.front()].name == "a");
}

TEST_CASE("ordered strategy relaxes converging cycles", "[v1][resolver]") {
    const DependencyResolver resolver(make_entries({{"x", "0.5 * y + 1"}, {"y", "0.5 * x"}}),
                                      ResolverOptions{ResolverStrategy::Ordered, 100, 1e-12});
    Scope scope = make_scope({"x", "y"});

    const auto report = resolver.resolve(scope);
    CHECK(report.converged);
    CHECK(report.cyclic_groups == 1);
    CHECK(report.passes > 1);
    CHECK(*scope.number("x") == Approx(4.0 / 3.0));
    CHECK(*scope.number("y") == Approx(2.0 / 3.0));
}

TEST_CASE("ordered strategy reports cycles that do not settle", "[v1][resolver]") {
    SECTION("slow contraction with a small budget") {
        const DependencyResolver resolver(make_entries({{"x", "0.5 * y + 1"}, {"y", "0.5 * x"}}),
                                          ResolverOptions{ResolverStrategy::Ordered, 5, 1e-12});
        Scope scope = make_scope({"x", "y"});
        try {
            (void)resolver.resolve(scope);
            FAIL("cycle reported as converged");
        } catch (const ResolutionError& e) {
            CHECK(e.code() == ErrorCode::NonConvergence);
            CHECK(e.entity() == "x");
            CHECK(std::string(e.what()).find("{x, y}") != std::string::npos);
        }
    }

    SECTION("self reference that grows without bound") {
        const DependencyResolver resolver(make_entries({{"z", "z + 1"}}),
                                          ResolverOptions{ResolverStrategy::Ordered, 10, 1e-9});
        REQUIRE(resolver.groups().size() == 1);
        CHECK(resolver.groups().front().cyclic);
        Scope scope = make_scope({"z"});
        CHECK_THROWS_AS(resolver.resolve(scope), ResolutionError);
    }
}

TEST_CASE("evaluation failures name the auxiliary", "[v1][resolver]") {
    const DependencyResolver resolver(make_entries({{"ok", "1"}, {"broken", "ok + Unknown"}}));
    Scope scope = make_scope({"ok", "broken"});

    try {
        (void)resolver.resolve(scope);
        FAIL("undefined name was not reported");
    } catch (const ResolutionError& e) {
        CHECK(e.code() == ErrorCode::UndefinedName);
        CHECK(e.entity() == "broken");
        CHECK(e.formula() == "ok + Unknown");
        CHECK(std::string(e.what()).find("Unknown") != std::string::npos);
    }
}

TEST_CASE("resolver options are checked", "[v1][resolver]") {
    CHECK_THROWS_AS(DependencyResolver(make_entries(kReverseChain),
                                       ResolverOptions{ResolverStrategy::FixedPass, 0, 1e-9}),
                    ConfigError);
    CHECK_THROWS_AS(DependencyResolver(make_entries(kReverseChain),
                                       ResolverOptions{ResolverStrategy::Ordered, 5, -1.0}),
                    ConfigError);
}
