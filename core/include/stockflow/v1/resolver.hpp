#pragma once

// =============================================================================
// stockflow - Auxiliary dependency resolution
// =============================================================================
// Auxiliaries may reference each other in any order and the generator gives no
// acyclicity guarantee. Two strategies are offered:
//
//   FixedPass  k passes over every auxiliary in declaration order, writing each
//              value back into the scope immediately so later auxiliaries in the
//              same pass see it. Exact for acyclic chains of depth <= k; for
//              deeper chains or real cycles it is a heuristic and the result is
//              whatever the k-th pass produced.
//
//   Ordered    Tarjan SCC over the auxiliary-to-auxiliary references. Acyclic
//              auxiliaries are evaluated once in dependency order; each cyclic
//              group is relaxed for at most k passes and must settle within
//              the tolerance, otherwise ResolutionError(non_convergence).
// =============================================================================

#include "stockflow/v1/expression.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace stockflow::v1 {

enum class ResolverStrategy : std::uint8_t {
    FixedPass,
    Ordered
};

[[nodiscard]] constexpr std::string_view to_string(ResolverStrategy strategy) noexcept {
    switch (strategy) {
        case ResolverStrategy::FixedPass: return "fixed_pass";
        case ResolverStrategy::Ordered: return "ordered";
    }
    return "unknown";
}

struct ResolverOptions {
    ResolverStrategy strategy = ResolverStrategy::FixedPass;
    int max_passes = 5;
    Real tolerance = 1e-9;  // relative, Ordered only
};

struct ResolverReport {
    int passes = 0;              // largest number of passes any group needed
    bool converged = false;      // last pass left every value unchanged
    std::size_t cyclic_groups = 0;
};

struct ResolverEntry {
    std::string name;
    CompiledFormula formula;
};

class DependencyResolver {
public:
    /// One evaluation unit of the Ordered strategy
    struct Group {
        std::vector<std::size_t> members;  // indices into entries()
        bool cyclic = false;
    };

    DependencyResolver() = default;

    /// Throws ConfigError(invalid_option) when max_passes < 1 or the tolerance
    /// is negative
    DependencyResolver(std::vector<ResolverEntry> entries, ResolverOptions options = {});

    /// Evaluate every auxiliary and store the results in `scope`. Evaluation
    /// failures are rethrown as ResolutionError naming the auxiliary.
    ResolverReport resolve(Scope& scope) const;

    [[nodiscard]] const std::vector<ResolverEntry>& entries() const { return entries_; }
    [[nodiscard]] const std::vector<Group>& groups() const { return groups_; }
    [[nodiscard]] const ResolverOptions& options() const { return options_; }

private:
    void build_groups();
    [[nodiscard]] ResolverReport resolve_fixed(Scope& scope) const;
    [[nodiscard]] ResolverReport resolve_ordered(Scope& scope) const;

    /// Evaluate one entry, write it back, and return |new - old| scaled by the
    /// tolerance reference
    Real update(std::size_t index, Scope& scope) const;

    std::vector<ResolverEntry> entries_;
    ResolverOptions options_;
    std::vector<Group> groups_;
};

}  // namespace stockflow::v1
