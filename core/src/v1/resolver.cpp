#include "stockflow/v1/resolver.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace stockflow::v1 {

namespace {

// Tarjan's strongly connected components. Edges point from an auxiliary to
// the auxiliaries it reads, so components come out dependencies first.
class ComponentFinder {
public:
    explicit ComponentFinder(const std::vector<std::vector<std::size_t>>& edges)
        : edges_(edges)
        , index_(edges.size(), kUnvisited)
        , lowlink_(edges.size(), 0)
        , on_stack_(edges.size(), false) {}

    std::vector<std::vector<std::size_t>> run() {
        for (std::size_t v = 0; v < edges_.size(); ++v) {
            if (index_[v] == kUnvisited) {
                visit(v);
            }
        }
        return std::move(components_);
    }

private:
    static constexpr std::size_t kUnvisited = static_cast<std::size_t>(-1);

    void visit(std::size_t v) {
        index_[v] = lowlink_[v] = counter_++;
        stack_.push_back(v);
        on_stack_[v] = true;

        for (const std::size_t w : edges_[v]) {
            if (index_[w] == kUnvisited) {
                visit(w);
                lowlink_[v] = std::min(lowlink_[v], lowlink_[w]);
            } else if (on_stack_[w]) {
                lowlink_[v] = std::min(lowlink_[v], index_[w]);
            }
        }

        if (lowlink_[v] == index_[v]) {
            std::vector<std::size_t> component;
            std::size_t w = 0;
            do {
                w = stack_.back();
                stack_.pop_back();
                on_stack_[w] = false;
                component.push_back(w);
            } while (w != v);
            std::sort(component.begin(), component.end());
            components_.push_back(std::move(component));
        }
    }

    const std::vector<std::vector<std::size_t>>& edges_;
    std::vector<std::size_t> index_;
    std::vector<std::size_t> lowlink_;
    std::vector<bool> on_stack_;
    std::vector<std::size_t> stack_;
    std::vector<std::vector<std::size_t>> components_;
    std::size_t counter_ = 0;
};

}  // namespace

DependencyResolver::DependencyResolver(std::vector<ResolverEntry> entries, ResolverOptions options)
    : entries_(std::move(entries)), options_(options) {
    if (options_.max_passes < 1) {
        throw ConfigError(ErrorCode::InvalidOption, "max_passes",
                          "Resolver pass budget must be at least 1 (got " +
                              std::to_string(options_.max_passes) + ")");
    }
    if (!(options_.tolerance >= 0.0) || !std::isfinite(options_.tolerance)) {
        throw ConfigError(ErrorCode::InvalidOption, "tolerance",
                          "Resolver tolerance must be finite and non-negative");
    }
    build_groups();
}

void DependencyResolver::build_groups() {
    std::unordered_map<std::string, std::size_t> lookup;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        lookup.emplace(entries_[i].name, i);
    }

    std::vector<std::vector<std::size_t>> edges(entries_.size());
    std::vector<bool> self_loop(entries_.size(), false);
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        for (const auto& name : entries_[i].formula.referenced_names()) {
            const auto it = lookup.find(name);
            if (it == lookup.end()) continue;
            edges[i].push_back(it->second);
            if (it->second == i) self_loop[i] = true;
        }
    }

    groups_.clear();
    for (auto& component : ComponentFinder(edges).run()) {
        Group group;
        group.cyclic = component.size() > 1 || self_loop[component.front()];
        group.members = std::move(component);
        groups_.push_back(std::move(group));
    }
}

ResolverReport DependencyResolver::resolve(Scope& scope) const {
    if (options_.strategy == ResolverStrategy::Ordered) {
        return resolve_ordered(scope);
    }
    return resolve_fixed(scope);
}

Real DependencyResolver::update(std::size_t index, Scope& scope) const {
    const auto& entry = entries_[index];
    Real value = 0.0;
    try {
        value = entry.formula.evaluate(scope);
    } catch (const EvaluationError& e) {
        throw ResolutionError(e.code(), entry.name, entry.formula.text(), e.what());
    }

    const auto previous = scope.number(entry.name);
    scope.set(entry.name, value);
    if (!previous) {
        return std::abs(value) + 1.0;
    }
    return std::abs(value - *previous) / (1.0 + std::abs(*previous));
}

ResolverReport DependencyResolver::resolve_fixed(Scope& scope) const {
    ResolverReport report;
    report.cyclic_groups = static_cast<std::size_t>(
        std::count_if(groups_.begin(), groups_.end(), [](const Group& g) { return g.cyclic; }));

    Real last_change = 0.0;
    for (int pass = 0; pass < options_.max_passes; ++pass) {
        last_change = 0.0;
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            last_change = std::max(last_change, update(i, scope));
        }
        ++report.passes;
    }
    report.converged = last_change <= options_.tolerance;
    return report;
}

ResolverReport DependencyResolver::resolve_ordered(Scope& scope) const {
    ResolverReport report;
    report.converged = true;

    for (const auto& group : groups_) {
        if (!group.cyclic) {
            update(group.members.front(), scope);
            report.passes = std::max(report.passes, 1);
            continue;
        }

        ++report.cyclic_groups;
        Real change = 0.0;
        int passes = 0;
        while (passes < options_.max_passes) {
            change = 0.0;
            for (const std::size_t member : group.members) {
                change = std::max(change, update(member, scope));
            }
            ++passes;
            if (change <= options_.tolerance) break;
        }
        report.passes = std::max(report.passes, passes);

        if (change > options_.tolerance) {
            const auto& first = entries_[group.members.front()];
            std::string members;
            for (const std::size_t member : group.members) {
                if (!members.empty()) members += ", ";
                members += entries_[member].name;
            }
            throw ResolutionError(ErrorCode::NonConvergence, first.name, first.formula.text(),
                                  "auxiliary cycle {" + members + "} did not settle within " +
                                      std::to_string(options_.max_passes) + " passes");
        }
    }
    return report;
}

}  // namespace stockflow::v1
