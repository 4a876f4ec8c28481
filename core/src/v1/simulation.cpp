#include "stockflow/v1/simulation.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace stockflow::v1 {

namespace {

CompiledFormula compile_for(EntityKind kind, const std::string& name, const std::string& formula) {
    try {
        return CompiledFormula::compile(formula);
    } catch (const EvaluationError& e) {
        throw ConfigError(ErrorCode::InvalidFormula, name,
                          "Invalid formula for " + std::string(to_string(kind)) + " '" + name +
                              "': " + e.what());
    }
}

ModelConfig apply_overrides(const ModelConfig& model, const SimulationOptions& options) {
    ModelConfig effective = model;
    if (options.end_time) {
        effective.simulation_settings.end_time.value = *options.end_time;
    }
    if (options.dt) {
        effective.simulation_settings.dt.value = *options.dt;
    }
    return effective;
}

}  // namespace

Simulator::Simulator(const ModelConfig& model, const SimulationOptions& options)
    : options_(options) {
    const ModelConfig effective = apply_overrides(model, options);
    require_valid(effective);

    end_time_ = effective.simulation_settings.end_time.value;
    dt_ = effective.simulation_settings.dt.value;
    total_steps_ = expected_step_count(effective.simulation_settings);
    units_ = ::stockflow::v1::component_units(effective);

    stocks_.reserve(effective.stocks.size());
    for (const auto& def : effective.stocks) {
        stocks_.push_back({def.name, def.initial_value, def.unit, {}, {}});
    }

    std::vector<ResolverEntry> entries;
    auxiliaries_.reserve(effective.auxiliaries.size());
    for (const auto& def : effective.auxiliaries) {
        auto formula = compile_for(EntityKind::Auxiliary, def.name, def.formula);
        entries.push_back({def.name, formula});
        auxiliaries_.push_back({def.name, std::move(formula), def.unit, 0.0});
    }

    flows_.reserve(effective.flows.size());
    for (const auto& def : effective.flows) {
        flows_.push_back({def.name, compile_for(EntityKind::Flow, def.name, def.formula), def.unit, 0.0});
    }

    std::unordered_map<std::string, std::size_t> stock_lookup;
    std::unordered_map<std::string, std::size_t> flow_lookup;
    for (std::size_t i = 0; i < stocks_.size(); ++i) stock_lookup.emplace(stocks_[i].name, i);
    for (std::size_t i = 0; i < flows_.size(); ++i) flow_lookup.emplace(flows_[i].name, i);

    inflow_index_.assign(stocks_.size(), {});
    outflow_index_.assign(stocks_.size(), {});
    for (const auto& conn : effective.flow_connections) {
        const std::size_t s = stock_lookup.at(conn.stock_name);
        const std::size_t f = flow_lookup.at(conn.flow_name);
        if (conn.direction == FlowDirection::Inflow) {
            stocks_[s].inflows.push_back(conn.flow_name);
            inflow_index_[s].push_back(f);
        } else {
            stocks_[s].outflows.push_back(conn.flow_name);
            outflow_index_[s].push_back(f);
        }
    }

    resolver_ = DependencyResolver(std::move(entries), options_.resolver);

    // Parameters never change during a run
    for (const auto& [name, parameter] : effective.parameters) {
        scope_.set(name, Quantity{parameter.value, parameter.unit});
    }
    load_scope();

    series_ = TimeSeries(entity_names());
    series_.reserve_rows(total_steps_);
    row_buffer_.resize(series_.num_columns());
    started_ = std::chrono::steady_clock::now();
}

std::vector<std::string> Simulator::entity_names() const {
    std::vector<std::string> names;
    names.reserve(1 + stocks_.size() + auxiliaries_.size() + flows_.size());
    names.emplace_back(kTimeName);
    for (const auto& stock : stocks_) names.push_back(stock.name);
    for (const auto& aux : auxiliaries_) names.push_back(aux.name);
    for (const auto& flow : flows_) names.push_back(flow.name);
    return names;
}

void Simulator::record_row() {
    std::size_t col = 0;
    row_buffer_[col++] = current_time();
    for (const auto& stock : stocks_) row_buffer_[col++] = stock.value;
    for (const auto& aux : auxiliaries_) row_buffer_[col++] = aux.value;
    for (const auto& flow : flows_) row_buffer_[col++] = flow.rate;
    series_.append_row(row_buffer_);
}

void Simulator::load_scope() {
    for (const auto& stock : stocks_) scope_.set(stock.name, stock.value);
    for (const auto& aux : auxiliaries_) scope_.set(aux.name, aux.value);
    for (const auto& flow : flows_) scope_.set(flow.name, flow.rate);
    scope_.set(std::string(kTimeName), current_time());
}

void Simulator::fail(ErrorCode code,
                     std::string entity,
                     std::optional<EntityKind> kind,
                     std::string formula,
                     const std::string& cause) {
    state_ = SimulationState::Failed;
    SimulationError::Context context;
    context.entity = std::move(entity);
    context.kind = kind;
    context.formula = std::move(formula);
    context.time = current_time();
    context.step = step_index_;
    context.cause = cause;
    throw SimulationError(code, std::move(context), series_);
}

bool Simulator::step() {
    if (state_ == SimulationState::Failed) {
        throw std::logic_error("Simulator::step called after a failed step");
    }
    if (step_index_ >= total_steps_) {
        state_ = SimulationState::Completed;
        series_.mark_complete();
        return false;
    }
    state_ = SimulationState::Stepping;

    if (options_.wall_clock_limit_seconds > 0.0) {
        const double elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
        if (elapsed > options_.wall_clock_limit_seconds) {
            fail(ErrorCode::TimedOut, "", std::nullopt, "",
                 "wall-clock limit of " + std::to_string(options_.wall_clock_limit_seconds) +
                     " s exceeded");
        }
    }

    // 1. pre-step snapshot
    record_row();

    // 2. scope from current state
    load_scope();

    // 3. auxiliaries
    try {
        last_report_ = resolver_.resolve(scope_);
    } catch (const ResolutionError& e) {
        fail(e.code(), e.entity(), EntityKind::Auxiliary, e.formula(), e.what());
    }
    for (auto& aux : auxiliaries_) {
        aux.value = scope_.number(aux.name).value_or(aux.value);
    }

    // 4. flows, direction comes from the connection so rates are never negative
    for (auto& flow : flows_) {
        try {
            flow.rate = std::max(0.0, flow.formula.evaluate(scope_));
        } catch (const EvaluationError& e) {
            fail(e.code(), flow.name, EntityKind::Flow, flow.formula.text(), e.what());
        }
    }

    // 5. stocks
    for (std::size_t s = 0; s < stocks_.size(); ++s) {
        Real net = 0.0;
        for (const std::size_t f : inflow_index_[s]) net += flows_[f].rate;
        for (const std::size_t f : outflow_index_[s]) net -= flows_[f].rate;
        stocks_[s].value = std::max(0.0, stocks_[s].value + net * dt_);
    }

    // 6. advance
    ++step_index_;
    if (step_index_ == total_steps_) {
        state_ = SimulationState::Completed;
        series_.mark_complete();
    }
    return true;
}

TimeSeries Simulator::run(SimulationCallback callback, SimulationControl* control) {
    if (state_ == SimulationState::Completed || state_ == SimulationState::Failed) {
        throw std::logic_error("Simulator::run called on a finished simulator");
    }
    started_ = std::chrono::steady_clock::now();

    while (step_index_ < total_steps_) {
        if (control) {
            while (control->should_pause() && !control->should_stop()) {
                control->wait_until_resumed();
            }
            if (control->should_stop()) {
                fail(ErrorCode::Cancelled, "", std::nullopt, "", "Simulation stopped by user");
            }
        }

        step();

        if (callback) {
            const std::size_t last = series_.num_rows() - 1;
            callback(series_.row(last)[0], series_.row(last));
        }
    }

    state_ = SimulationState::Completed;
    series_.mark_complete();
    return series_;
}

TimeSeries Simulator::run_with_progress(SimulationCallback callback,
                                        SimulationControl* control,
                                        const ProgressCallbackConfig& progress_config) {
    const auto start_time = std::chrono::steady_clock::now();
    auto last_progress_time = start_time;
    int steps_since_progress = 0;
    std::int64_t steps_total = 0;

    auto report = [&](Real time, std::chrono::steady_clock::time_point now) {
        SimulationProgress progress;
        progress.current_time = time;
        progress.total_time = end_time_;
        progress.progress_percent = end_time_ > 0.0 ? 100.0 * time / end_time_ : 100.0;
        progress.steps_completed = steps_total;
        progress.elapsed_seconds = std::chrono::duration<double>(now - start_time).count();
        progress_config.callback(progress);
    };

    auto wrapped_callback = [&](Real time, std::span<const Real> row) {
        ++steps_total;
        ++steps_since_progress;
        if (callback) {
            callback(time, row);
        }
        if (!progress_config.callback) {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        const double elapsed_ms =
            std::chrono::duration<double, std::milli>(now - last_progress_time).count();
        if (elapsed_ms >= progress_config.min_interval_ms &&
            steps_since_progress >= progress_config.min_steps) {
            report(time, now);
            last_progress_time = now;
            steps_since_progress = 0;
        }
    };

    TimeSeries result = run(wrapped_callback, control);
    if (progress_config.callback) {
        report(result.empty() ? 0.0 : result.row(result.num_rows() - 1)[0],
               std::chrono::steady_clock::now());
    }
    return result;
}

TimeSeries simulate(const ModelConfig& model, const SimulationOptions& options) {
    Simulator simulator(model, options);
    return simulator.run();
}

std::vector<UnresolvedReference> find_unresolved_references(const ModelConfig& model) {
    std::unordered_set<std::string> known;
    known.emplace(kTimeName);
    for (const auto& stock : model.stocks) known.insert(stock.name);
    for (const auto& aux : model.auxiliaries) known.insert(aux.name);
    for (const auto& flow : model.flows) known.insert(flow.name);
    for (const auto& [name, parameter] : model.parameters) known.insert(name);

    std::vector<UnresolvedReference> unresolved;
    auto scan = [&](const std::string& entity, EntityKind kind, const std::string& text) {
        CompiledFormula formula;
        try {
            formula = CompiledFormula::compile(text);
        } catch (const EvaluationError&) {
            return;  // reported as invalid_formula by Simulator
        }
        for (const auto& name : formula.referenced_names()) {
            if (known.find(name) == known.end()) {
                unresolved.push_back({entity, kind, name});
            }
        }
    };

    for (const auto& aux : model.auxiliaries) scan(aux.name, EntityKind::Auxiliary, aux.formula);
    for (const auto& flow : model.flows) scan(flow.name, EntityKind::Flow, flow.formula);
    return unresolved;
}

std::vector<FormulaDependencies> formula_dependencies(const ModelConfig& model) {
    std::vector<FormulaDependencies> out;
    out.reserve(model.auxiliaries.size() + model.flows.size());
    auto add = [&](const std::string& entity, EntityKind kind, const std::string& text) {
        FormulaDependencies deps;
        deps.entity = entity;
        deps.kind = kind;
        try {
            deps.reads = CompiledFormula::compile(text).referenced_names();
        } catch (const EvaluationError& e) {
            ErrorDetail detail = describe_error(e);
            detail.code = ErrorCode::InvalidFormula;
            detail.entity = entity;
            deps.error = std::move(detail);
        }
        out.push_back(std::move(deps));
    };

    for (const auto& aux : model.auxiliaries) add(aux.name, EntityKind::Auxiliary, aux.formula);
    for (const auto& flow : model.flows) add(flow.name, EntityKind::Flow, flow.formula);
    return out;
}

}  // namespace stockflow::v1
