#include <CLI/CLI.hpp>
#include <stockflow/v1/core.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <span>
#include <string>

using namespace stockflow::v1;

namespace {

struct RunFlags {
    std::string output_file;
    std::string format = "csv";
    std::optional<double> end_time;
    std::optional<double> dt;
    std::string resolver = "fixed";
    int passes = 5;
};

void print_progress(Real time, Real end_time) {
    const int percent = end_time > 0.0 ? static_cast<int>(100.0 * time / end_time) : 100;
    std::cerr << "\rProgress: " << percent << "% (t=" << std::fixed << std::setprecision(3)
              << time << ")" << std::flush;
}

void print_diagnostics(const parser::ModelParser& parser, bool quiet) {
    for (const auto& error : parser.errors()) {
        std::cerr << "Error: " << error << std::endl;
    }
    if (!quiet) {
        for (const auto& warning : parser.warnings()) {
            std::cerr << "Warning: " << warning << std::endl;
        }
    }
}

SimulationOptions make_options(const RunFlags& flags) {
    SimulationOptions options;
    options.end_time = flags.end_time;
    options.dt = flags.dt;
    options.resolver.max_passes = flags.passes;
    options.resolver.strategy =
        flags.resolver == "ordered" ? ResolverStrategy::Ordered : ResolverStrategy::FixedPass;
    return options;
}

void write_json(const nlohmann::json& j, const std::string& output_file) {
    if (output_file.empty()) {
        std::cout << j.dump(2) << std::endl;
        return;
    }
    std::ofstream file(output_file);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + output_file);
    }
    file << j.dump(2) << std::endl;
}

int cmd_run(const std::string& model_file, const RunFlags& flags, bool verbose, bool quiet) {
    try {
        if (!quiet) {
            std::cerr << "Reading model: " << model_file << std::endl;
        }

        parser::ModelParser parser;
        const ModelConfig model = parser.load(model_file);
        print_diagnostics(parser, quiet);
        if (!parser.errors().empty()) {
            return 1;
        }

        Simulator sim(model, make_options(flags));

        if (verbose) {
            std::cerr << "Model loaded:" << std::endl;
            std::cerr << "  Stocks: " << sim.stocks().size() << std::endl;
            std::cerr << "  Auxiliaries: " << sim.auxiliaries().size() << std::endl;
            std::cerr << "  Flows: " << sim.flows().size() << std::endl;
            std::cerr << "  Parameters: " << model.parameters.size() << std::endl;
        }
        if (!quiet) {
            std::cerr << "Running simulation..." << std::endl;
            std::cerr << "  end_time: " << sim.end_time() << " "
                      << model.simulation_settings.end_time.unit << std::endl;
            std::cerr << "  dt: " << sim.dt() << " " << model.simulation_settings.dt.unit << std::endl;
            std::cerr << "  resolver: " << to_string(make_options(flags).resolver.strategy)
                      << " (" << flags.passes << " passes)" << std::endl;
        }

        const auto start = std::chrono::steady_clock::now();
        TimeSeries series;
        try {
            if (!quiet) {
                const Real end_time = sim.end_time();
                series = sim.run([end_time](Real time, std::span<const Real>) {
                    print_progress(time, end_time);
                });
                std::cerr << std::endl;
            } else {
                series = sim.run();
            }
        } catch (const SimulationError& e) {
            if (!quiet) std::cerr << std::endl;
            std::cerr << "Simulation failed: " << e.what() << std::endl;
            if (verbose) {
                std::cerr << "  Rows recorded before failure: " << e.partial().num_rows() << std::endl;
            }
            return 1;
        }
        const double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        if (!quiet) {
            std::cerr << "Simulation completed:" << std::endl;
            std::cerr << "  Rows: " << series.num_rows() << std::endl;
            std::cerr << "  Wall time: " << std::fixed << std::setprecision(3) << wall << "s" << std::endl;
        }
        if (verbose) {
            const auto& report = sim.last_resolver_report();
            std::cerr << "  Last resolver pass count: " << report.passes
                      << (report.converged ? " (settled)" : " (not settled)") << std::endl;
        }

        if (flags.format == "json") {
            auto j = to_json(series, sim.component_units());
            j["summary"] = to_json(summarize(series));
            write_json(j, flags.output_file);
        } else if (!flags.output_file.empty()) {
            if (!quiet) {
                std::cerr << "Writing results to: " << flags.output_file << std::endl;
            }
            write_csv(series, flags.output_file);
        } else {
            write_csv(series, std::cout);
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_validate(const std::string& model_file, bool verbose, bool quiet) {
    try {
        parser::ModelParser parser;
        const ModelConfig model = parser.load(model_file);
        print_diagnostics(parser, quiet);
        if (!parser.errors().empty()) {
            std::cerr << "Validation failed" << std::endl;
            return 2;
        }

        try {
            const Simulator sim(model);
            (void)sim;
        } catch (const ConfigError& e) {
            std::cerr << "Validation failed: " << e.what() << std::endl;
            return 2;
        }

        const auto unresolved = find_unresolved_references(model);
        for (const auto& ref : unresolved) {
            std::cerr << "Error: " << to_string(ref.kind) << " '" << ref.entity
                      << "' references undefined name '" << ref.name << "'" << std::endl;
        }
        if (!unresolved.empty()) {
            return 2;
        }

        if (verbose) {
            std::cout << "Model is valid." << std::endl;
            std::cout << "  Stocks: " << model.stocks.size() << std::endl;
            std::cout << "  Parameters: " << model.parameters.size() << std::endl;
            std::cout << "  Auxiliaries: " << model.auxiliaries.size() << std::endl;
            std::cout << "  Flows: " << model.flows.size() << std::endl;
            std::cout << "  Rows per run: " << expected_step_count(model.simulation_settings) << std::endl;
        } else {
            std::cout << "OK" << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

void print_dependencies(const FormulaDependencies& deps) {
    if (deps.error) {
        std::cout << "      invalid: " << deps.error->message << std::endl;
        return;
    }
    std::cout << "      reads:";
    if (deps.reads.empty()) {
        std::cout << " (none)";
    }
    for (const auto& name : deps.reads) {
        std::cout << " " << name;
    }
    std::cout << std::endl;
}

int cmd_info(const std::string& model_file) {
    try {
        parser::ModelParser parser;
        const ModelConfig model = parser.load_or_throw(model_file);

        std::cout << "Model: " << model_file << std::endl;
        if (!model.problem_description.empty()) {
            std::cout << "  " << model.problem_description << std::endl;
        }

        const auto& settings = model.simulation_settings;
        std::cout << "\nSimulation:" << std::endl;
        std::cout << "  end_time: " << settings.end_time.value << " " << settings.end_time.unit << std::endl;
        std::cout << "  dt: " << settings.dt.value << " " << settings.dt.unit << std::endl;
        std::cout << "  rows: " << expected_step_count(settings) << std::endl;

        std::cout << "\nStocks (" << model.stocks.size() << "):" << std::endl;
        for (const auto& stock : model.stocks) {
            std::cout << "  " << stock.name << " = " << stock.initial_value << " [" << stock.unit << "]";
            std::set<std::string> in;
            std::set<std::string> out;
            for (const auto& conn : model.flow_connections) {
                if (conn.stock_name != stock.name) continue;
                (conn.direction == FlowDirection::Inflow ? in : out).insert(conn.flow_name);
            }
            for (const auto& f : in) std::cout << " +" << f;
            for (const auto& f : out) std::cout << " -" << f;
            std::cout << std::endl;
        }

        std::cout << "\nParameters (" << model.parameters.size() << "):" << std::endl;
        for (const auto& [name, parameter] : model.parameters) {
            std::cout << "  " << name << " = " << parameter.value << " [" << parameter.unit << "]" << std::endl;
        }

        // auxiliaries come first, in declaration order
        const auto deps = formula_dependencies(model);
        const std::size_t aux_count = model.auxiliaries.size();
        bool all_valid = true;

        std::cout << "\nAuxiliaries (" << aux_count << "):" << std::endl;
        for (std::size_t i = 0; i < aux_count; ++i) {
            const auto& aux = model.auxiliaries[i];
            std::cout << "  " << aux.name << " [" << aux.unit << "] = " << aux.formula << std::endl;
            print_dependencies(deps[i]);
            all_valid = all_valid && !deps[i].error;
        }

        std::cout << "\nFlows (" << model.flows.size() << "):" << std::endl;
        for (std::size_t i = 0; i < model.flows.size(); ++i) {
            const auto& flow = model.flows[i];
            std::cout << "  " << flow.name << " [" << flow.unit << "] = " << flow.formula << std::endl;
            print_dependencies(deps[aux_count + i]);
            all_valid = all_valid && !deps[aux_count + i].error;
        }

        // auxiliaries whose formula does not parse are left out of the order
        std::vector<ResolverEntry> entries;
        std::vector<std::string> skipped;
        for (std::size_t i = 0; i < aux_count; ++i) {
            const auto& aux = model.auxiliaries[i];
            if (deps[i].error) {
                skipped.push_back(aux.name);
                continue;
            }
            entries.push_back({aux.name, CompiledFormula::compile(aux.formula)});
        }
        const DependencyResolver resolver(std::move(entries));
        std::cout << "\nAuxiliary evaluation order:" << std::endl;
        for (const auto& group : resolver.groups()) {
            std::cout << "  " << (group.cyclic ? "cycle {" : "");
            for (std::size_t i = 0; i < group.members.size(); ++i) {
                if (i > 0) std::cout << ", ";
                std::cout << resolver.entries()[group.members[i]].name;
            }
            std::cout << (group.cyclic ? "}" : "") << std::endl;
        }
        for (const auto& name : skipped) {
            std::cout << "  " << name << " (invalid formula)" << std::endl;
        }
        return all_valid ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_batch(const std::string& batch_file, const RunFlags& flags, unsigned int jobs, bool quiet) {
    try {
        parser::ModelParser parser;
        const auto scenarios = parser.load_batch(batch_file);
        print_diagnostics(parser, quiet);
        if (!parser.errors().empty()) {
            return 1;
        }

        RunnerOptions options;
        options.max_workers = jobs;
        options.simulation = make_options(flags);

        if (!quiet) {
            std::cerr << "Running " << scenarios.size() << " scenarios on "
                      << resolve_worker_count(jobs, scenarios.size()) << " worker(s)..." << std::endl;
        }

        ScenarioRunner runner(options);
        const auto outcomes = runner.run(scenarios, [&](std::size_t, const ScenarioOutcome& outcome) {
            if (quiet) return;
            std::cerr << "  [" << to_string(outcome.status) << "] " << outcome.label;
            if (outcome.error) {
                std::cerr << ": " << outcome.error->message;
            }
            std::cerr << std::endl;
        });

        write_json(to_json(outcomes), flags.output_file);

        const auto failed = std::count_if(outcomes.begin(), outcomes.end(),
                                          [](const ScenarioOutcome& o) { return !o.ok(); });
        if (!quiet) {
            std::cerr << "Batch completed: " << (outcomes.size() - static_cast<std::size_t>(failed))
                      << " succeeded, " << failed << " failed" << std::endl;
        }
        return failed == 0 ? 0 : 3;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"stockflow - Stock-flow-auxiliary model simulator"};
    app.set_version_flag("-V,--version", std::string("stockflow ") + STOCKFLOW_VERSION);

    // Global options
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");

    auto add_run_flags = [](CLI::App* cmd, RunFlags& flags) {
        cmd->add_option("--end-time", flags.end_time, "End time (overrides model)");
        cmd->add_option("--dt", flags.dt, "Time step (overrides model)");
        cmd->add_option("--resolver", flags.resolver, "Auxiliary resolver strategy")
            ->check(CLI::IsMember({"fixed", "ordered"}));
        cmd->add_option("--passes", flags.passes, "Resolver pass budget")
            ->check(CLI::PositiveNumber);
    };

    // Run command
    auto* run_cmd = app.add_subcommand("run", "Simulate one model");
    std::string model_file;
    RunFlags run_flags;
    run_cmd->add_option("model", model_file, "Model file (YAML or JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    run_cmd->add_option("-o,--output", run_flags.output_file, "Output file");
    run_cmd->add_option("--format", run_flags.format, "Output format")
        ->check(CLI::IsMember({"csv", "json"}));
    add_run_flags(run_cmd, run_flags);
    run_cmd->callback([&]() {
        std::exit(cmd_run(model_file, run_flags, verbose, quiet));
    });

    // Validate command
    auto* validate_cmd = app.add_subcommand("validate", "Validate a model file");
    std::string validate_file;
    validate_cmd->add_option("model", validate_file, "Model file (YAML or JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    validate_cmd->callback([&]() {
        std::exit(cmd_validate(validate_file, verbose, quiet));
    });

    // Info command
    auto* info_cmd = app.add_subcommand("info", "Show model structure and dependencies");
    std::string info_file;
    info_cmd->add_option("model", info_file, "Model file (YAML or JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    info_cmd->callback([&]() {
        std::exit(cmd_info(info_file));
    });

    // Batch command
    auto* batch_cmd = app.add_subcommand("batch", "Run a base model and its parameter variations");
    std::string batch_file;
    RunFlags batch_flags;
    unsigned int jobs = 0;
    batch_cmd->add_option("batch", batch_file, "Batch file (YAML or JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    batch_cmd->add_option("-o,--output", batch_flags.output_file, "Output file (JSON)");
    batch_cmd->add_option("-j,--jobs", jobs, "Worker threads (0 = auto)");
    add_run_flags(batch_cmd, batch_flags);
    batch_cmd->callback([&]() {
        std::exit(cmd_batch(batch_file, batch_flags, jobs, quiet));
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
