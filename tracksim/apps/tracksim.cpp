#include <tracksim/core/engine.hpp>
#include <tracksim/core/error.hpp>
#include <tracksim/core/types.hpp>

#include <tracksim/rules/standard_rules.hpp>

#include <tracksim/io/checkpoint_io.hpp>
#include <tracksim/io/error.hpp>
#include <tracksim/io/scenario_loader.hpp>
#include <tracksim/io/snapshot_recorder.hpp>
#include <tracksim/io/trace_writers.hpp>
#include <tracksim/io/trajectory_writer.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

namespace core = tracksim::core;
namespace rules = tracksim::rules;
namespace io = tracksim::io;

struct Config {
    std::string scenario_file;
    std::optional<uint64_t> steps;
    std::optional<double> until;
    std::string output_file{"-"};
    std::string format{"json"};
    std::string trajectory_file;
    std::string snapshot_file;
    double sample_period{0.0};  // 0 = every step
    std::string checkpoint_file;
    std::string resume_file;
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("tracksim", "Rule-driven particle simulator on a 1-D track");

    options.add_options()
        ("i,input", "Scenario file (JSON)", cxxopts::value<std::string>())
        ("n,steps", "Number of steps to execute", cxxopts::value<uint64_t>())
        ("u,until", "Run until this simulation time in seconds", cxxopts::value<double>())
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Trace format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("trajectory", "Write the trajectory log (JSON) to this file", cxxopts::value<std::string>())
        ("snapshots", "Write position samples (JSON) to this file", cxxopts::value<std::string>())
        ("sample-period", "Sampling period in seconds (default: every step)", cxxopts::value<double>()->default_value("0"))
        ("checkpoint", "Write a checkpoint to this file when the run returns", cxxopts::value<std::string>())
        ("resume", "Restore this checkpoint before running", cxxopts::value<std::string>())
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    if (result.count("steps") != 0U && result.count("until") != 0U) {
        std::cerr << "Error: --steps and --until are mutually exclusive" << std::endl;
        std::exit(64);
    }

    Config config;
    config.scenario_file = result["input"].as<std::string>();
    if (result.count("steps") != 0U) {
        config.steps = result["steps"].as<uint64_t>();
    }
    if (result.count("until") != 0U) {
        config.until = result["until"].as<double>();
    }
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    if (result.count("trajectory") != 0U) {
        config.trajectory_file = result["trajectory"].as<std::string>();
    }
    if (result.count("snapshots") != 0U) {
        config.snapshot_file = result["snapshots"].as<std::string>();
    }
    config.sample_period = result["sample-period"].as<double>();
    if (result.count("checkpoint") != 0U) {
        config.checkpoint_file = result["checkpoint"].as<std::string>();
    }
    if (result.count("resume") != 0U) {
        config.resume_file = result["resume"].as<std::string>();
    }
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "json" && config.format != "text" && config.format != "null") {
        std::cerr << "Error: unknown format '" << config.format << "'" << std::endl;
        std::exit(64);
    }

    return config;
}

// Runs to completion in bounded chunks so the trace stays flushed.
core::RunResult run_to_end(core::Engine& engine) {
    constexpr std::size_t CHUNK = 4096;
    core::RunResult total;
    while (!engine.finished()) {
        auto chunk = engine.run(CHUNK);
        total.steps += chunk.steps;
        total.reason = chunk.reason;
        total.entries.insert(total.entries.end(), chunk.entries.begin(), chunk.entries.end());
        if (!chunk.ok()) {
            total.error = chunk.error;
            break;
        }
        if (chunk.reason == core::StopReason::StopRequested) {
            break;
        }
    }
    return total;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading scenario from: " << config.scenario_file << std::endl;
        }

        // 1. Load scenario and build the engine with the stock rules
        auto scenario = io::load_scenario(config.scenario_file);

        core::RuleSet rule_set;
        rules::register_standard_rules(rule_set);
        auto engine = io::build_engine(scenario, std::move(rule_set));

        if (!config.steps && !config.until && !scenario.engine.step_limit && !scenario.engine.time_limit) {
            std::cerr << "Error: no stopping condition; pass --steps or --until, "
                         "or set max_ticks or max_time in the scenario" << std::endl;
            return 64;
        }

        // 2. Resume from a checkpoint
        if (!config.resume_file.empty()) {
            if (config.verbose) {
                std::cerr << "Resuming from: " << config.resume_file << std::endl;
            }
            engine->restore(io::read_checkpoint(config.resume_file));
        }

        // 3. Setup trace writer
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream outfile;

        if (config.format == "null") {
            writer = std::make_unique<io::NullTraceWriter>();
        } else {
            std::ostream* out = &std::cout;
            if (config.output_file != "-") {
                outfile.open(config.output_file);
                if (!outfile) {
                    std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                    return 1;
                }
                out = &outfile;
            }
            if (config.format == "text") {
                writer = std::make_unique<io::TextualTraceWriter>(*out);
            } else {
                writer = std::make_unique<io::JsonTraceWriter>(*out);
            }
        }
        engine->set_trace_writer(writer.get());

        // 4. Optional position sampling
        std::unique_ptr<io::SnapshotRecorder> recorder;
        if (!config.snapshot_file.empty()) {
            if (config.sample_period > 0) {
                recorder = std::make_unique<io::SnapshotRecorder>(
                    core::duration_from_seconds(config.sample_period));
            } else {
                recorder = std::make_unique<io::SnapshotRecorder>();
            }
            recorder->attach(*engine);
        }

        if (config.verbose) {
            std::cerr << "Starting simulation: " << engine->particles().size() << " particles, "
                      << core::to_string(scenario.engine.policy) << " scheduling" << std::endl;
        }

        // 5. Run simulation
        core::RunResult result;
        if (config.steps) {
            result = engine->run(static_cast<std::size_t>(*config.steps));
        } else if (config.until) {
            result = engine->run_until(core::time_from_seconds(*config.until));
        } else {
            result = run_to_end(*engine);
        }

        // 6. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }
        if (recorder) {
            recorder->flush(engine->time());
            recorder->write(std::filesystem::path(config.snapshot_file));
        }
        if (!config.trajectory_file.empty()) {
            io::write_trajectory(engine->trajectory(), config.trajectory_file);
        }
        if (!config.checkpoint_file.empty()) {
            io::write_checkpoint(engine->checkpoint(), config.checkpoint_file);
        }

        if (config.verbose) {
            std::cerr << "Simulation stopped (" << core::to_string(result.reason) << ") after "
                      << result.steps << " steps at time: "
                      << core::time_to_seconds(engine->time()) << "s" << std::endl;
        }

        result.rethrow_if_failed();
        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::ConfigurationError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::SimulationError& e) {
        std::cerr << "Simulation failed: " << e.what() << std::endl;
        return 2;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
