#include "montecarlo/sim_cli.hpp"
#include "core/deterministic_rng.hpp"
#include "core/errors.hpp"
#include "io/json_writer.hpp"
#include "io/tuning_loader.hpp"
#include "montecarlo/sim_results.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace rtp::mc {

namespace {

void emit_progress(std::ostream& err, const char* type, uint64_t completed, uint64_t total) {
    std::ostringstream line;
    io::JsonWriter w(line, 0);
    w.begin_object();
    w.kv("type", type);
    w.kv("completed", completed);
    w.kv("total", total);
    w.end_object();
    err << line.str() << "\n" << std::flush;
}

template <typename Write>
int write_output(const SimConfig& config, std::ostream& out, std::ostream& err, Write write) {
    if (config.output_path.empty()) {
        write(out);
        return 0;
    }
    std::ofstream file(config.output_path);
    if (!file.is_open()) {
        err << "Error: cannot open output file: " << config.output_path << "\n";
        return 1;
    }
    write(file);
    if (config.verbose) {
        err << "Results written to: " << config.output_path << "\n";
    }
    return 0;
}

const std::string& flag_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw InvalidArgument(args[i] + " expects a value");
    }
    return args[++i];
}

} // namespace

uint64_t parse_flag_integer(const std::string& text, const std::string& flag,
                            uint64_t min_value, uint64_t max_value) {
    const bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
    const std::string digits = hex ? text.substr(2) : text;

    const bool well_formed = !digits.empty() &&
        std::all_of(digits.begin(), digits.end(), [hex](char c) {
            unsigned char u = static_cast<unsigned char>(c);
            return hex ? std::isxdigit(u) != 0 : std::isdigit(u) != 0;
        });
    if (!well_formed) {
        throw InvalidArgument(flag + " expects a non-negative integer, got '" + text + "'");
    }

    uint64_t v = 0;
    try {
        v = std::stoull(digits, nullptr, hex ? 16 : 10);
    } catch (const std::out_of_range&) {
        throw InvalidArgument(flag + " is out of range: " + text);
    }
    if (v < min_value || v > max_value) {
        throw InvalidArgument(flag + " must lie in [" + std::to_string(min_value) + ", " +
                              std::to_string(max_value) + "], got " + text);
    }
    return v;
}

CliOptions parse_cli_args(const std::vector<std::string>& args) {
    CliOptions opts;
    SimConfig& config = opts.config;

    for (size_t i = 1; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else if (arg == "--mode") {
            config.mode = parse_sim_mode(flag_value(args, i));
        } else if (arg == "--trials") {
            config.trials = parse_flag_integer(flag_value(args, i), arg, 0,
                                               std::numeric_limits<uint64_t>::max());
        } else if (arg == "--seed") {
            config.seed = static_cast<uint32_t>(
                parse_flag_integer(flag_value(args, i), arg, 0, 0xFFFFFFFFull));
            opts.seed_given = true;
        } else if (arg == "--tuning") {
            config.tuning_path = flag_value(args, i);
        } else if (arg == "--cashout-step") {
            config.cashout_step = static_cast<int>(
                parse_flag_integer(flag_value(args, i), arg, 1,
                                   static_cast<uint64_t>(std::numeric_limits<int>::max())));
        } else if (arg == "--workers") {
            config.workers = static_cast<unsigned>(
                parse_flag_integer(flag_value(args, i), arg, 1, kMaxWorkers));
        } else if (arg == "--output") {
            config.output_path = flag_value(args, i);
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--progress") {
            config.progress = true;
        } else {
            throw InvalidArgument("unknown argument: " + arg);
        }
    }
    return opts;
}

void print_usage(const std::string& prog, std::ostream& out) {
    out << "Usage: " << prog << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --mode M             discrete (default) or hazard\n"
        << "  --trials N           Number of simulated rounds (default: 200000)\n"
        << "  --seed S             RNG seed, decimal or 0x-hex (default: random)\n"
        << "  --tuning <path>      Tuning table JSON (default: built-in tables)\n"
        << "  --cashout-step K     Hazard mode: steps survived before cashing out (default: 5)\n"
        << "  --workers W          Independent seeded sessions run in parallel (default: 1, max: "
        << kMaxWorkers << ")\n"
        << "  --output <path>      Output JSON file (default: stdout)\n"
        << "  --verbose            Summary to stderr\n"
        << "  --progress           JSON-Lines progress to stderr\n"
        << "  --help               Show this message\n";
}

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    const std::string prog = args.empty() ? std::string("rtp_sim") : args[0];

    CliOptions opts;
    try {
        opts = parse_cli_args(args);
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n\n";
        print_usage(prog, err);
        return 1;
    }
    if (opts.show_help) {
        print_usage(prog, err);
        return 0;
    }

    SimConfig& config = opts.config;
    if (!opts.seed_given) {
        config.seed = DeterministicRng::random_seed();
    }

    io::TuningSet tuning;
    if (!config.tuning_path.empty()) {
        try {
            tuning = io::TuningLoader::load_file(config.tuning_path);
        } catch (const std::exception& e) {
            err << "Error loading tuning: " << e.what() << "\n";
            return 1;
        }
    }

    if (config.verbose) {
        err << "=== RTP Simulation ===\n"
            << "Mode: " << to_string(config.mode) << "\n"
            << "Trials: " << config.trials << "\n"
            << "Seed: " << DeterministicRng(config.seed).seed_hex() << "\n"
            << "Workers: " << config.workers << "\n"
            << "Tuning: " << (config.tuning_path.empty() ? "built-in" : config.tuning_path)
            << "\n"
            << "Output: " << (config.output_path.empty() ? "stdout" : config.output_path)
            << "\n\n";
    }

    ProgressCallback progress_cb = nullptr;
    if (config.progress) {
        progress_cb = [&err](uint64_t completed, uint64_t total) {
            emit_progress(err, "progress", completed, total);
        };
    }

    auto t_start = std::chrono::high_resolution_clock::now();
    int status = 0;

    try {
        if (config.mode == SimMode::DISCRETE) {
            SimulationResults results = config.workers == 1
                ? simulate(config.trials, config.seed, tuning.discrete,
                           progress_cb, config.progress_interval)
                : simulate_parallel(config.trials, config.seed, config.workers,
                                    tuning.discrete, progress_cb);

            if (config.verbose) {
                err << "=== Results ===\n"
                    << "Win rate: " << results.win_rate() << "\n"
                    << "Effective RTP: " << results.effective_rtp() << "\n"
                    << "Analytic RTP: " << tuning.discrete.analytic_rtp() << "\n"
                    << "Target RTP: " << tuning.discrete.target_rtp << "\n";
            }

            status = write_output(config, out, err, [&](std::ostream& os) {
                write_results_json(results, tuning.discrete, config, os);
            });
        } else {
            HazardSimulationResults results = config.workers == 1
                ? simulate_hazard(config.trials, config.seed, config.cashout_step,
                                  tuning.hazard, progress_cb, config.progress_interval)
                : simulate_hazard_parallel(config.trials, config.seed, config.workers,
                                           config.cashout_step, tuning.hazard, progress_cb);

            if (config.verbose) {
                err << "=== Results ===\n"
                    << "Cash-out step: " << config.cashout_step
                    << " (x" << tuning.hazard.payout_multiple(config.cashout_step) << ")\n"
                    << "Win rate: " << results.win_rate() << "\n"
                    << "Effective RTP: " << results.effective_rtp() << "\n";
            }

            status = write_output(config, out, err, [&](std::ostream& os) {
                write_hazard_results_json(results, tuning.hazard, config, os);
            });
        }
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    if (config.progress) {
        emit_progress(err, "done", config.trials, config.trials);
    }
    if (config.verbose) {
        err << "\nCompleted " << config.trials << " trials in " << elapsed << "s\n";
    }

    return status;
}

} // namespace rtp::mc
