/**
 * rtp_sim command line - argument parsing and the run loop behind the
 * rtp_sim executable, kept in the library so the tests can drive it with
 * string streams.
 *
 *   std::vector<std::string> args = {"rtp_sim", "--seed", "0x5EEDC0DE"};
 *   int status = run_cli(args, std::cout, std::cerr);
 */

#ifndef RTP_MC_SIM_CLI_HPP
#define RTP_MC_SIM_CLI_HPP

#include "montecarlo/sim_harness.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace rtp::mc {

struct CliOptions {
    SimConfig config;
    bool seed_given = false;
    bool show_help = false;
};

/**
 * Integer flag value, decimal or 0x-prefixed hex, in [min_value, max_value].
 * @throws InvalidArgument on malformed or out-of-range text
 */
uint64_t parse_flag_integer(const std::string& text, const std::string& flag,
                            uint64_t min_value, uint64_t max_value);

/**
 * args[0] is the program name.
 * @throws InvalidArgument on unknown flags, missing values or bad numbers
 */
CliOptions parse_cli_args(const std::vector<std::string>& args);

void print_usage(const std::string& prog, std::ostream& out);

/**
 * Parses args, runs the simulation and writes the results JSON to out
 * (or --output). Diagnostics, --verbose summaries and --progress records
 * go to err. Returns the process exit status: 0 on success, 1 on error.
 */
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace rtp::mc

#endif // RTP_MC_SIM_CLI_HPP
