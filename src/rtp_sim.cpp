/**
 * rtp_sim - Offline RTP calibration for the round-outcome engines.
 *
 * Runs N seeded trials of the discrete or hazard model and writes the
 * aggregated statistics as JSON. Intended for operators re-checking a
 * tuning table after a change.
 *
 * Usage:
 *   rtp_sim [--mode discrete|hazard] [--trials N] [--seed S]
 *           [--tuning <path>] [--cashout-step K] [--workers W]
 *           [--output <path>] [--verbose] [--progress]
 */

#include "montecarlo/sim_cli.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    return rtp::mc::run_cli(args, std::cout, std::cerr);
}
