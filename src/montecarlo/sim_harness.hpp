/**
 * Simulation harness - Batch Monte Carlo over either outcome model.
 *
 * Each call builds its own DeterministicRng and engine from the seed and
 * drives the engine through its public contract only, so figures proven
 * here hold for production sessions using the same tuning.
 *
 * Parallel runs give every worker an independent RNG/engine pair seeded
 * base_seed + worker and merge the counts afterwards. A run with one
 * worker is identical to the sequential call.
 */

#ifndef RTP_MC_SIM_HARNESS_HPP
#define RTP_MC_SIM_HARNESS_HPP

#include "core/deterministic_rng.hpp"
#include "montecarlo/sim_results.hpp"
#include "outcome/tuning.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace rtp::mc {

enum class SimMode {
    DISCRETE,
    HAZARD
};

std::string to_string(SimMode mode);

/** @throws InvalidArgument on an unknown mode name */
SimMode parse_sim_mode(const std::string& name);

struct SimConfig {
    SimMode mode = SimMode::DISCRETE;
    uint64_t trials = 200000;
    uint32_t seed = 0x5EEDC0DE;
    unsigned workers = 1;
    int cashout_step = 5;               // hazard mode only
    uint64_t progress_interval = 50000; // trials between progress callbacks
    std::string tuning_path;            // empty = compiled-in defaults
    std::string output_path;            // empty = stdout
    bool verbose = false;
    bool progress = false;
};

// Upper bound on simulate_parallel workers, one thread each.
constexpr unsigned kMaxWorkers = 256;

using ProgressCallback = std::function<void(uint64_t completed, uint64_t total)>;

/**
 * Discrete model: one uniformly random side per trial, drawn from the
 * same RNG before the round is resolved.
 */
SimulationResults simulate(uint64_t trials, uint32_t seed,
                           const DiscreteTuning& tuning = DiscreteTuning::defaults(),
                           ProgressCallback on_progress = nullptr,
                           uint64_t progress_interval = 50000);

/**
 * Hazard model: each trial draws steps 0..cashout_step-1 and stops at the
 * first danger (loss) or cashes out after the last step (win).
 * @throws InvalidArgument if cashout_step < 1
 */
HazardSimulationResults simulate_hazard(uint64_t trials, uint32_t seed, int cashout_step,
                                        const HazardTuning& tuning = HazardTuning::defaults(),
                                        ProgressCallback on_progress = nullptr,
                                        uint64_t progress_interval = 50000);

/**
 * Worker w gets trials / workers trials (plus one for the first
 * trials % workers workers) and seed base_seed + w.
 * on_progress is called from the calling thread as workers finish.
 * @throws InvalidArgument if workers is 0 or above kMaxWorkers
 * @throws std::runtime_error if a worker thread cannot be started
 */
SimulationResults simulate_parallel(uint64_t trials, uint32_t base_seed, unsigned workers,
                                    const DiscreteTuning& tuning = DiscreteTuning::defaults(),
                                    ProgressCallback on_progress = nullptr);

HazardSimulationResults simulate_hazard_parallel(uint64_t trials, uint32_t base_seed,
                                                 unsigned workers, int cashout_step,
                                                 const HazardTuning& tuning = HazardTuning::defaults(),
                                                 ProgressCallback on_progress = nullptr);

} // namespace rtp::mc

#endif // RTP_MC_SIM_HARNESS_HPP
