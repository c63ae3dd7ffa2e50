#include "montecarlo/sim_harness.hpp"
#include "core/errors.hpp"
#include "outcome/hazard_engine.hpp"
#include "outcome/outcome_engine.hpp"
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace rtp::mc {

std::string to_string(SimMode mode) {
    switch (mode) {
        case SimMode::DISCRETE: return "discrete";
        case SimMode::HAZARD:   return "hazard";
    }
    return "unknown";
}

SimMode parse_sim_mode(const std::string& name) {
    if (name == "discrete") return SimMode::DISCRETE;
    if (name == "hazard")   return SimMode::HAZARD;
    throw InvalidArgument("unknown mode '" + name + "' (expected discrete or hazard)");
}

namespace {

void report(const ProgressCallback& on_progress, uint64_t done, uint64_t total,
            uint64_t interval) {
    if (!on_progress) return;
    if (done == total || (interval > 0 && done % interval == 0)) {
        on_progress(done, total);
    }
}

uint64_t share_of(uint64_t trials, unsigned workers, unsigned w) {
    return trials / workers + (w < trials % workers ? 1 : 0);
}

// Runs job(w) on one thread per worker and rethrows the first failure after
// every thread has joined. Threads already started are joined before a
// thread-creation failure is reported.
template <typename Result, typename Job>
Result run_workers(unsigned workers, uint64_t trials, const ProgressCallback& on_progress,
                   Job job) {
    if (workers == 0) {
        throw InvalidArgument("simulate_parallel: workers must be >= 1");
    }
    if (workers > kMaxWorkers) {
        throw InvalidArgument("simulate_parallel: workers must be <= " +
                              std::to_string(kMaxWorkers) + ", got " +
                              std::to_string(workers));
    }

    std::vector<Result> partials(workers);
    std::vector<std::exception_ptr> failures(workers);
    std::vector<std::thread> threads;
    threads.reserve(workers);

    try {
        for (unsigned w = 0; w < workers; w++) {
            threads.emplace_back([&, w]() {
                try {
                    partials[w] = job(w);
                } catch (...) {
                    failures[w] = std::current_exception();
                }
            });
        }
    } catch (const std::system_error& e) {
        for (auto& t : threads) t.join();
        throw std::runtime_error("simulate_parallel: cannot start worker thread " +
                                 std::to_string(threads.size()) + ": " + e.what());
    }

    Result merged;
    uint64_t completed = 0;
    for (unsigned w = 0; w < workers; w++) {
        threads[w].join();
        completed += share_of(trials, workers, w);
        if (on_progress && !failures[w]) on_progress(completed, trials);
    }

    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }
    for (const auto& part : partials) {
        merged.merge(part);
    }
    return merged;
}

} // namespace

SimulationResults simulate(uint64_t trials, uint32_t seed,
                           const DiscreteTuning& tuning,
                           ProgressCallback on_progress,
                           uint64_t progress_interval) {
    DeterministicRng rng(seed);
    OutcomeEngine engine(rng, tuning);

    SimulationResults results;
    results.payout_ratio = tuning.payout_ratio();

    for (uint64_t i = 0; i < trials; i++) {
        Side picked = rng.chance(0.5) ? Side::A : Side::B;
        RoundResolution round = engine.resolve_round(picked);

        results.trials++;
        if (round.selected_side_wins()) results.wins++;
        if (round.rare_event_triggered()) results.rare_events++;

        results.event_counts[static_cast<size_t>(round.first_event())]++;
        if (round.second_event_triggered()) {
            results.second_events++;
            results.event_counts[static_cast<size_t>(*round.second_event())]++;
        }

        report(on_progress, i + 1, trials, progress_interval);
    }

    return results;
}

HazardSimulationResults simulate_hazard(uint64_t trials, uint32_t seed, int cashout_step,
                                        const HazardTuning& tuning,
                                        ProgressCallback on_progress,
                                        uint64_t progress_interval) {
    if (cashout_step < 1) {
        throw InvalidArgument("simulate_hazard: cashout_step must be >= 1, got " +
                              std::to_string(cashout_step));
    }

    DeterministicRng rng(seed);
    HazardEngine engine(rng, tuning);

    HazardSimulationResults results;
    results.cashout_step = cashout_step;
    results.dangers_by_step.assign(static_cast<size_t>(cashout_step), 0);

    const double payout = tuning.stake * tuning.payout_multiple(cashout_step);

    for (uint64_t i = 0; i < trials; i++) {
        RunType type = engine.start_round();
        results.run_type_counts[static_cast<size_t>(type)]++;

        bool lost = false;
        for (int step = 0; step < cashout_step; step++) {
            if (engine.is_danger(step)) {
                results.dangers_by_step[static_cast<size_t>(step)]++;
                lost = true;
                break;
            }
        }

        results.trials++;
        results.total_stake += tuning.stake;
        if (lost) {
            engine.on_round_lost();
        } else {
            engine.on_round_won();
            results.wins++;
            results.total_payout += payout;
        }

        report(on_progress, i + 1, trials, progress_interval);
    }

    return results;
}

SimulationResults simulate_parallel(uint64_t trials, uint32_t base_seed, unsigned workers,
                                    const DiscreteTuning& tuning,
                                    ProgressCallback on_progress) {
    return run_workers<SimulationResults>(workers, trials, on_progress, [&](unsigned w) {
        return simulate(share_of(trials, workers, w), base_seed + w, tuning);
    });
}

HazardSimulationResults simulate_hazard_parallel(uint64_t trials, uint32_t base_seed,
                                                 unsigned workers, int cashout_step,
                                                 const HazardTuning& tuning,
                                                 ProgressCallback on_progress) {
    return run_workers<HazardSimulationResults>(workers, trials, on_progress, [&](unsigned w) {
        return simulate_hazard(share_of(trials, workers, w), base_seed + w,
                               cashout_step, tuning);
    });
}

} // namespace rtp::mc
