/**
 * Simulation result records and their JSON serialization.
 *
 * Results hold raw counts only; every rate is derived from the counts on
 * demand, so results from independent sessions merge by summing counts.
 */

#ifndef RTP_MC_SIM_RESULTS_HPP
#define RTP_MC_SIM_RESULTS_HPP

#include "outcome/outcome_types.hpp"
#include "outcome/tuning.hpp"
#include <array>
#include <cstdint>
#include <ostream>
#include <vector>

namespace rtp::mc {

struct SimConfig;

// Discrete model
struct SimulationResults {
    uint64_t trials = 0;
    uint64_t wins = 0;
    std::array<uint64_t, kOutcomeEventCount> event_counts{};  // first and second draws
    uint64_t rare_events = 0;
    uint64_t second_events = 0;
    double payout_ratio = 0.0;

    uint64_t event_count(OutcomeEvent event) const {
        return event_counts[static_cast<size_t>(event)];
    }

    double win_rate() const;
    double effective_rtp() const;

    // Per trial; the three event frequencies sum to 1 + second_event_frequency()
    double event_frequency(OutcomeEvent event) const;
    double rare_event_frequency() const;
    double second_event_frequency() const;

    /** @throws InvalidArgument if the payout ratios differ */
    void merge(const SimulationResults& other);

    bool operator==(const SimulationResults& other) const;
};

// Incremental model with a fixed cash-out step
struct HazardSimulationResults {
    uint64_t trials = 0;
    uint64_t wins = 0;
    int cashout_step = 0;
    std::array<uint64_t, kRunTypeCount> run_type_counts{};
    std::vector<uint64_t> dangers_by_step;  // size cashout_step
    double total_stake = 0.0;
    double total_payout = 0.0;

    double win_rate() const;
    double effective_rtp() const;
    double run_type_frequency(RunType type) const;

    /** @throws InvalidArgument if the cash-out steps differ */
    void merge(const HazardSimulationResults& other);

    bool operator==(const HazardSimulationResults& other) const;
};

/**
 * Format: { "config": {...}, "results": {...}, "analytic": {...} }
 */
void write_results_json(const SimulationResults& results,
                        const DiscreteTuning& tuning,
                        const SimConfig& config,
                        std::ostream& out);

/**
 * Format: { "config": {...}, "results": {...} }
 */
void write_hazard_results_json(const HazardSimulationResults& results,
                               const HazardTuning& tuning,
                               const SimConfig& config,
                               std::ostream& out);

} // namespace rtp::mc

#endif // RTP_MC_SIM_RESULTS_HPP
