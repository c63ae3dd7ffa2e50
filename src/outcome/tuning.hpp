/**
 * Tuning tables - the single place every probability constant lives.
 *
 * The RTP of the discrete model depends on all of DiscreteTuning jointly,
 * and the hazard curve on all of HazardTuning jointly, so neither table is
 * split up or mutated at runtime. Engines hold their own copy.
 *
 * Discrete model, effective probabilities with defaults():
 *   hitA  = 0.4 x 1.125 / 1.0 = 45%
 *   hitB  = 0.4 x 1.125 / 1.0 = 45%
 *   miss  = 0.2 x 0.5   / 1.0 = 10%
 *   rare  = 0.05 x 5.2        = 26%   (targets either side with 1/2)
 *   second plane on miss      = 10%   (untuned)
 *
 *   P(side survives planes) = 1 - 0.45 - 0.10 x 0.10 x 0.45 = 0.5455
 *   P(side survives rare)   = 1 - 0.26 / 2                 = 0.87
 *   P(win) = 0.5455 x 0.87 = 0.474585  ->  RTP = 0.474585 x 2 = 94.9%
 *
 * design_brief() keeps rare x 2.8 (14%). Its additive estimate
 * 0.45 + 0.0045 + 0.07 = 0.5245 double-counts a hit and a collapse on the
 * same side; the exact figure is P(win) = 0.5455 x 0.93 = 0.5073, RTP 101.5%.
 */

#ifndef RTP_OUTCOME_TUNING_HPP
#define RTP_OUTCOME_TUNING_HPP

#include "outcome/outcome_types.hpp"
#include <array>

namespace rtp {

struct DiscreteTuning {
    // Design-brief probabilities
    double base_hit_a = 0.4;
    double base_hit_b = 0.4;
    double base_miss = 0.2;
    double base_rare = 0.05;
    double base_second_on_miss = 0.10;

    // Multipliers applied to reach the target RTP
    double hit_multiplier = 1.125;
    double miss_multiplier = 0.5;
    double rare_multiplier = 5.2;

    // Economics: a win returns payout_on_win for a bet of stake
    double stake = 10.0;
    double payout_on_win = 20.0;
    double target_rtp = 0.95;

    static DiscreteTuning defaults();

    /** The literal design-brief table (rare x 2.8). */
    static DiscreteTuning design_brief();

    double hit_a_weight() const { return base_hit_a * hit_multiplier; }
    double hit_b_weight() const { return base_hit_b * hit_multiplier; }
    double miss_weight() const { return base_miss * miss_multiplier; }
    double total_weight() const { return hit_a_weight() + hit_b_weight() + miss_weight(); }

    double weight(OutcomeEvent event) const;

    /** Normalized probability of one weighted draw producing event. */
    double probability(OutcomeEvent event) const;

    /** min(1, base_rare x rare_multiplier) */
    double effective_rare_probability() const;

    double payout_ratio() const { return payout_on_win / stake; }

    /**
     * Exact probability that the given side survives a round:
     * (1 - P(hit) - P(miss) P(second) P(hit)) x (1 - P(rare) / 2).
     */
    double analytic_win_probability(Side side) const;

    /** Expected RTP for a uniformly chosen side. */
    double analytic_rtp() const;

    /** @throws InvalidArgument if any entry is out of its domain */
    void validate() const;
};

struct HazardTuning {
    // Indexed by RunType: short, medium, long
    std::array<double, kRunTypeCount> base_probability{{0.25, 0.14, 0.08}};
    std::array<double, kRunTypeCount> growth_rate{{0.06, 0.03, 0.015}};

    // [0, short_cutoff) -> short, [short_cutoff, medium_cutoff) -> medium, rest -> long
    double short_cutoff = 0.30;
    double medium_cutoff = 0.80;

    unsigned streak_threshold = 3;
    double mercy_factor = 0.80;       // after streak_threshold losses
    double correction_factor = 1.10;  // after streak_threshold wins

    double p_min = 0.04;
    double p_max = 0.30;

    // Cash-out economics, used for reporting only
    double stake = 10.0;
    double step_multiplier = 1.1;

    static HazardTuning defaults();

    double base_for(RunType type) const;
    double growth_for(RunType type) const;

    /** Maps a draw in [0, 1) onto the run-type partition. */
    RunType run_type_for(double r) const;

    /** step_multiplier^steps, quoted to 4 decimals. */
    double payout_multiple(int steps) const;

    /** @throws InvalidArgument if any entry is out of its domain */
    void validate() const;
};

} // namespace rtp

#endif // RTP_OUTCOME_TUNING_HPP
