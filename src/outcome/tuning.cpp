#include "outcome/tuning.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace rtp {

namespace {

void require_probability(double p, const char* name) {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw InvalidArgument(std::string(name) + " must lie in [0, 1], got " +
                              std::to_string(p));
    }
}

void require_non_negative(double v, const char* name) {
    if (!(v >= 0.0) || std::isinf(v)) {
        throw InvalidArgument(std::string(name) + " must be finite and >= 0, got " +
                              std::to_string(v));
    }
}

size_t index_of(RunType type) {
    return static_cast<size_t>(type);
}

} // namespace

// ── DiscreteTuning ──

DiscreteTuning DiscreteTuning::defaults() {
    return DiscreteTuning{};
}

DiscreteTuning DiscreteTuning::design_brief() {
    DiscreteTuning t;
    t.rare_multiplier = 2.8;
    return t;
}

double DiscreteTuning::weight(OutcomeEvent event) const {
    switch (event) {
        case OutcomeEvent::HIT_A: return hit_a_weight();
        case OutcomeEvent::HIT_B: return hit_b_weight();
        case OutcomeEvent::MISS:  return miss_weight();
    }
    throw InvalidArgument("invalid OutcomeEvent value " +
                          std::to_string(static_cast<int>(event)));
}

double DiscreteTuning::probability(OutcomeEvent event) const {
    return weight(event) / total_weight();
}

double DiscreteTuning::effective_rare_probability() const {
    return std::min(1.0, base_rare * rare_multiplier);
}

double DiscreteTuning::analytic_win_probability(Side side) const {
    if (!is_valid(side)) {
        throw InvalidArgument("invalid Side value " +
                              std::to_string(static_cast<int>(side)));
    }
    double p_hit = probability(side == Side::A ? OutcomeEvent::HIT_A
                                               : OutcomeEvent::HIT_B);
    double p_miss = probability(OutcomeEvent::MISS);

    double survives_planes = 1.0 - p_hit - p_miss * base_second_on_miss * p_hit;
    double survives_rare = 1.0 - effective_rare_probability() * 0.5;
    return survives_planes * survives_rare;
}

double DiscreteTuning::analytic_rtp() const {
    double p_win = 0.5 * (analytic_win_probability(Side::A) +
                          analytic_win_probability(Side::B));
    return p_win * payout_ratio();
}

void DiscreteTuning::validate() const {
    require_non_negative(base_hit_a, "baseHitA");
    require_non_negative(base_hit_b, "baseHitB");
    require_non_negative(base_miss, "baseMiss");
    require_probability(base_rare, "baseRare");
    require_probability(base_second_on_miss, "baseSecondOnMiss");
    require_non_negative(hit_multiplier, "hitMultiplier");
    require_non_negative(miss_multiplier, "missMultiplier");
    require_non_negative(rare_multiplier, "rareMultiplier");

    if (!(total_weight() > 0.0)) {
        throw InvalidArgument("discrete tuning: total event weight must be > 0");
    }
    if (!(stake > 0.0)) {
        throw InvalidArgument("discrete tuning: stake must be > 0");
    }
    require_non_negative(payout_on_win, "payoutOnWin");
    require_non_negative(target_rtp, "targetRtp");
}

// ── HazardTuning ──

HazardTuning HazardTuning::defaults() {
    return HazardTuning{};
}

double HazardTuning::base_for(RunType type) const {
    return base_probability.at(index_of(type));
}

double HazardTuning::growth_for(RunType type) const {
    return growth_rate.at(index_of(type));
}

RunType HazardTuning::run_type_for(double r) const {
    if (r < short_cutoff) return RunType::SHORT;
    if (r < medium_cutoff) return RunType::MEDIUM;
    return RunType::LONG;
}

double HazardTuning::payout_multiple(int steps) const {
    if (steps < 0) {
        throw InvalidArgument("payout_multiple: negative step count " +
                              std::to_string(steps));
    }
    double m = std::pow(step_multiplier, steps);
    return std::round(m * 1e4) / 1e4;
}

void HazardTuning::validate() const {
    for (int i = 0; i < kRunTypeCount; i++) {
        require_probability(base_probability[i], "baseProbability");
        require_non_negative(growth_rate[i], "growthRate");
    }

    if (!(short_cutoff >= 0.0 && short_cutoff <= medium_cutoff && medium_cutoff <= 1.0)) {
        throw InvalidArgument("hazard tuning: run-type cutoffs must satisfy "
                              "0 <= short <= medium <= 1");
    }
    if (streak_threshold == 0) {
        throw InvalidArgument("hazard tuning: streakThreshold must be >= 1");
    }
    if (!(mercy_factor > 0.0 && mercy_factor <= 1.0)) {
        throw InvalidArgument("hazard tuning: mercyFactor must lie in (0, 1]");
    }
    if (!(correction_factor >= 1.0) || std::isinf(correction_factor)) {
        throw InvalidArgument("hazard tuning: correctionFactor must be finite and >= 1");
    }

    require_probability(p_min, "pMin");
    require_probability(p_max, "pMax");
    if (p_min > p_max) {
        throw InvalidArgument("hazard tuning: pMin must not exceed pMax");
    }

    if (!(stake > 0.0)) {
        throw InvalidArgument("hazard tuning: stake must be > 0");
    }
    if (!(step_multiplier >= 1.0) || std::isinf(step_multiplier)) {
        throw InvalidArgument("hazard tuning: stepMultiplier must be finite and >= 1");
    }
}

} // namespace rtp
