#include "outcome/hazard_engine.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <string>

namespace rtp {

HazardEngine::HazardEngine(DeterministicRng& rng, const HazardTuning& tuning)
    : rng_(rng), tuning_(tuning) {
    tuning_.validate();
}

HazardEngine::HazardEngine(DeterministicRng& rng, const HazardTuning& tuning,
                           const HazardState& state)
    : HazardEngine(rng, tuning) {
    if (!is_valid(state.run_type)) {
        throw InvalidArgument("HazardState: invalid run type " +
                              std::to_string(static_cast<int>(state.run_type)));
    }
    if (state.consecutive_losses > 0 && state.consecutive_wins > 0) {
        throw InvalidArgument("HazardState: win and loss streaks cannot both be active");
    }
    state_ = state;
}

RunType HazardEngine::start_round() {
    if (state_.round_active) {
        throw ContractViolation("start_round: round " +
                                std::to_string(state_.round_number) +
                                " was never closed with a verdict");
    }
    state_.round_number++;
    state_.run_type = tuning_.run_type_for(rng_.next());
    state_.round_active = true;
    return state_.run_type;
}

double HazardEngine::hazard_probability(int step_index) const {
    if (step_index < 0) {
        throw InvalidArgument("hazard_probability: negative step index " +
                              std::to_string(step_index));
    }

    double p = tuning_.base_for(state_.run_type)
             + tuning_.growth_for(state_.run_type) * step_index;

    // Multiply first, clamp last: near pMax the clamp can hide the mercy factor.
    if (state_.consecutive_losses >= tuning_.streak_threshold) {
        p *= tuning_.mercy_factor;
    } else if (state_.consecutive_wins >= tuning_.streak_threshold) {
        p *= tuning_.correction_factor;
    }

    return std::min(tuning_.p_max, std::max(tuning_.p_min, p));
}

bool HazardEngine::is_danger(int step_index) {
    return rng_.chance(hazard_probability(step_index));
}

void HazardEngine::on_round_won() {
    close_round("on_round_won");
    state_.consecutive_wins++;
    state_.consecutive_losses = 0;
}

void HazardEngine::on_round_lost() {
    close_round("on_round_lost");
    state_.consecutive_losses++;
    state_.consecutive_wins = 0;
}

void HazardEngine::close_round(const char* verdict) {
    if (!state_.round_active) {
        throw ContractViolation(std::string(verdict) +
                                ": no open round (verdict already given or "
                                "start_round not called)");
    }
    state_.round_active = false;
}

} // namespace rtp
