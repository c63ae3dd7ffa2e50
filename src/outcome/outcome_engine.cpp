#include "outcome/outcome_engine.hpp"
#include "core/errors.hpp"
#include <initializer_list>
#include <string>

namespace rtp {

// ── RoundResolution ──

RoundResolution::RoundResolution(Side selected_side,
                                 OutcomeEvent first_event,
                                 std::optional<OutcomeEvent> second_event,
                                 std::optional<Side> rare_event_target)
    : selected_side_(selected_side),
      first_event_(first_event),
      second_event_(second_event),
      rare_event_target_(rare_event_target) {
    if (!is_valid(selected_side_)) {
        throw InvalidArgument("RoundResolution: invalid selected side " +
                              std::to_string(static_cast<int>(selected_side_)));
    }
    if (second_event_ && first_event_ != OutcomeEvent::MISS) {
        throw InvalidArgument("RoundResolution: second event requires a first-event miss");
    }
    if (rare_event_target_ && !is_valid(*rare_event_target_)) {
        throw InvalidArgument("RoundResolution: invalid rare event target");
    }

    for (Side side : {Side::A, Side::B}) {
        bool hit = names_side(first_event_, side)
                || (second_event_ && names_side(*second_event_, side))
                || (rare_event_target_ && *rare_event_target_ == side);
        if (side == Side::A) destroyed_a_ = hit;
        else destroyed_b_ = hit;
    }
}

bool RoundResolution::destroyed(Side side) const {
    switch (side) {
        case Side::A: return destroyed_a_;
        case Side::B: return destroyed_b_;
    }
    throw InvalidArgument("RoundResolution: invalid side " +
                          std::to_string(static_cast<int>(side)));
}

bool RoundResolution::operator==(const RoundResolution& other) const {
    return selected_side_ == other.selected_side_
        && first_event_ == other.first_event_
        && second_event_ == other.second_event_
        && rare_event_target_ == other.rare_event_target_;
}

// ── OutcomeEngine ──

OutcomeEngine::OutcomeEngine(DeterministicRng& rng, const DiscreteTuning& tuning)
    : rng_(rng), tuning_(tuning) {
    tuning_.validate();
}

RoundResolution OutcomeEngine::resolve_round(Side selected_side) {
    if (!is_valid(selected_side)) {
        throw InvalidArgument("resolve_round: selected side must be A or B, got " +
                              std::to_string(static_cast<int>(selected_side)));
    }

    // 1. Rare collapse, independent of the planes
    std::optional<Side> rare_target;
    if (rng_.chance(tuning_.effective_rare_probability())) {
        rare_target = rng_.chance(0.5) ? Side::A : Side::B;
    }

    // 2. First plane
    OutcomeEvent first = roll_event();

    // 3. Second plane, only after a miss; its trigger is not tuned
    std::optional<OutcomeEvent> second;
    if (first == OutcomeEvent::MISS && rng_.chance(tuning_.base_second_on_miss)) {
        second = roll_event();
    }

    return RoundResolution(selected_side, first, second, rare_target);
}

OutcomeEvent OutcomeEngine::roll_event() {
    const double hit_a = tuning_.hit_a_weight();
    const double hit_b = tuning_.hit_b_weight();
    const double r = rng_.next() * tuning_.total_weight();

    if (r < hit_a) return OutcomeEvent::HIT_A;
    if (r < hit_a + hit_b) return OutcomeEvent::HIT_B;
    return OutcomeEvent::MISS;
}

} // namespace rtp
