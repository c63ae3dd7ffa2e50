/**
 * OutcomeEngine - Discrete multi-event round resolution.
 *
 * One round = a rare collapse draw, a three-way weighted plane draw, and on
 * a miss a possible second plane. The verdict is derived from those draws
 * alone and returned as an immutable RoundResolution.
 *
 * Draw order is fixed (rare, rare target, first event, second trigger,
 * second event) so a given seed reproduces the same rounds in every port.
 */

#ifndef RTP_OUTCOME_OUTCOME_ENGINE_HPP
#define RTP_OUTCOME_OUTCOME_ENGINE_HPP

#include "core/deterministic_rng.hpp"
#include "outcome/outcome_types.hpp"
#include "outcome/tuning.hpp"
#include <optional>

namespace rtp {

class RoundResolution {
public:
    /**
     * Builds the record from the raw draws and derives the verdict.
     * @throws InvalidArgument on an invalid side or a second event
     *         without a first-event miss
     */
    RoundResolution(Side selected_side,
                    OutcomeEvent first_event,
                    std::optional<OutcomeEvent> second_event,
                    std::optional<Side> rare_event_target);

    Side selected_side() const { return selected_side_; }

    OutcomeEvent first_event() const { return first_event_; }

    bool second_event_triggered() const { return second_event_.has_value(); }
    const std::optional<OutcomeEvent>& second_event() const { return second_event_; }

    bool rare_event_triggered() const { return rare_event_target_.has_value(); }
    const std::optional<Side>& rare_event_target() const { return rare_event_target_; }

    bool destroyed(Side side) const;
    bool survives(Side side) const { return !destroyed(side); }

    bool selected_side_wins() const { return !destroyed(selected_side_); }

    bool operator==(const RoundResolution& other) const;
    bool operator!=(const RoundResolution& other) const { return !(*this == other); }

private:
    Side selected_side_;
    OutcomeEvent first_event_;
    std::optional<OutcomeEvent> second_event_;
    std::optional<Side> rare_event_target_;
    bool destroyed_a_ = false;
    bool destroyed_b_ = false;
};

class OutcomeEngine {
public:
    /**
     * The engine draws from rng for its whole lifetime; rng must outlive it.
     * @throws InvalidArgument if the tuning table does not validate
     */
    explicit OutcomeEngine(DeterministicRng& rng,
                           const DiscreteTuning& tuning = DiscreteTuning::defaults());

    /** @throws InvalidArgument if selected_side is not A or B */
    RoundResolution resolve_round(Side selected_side);

    const DiscreteTuning& tuning() const { return tuning_; }

private:
    DeterministicRng& rng_;
    DiscreteTuning tuning_;

    // Cumulative-weight draw, order hitA -> hitB -> miss, strict comparisons.
    OutcomeEvent roll_event();
};

} // namespace rtp

#endif // RTP_OUTCOME_OUTCOME_ENGINE_HPP
