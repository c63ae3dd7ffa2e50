/**
 * HazardEngine - Incremental per-step danger model.
 *
 * A round is a sequence of steps. start_round() rolls the run type, which
 * fixes how fast the per-step hazard grows; the caller then asks
 * is_danger(step) for step = 0, 1, 2, ... until a danger fires or the
 * player stops, and closes the round with exactly one verdict.
 *
 * Hazard at step i:
 *   p = base[runType] + growth[runType] * i
 *   p *= mercy       if consecutive losses >= threshold
 *   p *= correction  else if consecutive wins >= threshold
 *   p = clamp(p, pMin, pMax)
 *
 * Streak counters are session state and persist across rounds.
 */

#ifndef RTP_OUTCOME_HAZARD_ENGINE_HPP
#define RTP_OUTCOME_HAZARD_ENGINE_HPP

#include "core/deterministic_rng.hpp"
#include "outcome/outcome_types.hpp"
#include "outcome/tuning.hpp"

namespace rtp {

struct HazardState {
    RunType run_type = RunType::MEDIUM;
    unsigned consecutive_losses = 0;
    unsigned consecutive_wins = 0;
    unsigned round_number = 0;
    bool round_active = false;
};

class HazardEngine {
public:
    /**
     * rng must outlive the engine.
     * @throws InvalidArgument if the tuning table does not validate
     */
    explicit HazardEngine(DeterministicRng& rng,
                          const HazardTuning& tuning = HazardTuning::defaults());

    /**
     * Resumes a session from a saved state.
     * @throws InvalidArgument if both streak counters are nonzero or the
     *         run type is out of range
     */
    HazardEngine(DeterministicRng& rng, const HazardTuning& tuning,
                 const HazardState& state);

    /**
     * Opens a round: one draw decides the run type.
     * @throws ContractViolation if the previous round got no verdict
     */
    RunType start_round();

    /** @throws InvalidArgument if step_index < 0 */
    double hazard_probability(int step_index) const;

    /** One draw: true if this step is a danger event. */
    bool is_danger(int step_index);

    /** @throws ContractViolation if no round is open */
    void on_round_won();

    /** @throws ContractViolation if no round is open */
    void on_round_lost();

    RunType run_type() const { return state_.run_type; }
    unsigned consecutive_wins() const { return state_.consecutive_wins; }
    unsigned consecutive_losses() const { return state_.consecutive_losses; }
    unsigned round_number() const { return state_.round_number; }
    bool round_active() const { return state_.round_active; }

    const HazardState& state() const { return state_; }
    const HazardTuning& tuning() const { return tuning_; }

private:
    DeterministicRng& rng_;
    HazardTuning tuning_;
    HazardState state_;

    void close_round(const char* verdict);
};

} // namespace rtp

#endif // RTP_OUTCOME_HAZARD_ENGINE_HPP
