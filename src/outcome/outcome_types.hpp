/**
 * Enumerations shared by the discrete and incremental outcome models,
 * plus name conversions used by the CLI and the JSON output.
 */

#ifndef RTP_OUTCOME_OUTCOME_TYPES_HPP
#define RTP_OUTCOME_OUTCOME_TYPES_HPP

#include <string>

namespace rtp {

enum class Side {
    A,
    B
};

// Result of one weighted draw in the discrete model.
enum class OutcomeEvent {
    HIT_A,
    HIT_B,
    MISS
};

// Per-round escalation category in the incremental model.
enum class RunType {
    SHORT,
    MEDIUM,
    LONG
};

constexpr int kOutcomeEventCount = 3;
constexpr int kRunTypeCount = 3;

bool is_valid(Side side);
bool is_valid(RunType type);

/** Side named by a hit event; false for MISS. */
bool names_side(OutcomeEvent event, Side side);

std::string to_string(Side side);
std::string to_string(OutcomeEvent event);
std::string to_string(RunType type);

// Throw InvalidArgument on unknown names.
Side parse_side(const std::string& name);
RunType parse_run_type(const std::string& name);

} // namespace rtp

#endif // RTP_OUTCOME_OUTCOME_TYPES_HPP
