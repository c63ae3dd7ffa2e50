#include "outcome/outcome_types.hpp"
#include "core/errors.hpp"

namespace rtp {

bool is_valid(Side side) {
    return side == Side::A || side == Side::B;
}

bool is_valid(RunType type) {
    return type == RunType::SHORT || type == RunType::MEDIUM || type == RunType::LONG;
}

bool names_side(OutcomeEvent event, Side side) {
    switch (event) {
        case OutcomeEvent::HIT_A: return side == Side::A;
        case OutcomeEvent::HIT_B: return side == Side::B;
        case OutcomeEvent::MISS:  return false;
    }
    return false;
}

std::string to_string(Side side) {
    switch (side) {
        case Side::A: return "A";
        case Side::B: return "B";
    }
    throw InvalidArgument("invalid Side value " +
                          std::to_string(static_cast<int>(side)));
}

std::string to_string(OutcomeEvent event) {
    switch (event) {
        case OutcomeEvent::HIT_A: return "hitA";
        case OutcomeEvent::HIT_B: return "hitB";
        case OutcomeEvent::MISS:  return "miss";
    }
    throw InvalidArgument("invalid OutcomeEvent value " +
                          std::to_string(static_cast<int>(event)));
}

std::string to_string(RunType type) {
    switch (type) {
        case RunType::SHORT:  return "short";
        case RunType::MEDIUM: return "medium";
        case RunType::LONG:   return "long";
    }
    throw InvalidArgument("invalid RunType value " +
                          std::to_string(static_cast<int>(type)));
}

Side parse_side(const std::string& name) {
    if (name == "A" || name == "a") return Side::A;
    if (name == "B" || name == "b") return Side::B;
    throw InvalidArgument("unknown side '" + name + "' (expected A or B)");
}

RunType parse_run_type(const std::string& name) {
    if (name == "short")  return RunType::SHORT;
    if (name == "medium") return RunType::MEDIUM;
    if (name == "long")   return RunType::LONG;
    throw InvalidArgument("unknown run type '" + name + "'");
}

} // namespace rtp
