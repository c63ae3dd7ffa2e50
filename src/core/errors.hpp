/**
 * Error taxonomy for the round-outcome core.
 *
 * InvalidArgument   - bad input from the caller (unknown side, empty pick
 *                     list, negative step index, invalid tuning table).
 * ContractViolation - the caller broke the round protocol of HazardEngine
 *                     (verdict without an open round, or a round left open).
 *
 * Both indicate a programming error upstream. The core never catches or
 * retries them.
 */

#ifndef RTP_CORE_ERRORS_HPP
#define RTP_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rtp {

class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument(what) {}
};

class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace rtp

#endif // RTP_CORE_ERRORS_HPP
