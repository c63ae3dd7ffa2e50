/**
 * TuningLoader - Reads tuning tables from a JSON file.
 *
 * Format (every key optional, missing keys keep the compiled-in default):
 * {
 *   "discrete": {
 *     "baseHitA": 0.4, "baseHitB": 0.4, "baseMiss": 0.2,
 *     "baseRare": 0.05, "baseSecondOnMiss": 0.1,
 *     "hitMultiplier": 1.125, "missMultiplier": 0.5, "rareMultiplier": 5.2,
 *     "stake": 10, "payoutOnWin": 20, "targetRtp": 0.95
 *   },
 *   "hazard": {
 *     "baseProbability": { "short": 0.25, "medium": 0.14, "long": 0.08 },
 *     "growthRate":      { "short": 0.06, "medium": 0.03, "long": 0.015 },
 *     "shortCutoff": 0.3, "mediumCutoff": 0.8,
 *     "streakThreshold": 3, "mercyFactor": 0.8, "correctionFactor": 1.1,
 *     "pMin": 0.04, "pMax": 0.3, "stake": 10, "stepMultiplier": 1.1
 *   }
 * }
 *
 * Unknown keys are rejected so a misspelt knob cannot silently fall back
 * to its default.
 */

#ifndef RTP_IO_TUNING_LOADER_HPP
#define RTP_IO_TUNING_LOADER_HPP

#include "io/json_reader.hpp"
#include "outcome/tuning.hpp"
#include <string>

namespace rtp::io {

struct TuningSet {
    DiscreteTuning discrete = DiscreteTuning::defaults();
    HazardTuning hazard = HazardTuning::defaults();
};

class TuningLoader {
public:
    /**
     * Build validated tables from a parsed document.
     * @throws std::runtime_error on wrong value types
     * @throws InvalidArgument on unknown keys or out-of-domain values
     */
    static TuningSet load(const JsonValue& root);

    /** @throws std::runtime_error if the file cannot be read or parsed */
    static TuningSet load_file(const std::string& path);
};

} // namespace rtp::io

#endif // RTP_IO_TUNING_LOADER_HPP
