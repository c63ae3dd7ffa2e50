#include "io/tuning_loader.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <initializer_list>

namespace rtp::io {

namespace {

void reject_unknown_keys(const JsonValue& obj, const std::string& section,
                         std::initializer_list<const char*> allowed) {
    for (const auto& [key, value] : obj.members()) {
        bool known = false;
        for (const char* name : allowed) {
            if (key == name) { known = true; break; }
        }
        if (!known) {
            throw InvalidArgument("tuning: unknown key '" + key + "' in \"" + section + "\"");
        }
    }
}

const JsonValue& section(const JsonValue& root, const char* name) {
    const JsonValue& s = root[name];
    if (!s.is_null() && !s.is_object()) {
        throw std::runtime_error(std::string("tuning: \"") + name + "\" must be an object");
    }
    return s;
}

void read_per_run_type(const JsonValue& obj, const char* name,
                       std::array<double, kRunTypeCount>& out) {
    const JsonValue& table = obj[name];
    if (table.is_null()) return;
    if (!table.is_object()) {
        throw std::runtime_error(std::string("tuning: \"") + name +
                                 "\" must be an object keyed by run type");
    }
    for (const auto& [key, value] : table.members()) {
        RunType type = parse_run_type(key);
        out[static_cast<size_t>(type)] = value.as_number();
    }
}

DiscreteTuning load_discrete(const JsonValue& d) {
    DiscreteTuning t = DiscreteTuning::defaults();
    if (d.is_null()) return t;

    reject_unknown_keys(d, "discrete", {
        "baseHitA", "baseHitB", "baseMiss", "baseRare", "baseSecondOnMiss",
        "hitMultiplier", "missMultiplier", "rareMultiplier",
        "stake", "payoutOnWin", "targetRtp"});

    t.base_hit_a          = d["baseHitA"].get_number(t.base_hit_a);
    t.base_hit_b          = d["baseHitB"].get_number(t.base_hit_b);
    t.base_miss           = d["baseMiss"].get_number(t.base_miss);
    t.base_rare           = d["baseRare"].get_number(t.base_rare);
    t.base_second_on_miss = d["baseSecondOnMiss"].get_number(t.base_second_on_miss);
    t.hit_multiplier      = d["hitMultiplier"].get_number(t.hit_multiplier);
    t.miss_multiplier     = d["missMultiplier"].get_number(t.miss_multiplier);
    t.rare_multiplier     = d["rareMultiplier"].get_number(t.rare_multiplier);
    t.stake               = d["stake"].get_number(t.stake);
    t.payout_on_win       = d["payoutOnWin"].get_number(t.payout_on_win);
    t.target_rtp          = d["targetRtp"].get_number(t.target_rtp);

    t.validate();
    return t;
}

HazardTuning load_hazard(const JsonValue& h) {
    HazardTuning t = HazardTuning::defaults();
    if (h.is_null()) return t;

    reject_unknown_keys(h, "hazard", {
        "baseProbability", "growthRate", "shortCutoff", "mediumCutoff",
        "streakThreshold", "mercyFactor", "correctionFactor",
        "pMin", "pMax", "stake", "stepMultiplier"});

    read_per_run_type(h, "baseProbability", t.base_probability);
    read_per_run_type(h, "growthRate", t.growth_rate);

    t.short_cutoff      = h["shortCutoff"].get_number(t.short_cutoff);
    t.medium_cutoff     = h["mediumCutoff"].get_number(t.medium_cutoff);
    t.mercy_factor      = h["mercyFactor"].get_number(t.mercy_factor);
    t.correction_factor = h["correctionFactor"].get_number(t.correction_factor);
    t.p_min             = h["pMin"].get_number(t.p_min);
    t.p_max             = h["pMax"].get_number(t.p_max);
    t.stake             = h["stake"].get_number(t.stake);
    t.step_multiplier   = h["stepMultiplier"].get_number(t.step_multiplier);

    double threshold = h["streakThreshold"].get_number(t.streak_threshold);
    if (threshold < 1.0 || threshold != std::floor(threshold) || threshold > 1e6) {
        throw InvalidArgument("tuning: streakThreshold must be a positive integer");
    }
    t.streak_threshold = static_cast<unsigned>(threshold);

    t.validate();
    return t;
}

} // namespace

TuningSet TuningLoader::load(const JsonValue& root) {
    if (!root.is_object()) {
        throw std::runtime_error("tuning: document root must be an object");
    }
    reject_unknown_keys(root, "root", {"discrete", "hazard"});

    TuningSet set;
    set.discrete = load_discrete(section(root, "discrete"));
    set.hazard = load_hazard(section(root, "hazard"));
    return set;
}

TuningSet TuningLoader::load_file(const std::string& path) {
    return load(JsonReader::parse_file(path));
}

} // namespace rtp::io
