#include "montecarlo/sim_results.hpp"
#include "montecarlo/sim_harness.hpp"
#include "core/errors.hpp"
#include "io/json_writer.hpp"
#include <initializer_list>

namespace rtp::mc {

namespace {

double ratio(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

void write_config(io::JsonWriter& w, const SimConfig& config) {
    w.key("config").begin_object();
    w.kv("mode", to_string(config.mode));
    w.kv("trials", config.trials);
    w.kv("seed", config.seed);
    w.kv("seedHex", DeterministicRng(config.seed).seed_hex());
    w.kv("workers", config.workers);
    if (config.mode == SimMode::HAZARD) {
        w.kv("cashoutStep", config.cashout_step);
    }
    if (config.tuning_path.empty()) {
        w.key("tuningFile").null_value();
    } else {
        w.kv("tuningFile", config.tuning_path);
    }
    w.end_object();
}

} // namespace

// ── SimulationResults ──

double SimulationResults::win_rate() const {
    return ratio(static_cast<double>(wins), static_cast<double>(trials));
}

double SimulationResults::effective_rtp() const {
    return win_rate() * payout_ratio;
}

double SimulationResults::event_frequency(OutcomeEvent event) const {
    return ratio(static_cast<double>(event_count(event)), static_cast<double>(trials));
}

double SimulationResults::rare_event_frequency() const {
    return ratio(static_cast<double>(rare_events), static_cast<double>(trials));
}

double SimulationResults::second_event_frequency() const {
    return ratio(static_cast<double>(second_events), static_cast<double>(trials));
}

void SimulationResults::merge(const SimulationResults& other) {
    if (trials > 0 && other.trials > 0 && payout_ratio != other.payout_ratio) {
        throw InvalidArgument("merge: results were produced with different payout ratios");
    }
    if (trials == 0) payout_ratio = other.payout_ratio;

    trials += other.trials;
    wins += other.wins;
    for (size_t i = 0; i < event_counts.size(); i++) {
        event_counts[i] += other.event_counts[i];
    }
    rare_events += other.rare_events;
    second_events += other.second_events;
}

bool SimulationResults::operator==(const SimulationResults& other) const {
    return trials == other.trials
        && wins == other.wins
        && event_counts == other.event_counts
        && rare_events == other.rare_events
        && second_events == other.second_events
        && payout_ratio == other.payout_ratio;
}

// ── HazardSimulationResults ──

double HazardSimulationResults::win_rate() const {
    return ratio(static_cast<double>(wins), static_cast<double>(trials));
}

double HazardSimulationResults::effective_rtp() const {
    return ratio(total_payout, total_stake);
}

double HazardSimulationResults::run_type_frequency(RunType type) const {
    return ratio(static_cast<double>(run_type_counts[static_cast<size_t>(type)]),
                 static_cast<double>(trials));
}

void HazardSimulationResults::merge(const HazardSimulationResults& other) {
    if (trials > 0 && other.trials > 0 && cashout_step != other.cashout_step) {
        throw InvalidArgument("merge: results were produced with different cash-out steps");
    }
    if (trials == 0) {
        cashout_step = other.cashout_step;
        dangers_by_step.assign(other.dangers_by_step.size(), 0);
    }

    trials += other.trials;
    wins += other.wins;
    for (size_t i = 0; i < run_type_counts.size(); i++) {
        run_type_counts[i] += other.run_type_counts[i];
    }
    for (size_t i = 0; i < other.dangers_by_step.size() && i < dangers_by_step.size(); i++) {
        dangers_by_step[i] += other.dangers_by_step[i];
    }
    total_stake += other.total_stake;
    total_payout += other.total_payout;
}

bool HazardSimulationResults::operator==(const HazardSimulationResults& other) const {
    return trials == other.trials
        && wins == other.wins
        && cashout_step == other.cashout_step
        && run_type_counts == other.run_type_counts
        && dangers_by_step == other.dangers_by_step
        && total_stake == other.total_stake
        && total_payout == other.total_payout;
}

// ── JSON ──

void write_results_json(const SimulationResults& results,
                        const DiscreteTuning& tuning,
                        const SimConfig& config,
                        std::ostream& out) {
    io::JsonWriter w(out);
    w.begin_object();

    write_config(w, config);

    w.key("results").begin_object();
    w.kv("trials", results.trials);
    w.kv("wins", results.wins);
    w.kv("winRate", results.win_rate());
    w.kv("effectiveRtp", results.effective_rtp());
    w.key("eventFrequency").begin_object();
    for (OutcomeEvent e : {OutcomeEvent::HIT_A, OutcomeEvent::HIT_B, OutcomeEvent::MISS}) {
        w.kv(to_string(e), results.event_frequency(e));
    }
    w.end_object();
    w.kv("rareEventFrequency", results.rare_event_frequency());
    w.kv("secondEventFrequency", results.second_event_frequency());
    w.end_object();

    w.key("analytic").begin_object();
    w.kv("winProbability", 0.5 * (tuning.analytic_win_probability(Side::A) +
                                  tuning.analytic_win_probability(Side::B)));
    w.kv("rtp", tuning.analytic_rtp());
    w.kv("targetRtp", tuning.target_rtp);
    w.kv("payoutRatio", tuning.payout_ratio());
    w.kv("rareProbability", tuning.effective_rare_probability());
    w.end_object();

    w.end_object();
    out << '\n';
}

void write_hazard_results_json(const HazardSimulationResults& results,
                               const HazardTuning& tuning,
                               const SimConfig& config,
                               std::ostream& out) {
    io::JsonWriter w(out);
    w.begin_object();

    write_config(w, config);

    w.key("results").begin_object();
    w.kv("trials", results.trials);
    w.kv("wins", results.wins);
    w.kv("winRate", results.win_rate());
    w.kv("effectiveRtp", results.effective_rtp());
    w.kv("payoutMultiple", tuning.payout_multiple(results.cashout_step));
    w.kv("totalStake", results.total_stake);
    w.kv("totalPayout", results.total_payout);

    w.key("runTypeFrequency").begin_object();
    for (RunType t : {RunType::SHORT, RunType::MEDIUM, RunType::LONG}) {
        w.kv(to_string(t), results.run_type_frequency(t));
    }
    w.end_object();

    w.key("dangersByStep").begin_array();
    for (uint64_t n : results.dangers_by_step) {
        w.value(n);
    }
    w.end_array();
    w.end_object();

    w.end_object();
    out << '\n';
}

} // namespace rtp::mc
