#include <catch2/catch.hpp>

#include "core/deterministic_rng.hpp"
#include "core/errors.hpp"
#include "outcome/hazard_engine.hpp"
#include "outcome/tuning.hpp"

#include <vector>

using namespace rtp;

namespace {

const RunType kRunTypes[] = {RunType::SHORT, RunType::MEDIUM, RunType::LONG};

HazardState streak_state(RunType type, unsigned losses, unsigned wins) {
    HazardState s;
    s.run_type = type;
    s.consecutive_losses = losses;
    s.consecutive_wins = wins;
    return s;
}

double raw_hazard(const HazardTuning& t, RunType type, int step) {
    return t.base_for(type) + t.growth_for(type) * step;
}

} // namespace

TEST_CASE("medium run without streak follows base plus growth", "[hazard]") {
    DeterministicRng rng(1u);
    HazardEngine engine(rng, HazardTuning::defaults(),
                        streak_state(RunType::MEDIUM, 0, 0));

    REQUIRE(engine.hazard_probability(0) == Approx(0.14));
    REQUIRE(engine.hazard_probability(5) == Approx(0.29));
    // raw 0.44 is above pMax
    REQUIRE(engine.hazard_probability(10) == 0.30);
}

TEST_CASE("fresh engine starts as a medium run with no streak", "[hazard]") {
    DeterministicRng rng(1u);
    HazardEngine engine(rng);
    REQUIRE(engine.run_type() == RunType::MEDIUM);
    REQUIRE(engine.consecutive_wins() == 0);
    REQUIRE(engine.consecutive_losses() == 0);
    REQUIRE(engine.round_number() == 0);
    REQUIRE_FALSE(engine.round_active());
    REQUIRE(engine.hazard_probability(0) == Approx(0.14));
}

TEST_CASE("hazard stays inside the clamp band for every state", "[hazard]") {
    DeterministicRng rng(1u);
    const HazardTuning tuning = HazardTuning::defaults();

    std::vector<std::pair<unsigned, unsigned>> streaks = {{0, 0}};
    for (unsigned n = 1; n <= 6; n++) {
        streaks.push_back({n, 0});
        streaks.push_back({0, n});
    }
    streaks.push_back({1000, 0});
    streaks.push_back({0, 1000});

    for (RunType type : kRunTypes) {
        for (const auto& [losses, wins] : streaks) {
            HazardEngine engine(rng, tuning, streak_state(type, losses, wins));
            for (int step = 0; step <= 1000; step++) {
                double p = engine.hazard_probability(step);
                REQUIRE(p >= tuning.p_min);
                REQUIRE(p <= tuning.p_max);
            }
        }
    }
}

TEST_CASE("hazard is non-decreasing within a round", "[hazard]") {
    DeterministicRng rng(1u);
    for (RunType type : kRunTypes) {
        HazardEngine engine(rng, HazardTuning::defaults(), streak_state(type, 0, 0));
        for (int step = 1; step <= 50; step++) {
            REQUIRE(engine.hazard_probability(step) >= engine.hazard_probability(step - 1));
        }
    }
}

TEST_CASE("clamp floor applies to a low hazard", "[hazard]") {
    HazardTuning t;
    t.base_probability = {{0.01, 0.01, 0.01}};
    t.growth_rate = {{0.0, 0.0, 0.0}};
    DeterministicRng rng(1u);
    HazardEngine engine(rng, t);
    REQUIRE(engine.hazard_probability(0) == t.p_min);
}

TEST_CASE("mercy lowers the hazard after a losing streak", "[hazard][streak]") {
    DeterministicRng rng(1u);
    const HazardTuning t = HazardTuning::defaults();

    for (RunType type : kRunTypes) {
        HazardEngine neutral(rng, t, streak_state(type, 0, 0));
        HazardEngine mercy(rng, t, streak_state(type, 3, 0));
        for (int step = 0; step <= 1000; step++) {
            double p0 = neutral.hazard_probability(step);
            double pm = mercy.hazard_probability(step);
            INFO(to_string(type) << " step " << step);
            REQUIRE(pm >= t.p_min);
            REQUIRE(pm <= p0);
            if (raw_hazard(t, type, step) * t.mercy_factor < t.p_max) {
                REQUIRE(pm < p0);
            }
        }
    }
}

TEST_CASE("correction raises the hazard after a winning streak", "[hazard][streak]") {
    DeterministicRng rng(1u);
    const HazardTuning t = HazardTuning::defaults();

    for (RunType type : kRunTypes) {
        HazardEngine neutral(rng, t, streak_state(type, 0, 0));
        HazardEngine correction(rng, t, streak_state(type, 0, 3));
        for (int step = 0; step <= 1000; step++) {
            double p0 = neutral.hazard_probability(step);
            double pc = correction.hazard_probability(step);
            INFO(to_string(type) << " step " << step);
            REQUIRE(pc <= t.p_max);
            REQUIRE(pc >= p0);
            if (p0 < t.p_max) {
                REQUIRE(pc > p0);
            }
        }
    }
}

TEST_CASE("clamp can hide the mercy factor near pMax", "[hazard][streak]") {
    // Multiply-then-clamp: medium step 10 is 0.44 raw, 0.352 after mercy,
    // and both clamp to 0.30, so a losing streak has no visible effect.
    DeterministicRng rng(1u);
    HazardEngine neutral(rng, HazardTuning::defaults(), streak_state(RunType::MEDIUM, 0, 0));
    HazardEngine mercy(rng, HazardTuning::defaults(), streak_state(RunType::MEDIUM, 4, 0));
    REQUIRE(neutral.hazard_probability(10) == 0.30);
    REQUIRE(mercy.hazard_probability(10) == 0.30);

    // Step 7: raw 0.35 clamps, 0.28 after mercy does not.
    REQUIRE(mercy.hazard_probability(7) == Approx(0.28));
    REQUIRE(neutral.hazard_probability(7) == 0.30);
}

TEST_CASE("streak below the threshold has no effect", "[hazard][streak]") {
    DeterministicRng rng(1u);
    HazardEngine neutral(rng, HazardTuning::defaults(), streak_state(RunType::LONG, 0, 0));
    HazardEngine two_losses(rng, HazardTuning::defaults(), streak_state(RunType::LONG, 2, 0));
    HazardEngine two_wins(rng, HazardTuning::defaults(), streak_state(RunType::LONG, 0, 2));
    for (int step = 0; step < 20; step++) {
        REQUIRE(two_losses.hazard_probability(step) == neutral.hazard_probability(step));
        REQUIRE(two_wins.hazard_probability(step) == neutral.hazard_probability(step));
    }
}

TEST_CASE("negative step index is rejected", "[hazard]") {
    DeterministicRng rng(1u);
    HazardEngine engine(rng);
    REQUIRE_THROWS_AS(engine.hazard_probability(-1), InvalidArgument);
    REQUIRE_THROWS_AS(engine.is_danger(-3), InvalidArgument);
    REQUIRE(rng.state() == 1u);
}

TEST_CASE("run type partition of [0, 1)", "[hazard]") {
    const HazardTuning t = HazardTuning::defaults();
    REQUIRE(t.run_type_for(0.0) == RunType::SHORT);
    REQUIRE(t.run_type_for(0.2999) == RunType::SHORT);
    REQUIRE(t.run_type_for(0.30) == RunType::MEDIUM);
    REQUIRE(t.run_type_for(0.7999) == RunType::MEDIUM);
    REQUIRE(t.run_type_for(0.80) == RunType::LONG);
    REQUIRE(t.run_type_for(0.9999) == RunType::LONG);
}

TEST_CASE("run type frequencies follow the partition", "[hazard]") {
    DeterministicRng rng(0xABCDu);
    HazardEngine engine(rng);
    int counts[kRunTypeCount] = {0, 0, 0};
    const int rounds = 100000;
    for (int i = 0; i < rounds; i++) {
        counts[static_cast<int>(engine.start_round())]++;
        engine.on_round_won();
    }
    REQUIRE(counts[0] / double(rounds) == Approx(0.30).margin(0.01));
    REQUIRE(counts[1] / double(rounds) == Approx(0.50).margin(0.01));
    REQUIRE(counts[2] / double(rounds) == Approx(0.20).margin(0.01));
}

TEST_CASE("golden hazard session for seed 42", "[hazard][golden]") {
    DeterministicRng rng(42u);
    HazardEngine engine(rng);

    const std::vector<RunType> types = {
        RunType::MEDIUM, RunType::SHORT, RunType::LONG, RunType::MEDIUM, RunType::MEDIUM};
    const std::vector<std::vector<bool>> dangers = {
        {false, false, false},
        {false, true, false},
        {false, false, false},
        {false, false, false},
        {false, true, false},
    };

    for (size_t round = 0; round < types.size(); round++) {
        INFO("round " << round);
        REQUIRE(engine.start_round() == types[round]);
        REQUIRE(engine.round_number() == round + 1);

        bool lost = false;
        for (int step = 0; step < 3; step++) {
            bool d = engine.is_danger(step);
            REQUIRE(d == dangers[round][static_cast<size_t>(step)]);
            lost = lost || d;
        }
        if (lost) engine.on_round_lost();
        else engine.on_round_won();
    }

    REQUIRE(engine.consecutive_losses() == 1);
    REQUIRE(engine.consecutive_wins() == 0);
}

TEST_CASE("streak counters stay mutually exclusive", "[hazard][streak]") {
    DeterministicRng rng(1u);
    DeterministicRng verdicts(2u);
    HazardEngine engine(rng);

    REQUIRE(engine.consecutive_wins() == 0);
    REQUIRE(engine.consecutive_losses() == 0);

    unsigned expected_wins = 0, expected_losses = 0;
    for (int i = 0; i < 5000; i++) {
        engine.start_round();
        if (verdicts.chance(0.5)) {
            engine.on_round_won();
            expected_wins++;
            expected_losses = 0;
        } else {
            engine.on_round_lost();
            expected_losses++;
            expected_wins = 0;
        }
        bool wins = engine.consecutive_wins() > 0;
        bool losses = engine.consecutive_losses() > 0;
        REQUIRE(wins != losses);
        REQUIRE(engine.consecutive_wins() == expected_wins);
        REQUIRE(engine.consecutive_losses() == expected_losses);
    }
}

TEST_CASE("round protocol violations", "[hazard][contract]") {
    DeterministicRng rng(1u);
    HazardEngine engine(rng);

    SECTION("verdict without an open round") {
        REQUIRE_THROWS_AS(engine.on_round_won(), ContractViolation);
        REQUIRE_THROWS_AS(engine.on_round_lost(), ContractViolation);
    }

    SECTION("two verdicts for one round") {
        engine.start_round();
        engine.on_round_lost();
        REQUIRE_THROWS_AS(engine.on_round_won(), ContractViolation);
        REQUIRE_THROWS_AS(engine.on_round_lost(), ContractViolation);
        REQUIRE(engine.consecutive_losses() == 1);
    }

    SECTION("new round before a verdict") {
        engine.start_round();
        REQUIRE_THROWS_AS(engine.start_round(), ContractViolation);
        REQUIRE(engine.round_number() == 1);
    }
}

TEST_CASE("start_round keeps the streak counters", "[hazard][streak]") {
    DeterministicRng rng(9u);
    HazardEngine engine(rng);
    for (int i = 0; i < 3; i++) {
        engine.start_round();
        engine.on_round_lost();
    }
    engine.start_round();
    REQUIRE(engine.consecutive_losses() == 3);
    REQUIRE(engine.hazard_probability(0) ==
            Approx(engine.tuning().base_for(engine.run_type()) * engine.tuning().mercy_factor));
}

TEST_CASE("resumed state is validated", "[hazard]") {
    DeterministicRng rng(1u);
    REQUIRE_THROWS_AS(HazardEngine(rng, HazardTuning::defaults(),
                                   streak_state(RunType::SHORT, 2, 2)),
                      InvalidArgument);
    REQUIRE_THROWS_AS(HazardEngine(rng, HazardTuning::defaults(),
                                   streak_state(static_cast<RunType>(7), 0, 0)),
                      InvalidArgument);

    HazardTuning bad;
    bad.p_min = 0.5;
    bad.p_max = 0.3;
    REQUIRE_THROWS_AS(HazardEngine(rng, bad), InvalidArgument);
}

TEST_CASE("payout multiple compounds per safe step", "[hazard][tuning]") {
    const HazardTuning t = HazardTuning::defaults();
    REQUIRE(t.payout_multiple(0) == 1.0);
    REQUIRE(t.payout_multiple(1) == Approx(1.1));
    REQUIRE(t.payout_multiple(5) == Approx(1.6105));
    REQUIRE_THROWS_AS(t.payout_multiple(-1), InvalidArgument);
}
