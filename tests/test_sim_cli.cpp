#include <catch2/catch.hpp>

#include "core/errors.hpp"
#include "io/json_reader.hpp"
#include "montecarlo/sim_cli.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace rtp;
using namespace rtp::mc;

namespace {

struct CliRun {
    int status;
    std::string out;
    std::string err;
};

CliRun run(std::vector<std::string> args) {
    args.insert(args.begin(), "rtp_sim");
    std::ostringstream out, err;
    int status = run_cli(args, out, err);
    return {status, out.str(), err.str()};
}

CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "rtp_sim");
    return parse_cli_args(args);
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}

// ── Argument parsing ──

TEST_CASE("no arguments keeps the defaults and asks for a random seed", "[cli]") {
    CliOptions o = parse({});
    REQUIRE_FALSE(o.seed_given);
    REQUIRE_FALSE(o.show_help);
    REQUIRE(o.config.mode == SimMode::DISCRETE);
    REQUIRE(o.config.trials == 200000);
    REQUIRE(o.config.workers == 1);
    REQUIRE(o.config.cashout_step == 5);
}

TEST_CASE("seeds are accepted in decimal and 0x-hex", "[cli]") {
    CliOptions hex = parse({"--seed", "0x5EEDC0DE"});
    REQUIRE(hex.seed_given);
    REQUIRE(hex.config.seed == 0x5EEDC0DEu);
    REQUIRE(parse({"--seed", "0Xff"}).config.seed == 255u);
    REQUIRE(parse({"--seed", "4294967295"}).config.seed == 0xFFFFFFFFu);
    REQUIRE(parse({"--seed", "010"}).config.seed == 10u);
    REQUIRE(parse({"--seed", "0"}).config.seed == 0u);

    REQUIRE_THROWS_AS(parse({"--seed", "4294967296"}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--seed", "0x100000000"}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--seed", "-1"}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--seed", "0x"}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--seed", "12abc"}), InvalidArgument);
}

TEST_CASE("narrowed flags are range checked instead of wrapping", "[cli]") {
    REQUIRE_THROWS_AS(parse({"--cashout-step", "4294967297"}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--cashout-step", "0"}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--workers", "4294967297"}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--workers", "0"}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--workers", std::to_string(kMaxWorkers + 1)}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--trials", "99999999999999999999999"}), InvalidArgument);

    CliOptions o = parse({"--cashout-step", "12", "--workers", "4", "--trials", "0x10"});
    REQUIRE(o.config.cashout_step == 12);
    REQUIRE(o.config.workers == 4u);
    REQUIRE(o.config.trials == 16);
}

TEST_CASE("unknown flags and missing values are rejected", "[cli]") {
    REQUIRE_THROWS_AS(parse({"--trails", "5"}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--trials"}), InvalidArgument);
    REQUIRE_THROWS_AS(parse({"--mode", "poker"}), InvalidArgument);

    CliOptions o = parse({"--mode", "hazard", "--tuning", "t.json", "--output", "o.json",
                          "-v", "--progress", "--help"});
    REQUIRE(o.config.mode == SimMode::HAZARD);
    REQUIRE(o.config.tuning_path == "t.json");
    REQUIRE(o.config.output_path == "o.json");
    REQUIRE(o.config.verbose);
    REQUIRE(o.config.progress);
    REQUIRE(o.show_help);
}

// ── Exit status and output ──

TEST_CASE("errors exit with status 1 and a message on stderr", "[cli]") {
    CliRun bad_flag = run({"--bogus"});
    REQUIRE(bad_flag.status == 1);
    REQUIRE(bad_flag.out.empty());
    REQUIRE(contains(bad_flag.err, "unknown argument: --bogus"));
    REQUIRE(contains(bad_flag.err, "Usage: rtp_sim"));

    CliRun bad_seed = run({"--seed", "0x1FFFFFFFF"});
    REQUIRE(bad_seed.status == 1);
    REQUIRE(contains(bad_seed.err, "--seed"));

    CliRun bad_tuning = run({"--trials", "10", "--tuning", "/nonexistent/tuning.json"});
    REQUIRE(bad_tuning.status == 1);
    REQUIRE(contains(bad_tuning.err, "Error loading tuning"));

    CliRun bad_output = run({"--trials", "10", "--seed", "1",
                             "--output", "/nonexistent/out.json"});
    REQUIRE(bad_output.status == 1);
    REQUIRE(contains(bad_output.err, "cannot open output file"));
}

TEST_CASE("help exits cleanly without running", "[cli]") {
    CliRun r = run({"--help"});
    REQUIRE(r.status == 0);
    REQUIRE(r.out.empty());
    REQUIRE(contains(r.err, "--cashout-step"));
}

TEST_CASE("a hex seed runs the same session as its decimal form", "[cli]") {
    CliRun hex = run({"--trials", "1000", "--seed", "0x7"});
    CliRun dec = run({"--trials", "1000", "--seed", "7"});
    REQUIRE(hex.status == 0);
    REQUIRE(hex.out == dec.out);
    REQUIRE(hex.err.empty());

    io::JsonValue v = io::JsonReader::parse(hex.out);
    REQUIRE(v["config"]["seed"].as_number() == 7.0);
    REQUIRE(v["config"]["seedHex"].as_string() == "00000007");
    REQUIRE(v["results"]["trials"].as_number() == 1000.0);
    REQUIRE(v["results"]["wins"].as_number() == 485.0);
}

TEST_CASE("hazard mode runs through the command line", "[cli]") {
    CliRun r = run({"--mode", "hazard", "--trials", "1000", "--seed", "7",
                    "--cashout-step", "3"});
    REQUIRE(r.status == 0);
    io::JsonValue v = io::JsonReader::parse(r.out);
    REQUIRE(v["config"]["cashoutStep"].as_number() == 3.0);
    REQUIRE(v["results"]["wins"].as_number() == 542.0);
}

TEST_CASE("progress records are JSON lines on stderr", "[cli]") {
    CliRun r = run({"--trials", "1000", "--seed", "1", "--progress", "--workers", "2"});
    REQUIRE(r.status == 0);
    REQUIRE(contains(r.err, R"({"type":"progress","completed":1000,"total":1000})"));
    REQUIRE(contains(r.err, R"({"type":"done","completed":1000,"total":1000})"));
    REQUIRE(io::JsonReader::parse(r.out)["config"]["workers"].as_number() == 2.0);
}
