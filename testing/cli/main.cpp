// cli_tests.cpp
// Option parsing, config-file precedence and table output.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli/cli.hpp"
#include "cli/table.hpp"
#include "sim/landing.hpp"

namespace testutil {

// argv backed by owned strings
struct Argv {
    std::vector<std::string> args;
    std::vector<char*> ptrs;
    explicit Argv(std::vector<std::string> a) : args(std::move(a)) {
        for (auto& s : args) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(args.size()); }
    char** argv() { return ptrs.data(); }
};

inline cli::Options parse(std::vector<std::string> a, bool& want_help) {
    Argv av(std::move(a));
    std::string help;
    return cli::parse_args(av.argc(), av.argv(), want_help, help);
}

inline std::filesystem::path write_config(const std::string& name, const std::string& body) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << body;
    return path;
}

} // namespace testutil

TEST_CASE("defaults without arguments")
{
    bool help = true;
    const auto o = testutil::parse({"rankshuffle_sim"}, help);
    CHECK_FALSE(help);
    CHECK(o.items == 10);
    CHECK(o.simulations == 5000);
    CHECK(o.inequality == 1.0);
    CHECK(o.shuffle == cli::ShuffleKind::Elitist);
    CHECK(o.seed == 0);
    CHECK_FALSE(o.random_seed);
    CHECK(o.alpha == 0.05);
    CHECK(o.verbose == 1);
}

TEST_CASE("flags are parsed")
{
    bool help = false;
    const auto o = testutil::parse({"rankshuffle_sim", "-n", "7", "--simulations", "1200", "-i", "2.5",
                                    "--shuffle", "uniform", "--seed", "99", "-v", "2", "--precision", "5"}, help);
    CHECK(o.items == 7);
    CHECK(o.simulations == 1200);
    CHECK(o.inequality == 2.5);
    CHECK(o.shuffle == cli::ShuffleKind::Uniform);
    CHECK(o.seed == 99);
    CHECK(o.verbose == 2);
    CHECK(o.precision == 5);
}

TEST_CASE("help is reported, bad values throw")
{
    bool help = false;
    testutil::parse({"rankshuffle_sim", "--help"}, help);
    CHECK(help);
    CHECK_THROWS_AS(testutil::parse({"rankshuffle_sim", "--shuffle", "bogo"}, help), std::invalid_argument);
    CHECK_THROWS_AS(testutil::parse({"rankshuffle_sim", "--alpha", "1.5"}, help), std::invalid_argument);
    CHECK_THROWS_AS(testutil::parse({"rankshuffle_sim", "--config", "/nonexistent/rankshuffle.cfg"}, help),
                    std::invalid_argument);
}

TEST_CASE("config file is applied and flags override it")
{
    const auto path = testutil::write_config("rankshuffle_cli_test.cfg",
        "# sample\n"
        "Items = 12\n"
        "simulations=300 ; trailing comment\n"
        "inequality = 0.5\n"
        "shuffle = UNIFORM\n"
        "seed = auto\n"
        "alpha = 0.01\n"
        "bogus = 1\n"
        "verbose = off\n");

    bool help = false;
    const auto o = testutil::parse({"rankshuffle_sim", "--config", path.string(), "-n", "4"}, help);
    CHECK(o.items == 4);
    CHECK(o.simulations == 300);
    CHECK(o.inequality == 0.5);
    CHECK(o.shuffle == cli::ShuffleKind::Uniform);
    CHECK(o.random_seed);
    CHECK(o.alpha == 0.01);
    CHECK(o.verbose == 0);
    CHECK(o.config_path == path.string());
    std::filesystem::remove(path);
}

TEST_CASE("invalid config values keep the previous value")
{
    const auto path = testutil::write_config("rankshuffle_cli_bad.cfg",
        "items = many\n"
        "simulations = 0\n"
        "inequality = -3\n"
        "alpha = 2\n");
    cli::Options o;
    CHECK(cli::load_config(path.string(), o));
    CHECK(o.items == 10);
    CHECK(o.simulations == 5000);
    CHECK(o.inequality == 1.0);
    CHECK(o.alpha == 0.05);
    CHECK_FALSE(cli::load_config("/nonexistent/rankshuffle.cfg", o));
    std::filesystem::remove(path);
}

TEST_CASE("shuffle kind names round-trip")
{
    CHECK(cli::parse_shuffle_kind("Elitist") == cli::ShuffleKind::Elitist);
    CHECK(cli::parse_shuffle_kind("uniform") == cli::ShuffleKind::Uniform);
    CHECK_FALSE(cli::parse_shuffle_kind("random").has_value());
    CHECK(std::string(cli::to_string(cli::ShuffleKind::Uniform)) == "uniform");
}

TEST_CASE("write_table prints one line per initial position")
{
    const sim::LandingDistribution d({{0, {{0, 0.75}, {1, 0.25}}}, {1, {{0, 0.25}, {1, 0.75}}}}, 2, 4);
    std::ostringstream os;
    cli::write_table(os, d, 2);
    const std::string text = os.str();

    std::istringstream lines(text);
    std::string header, r0, r1, extra;
    std::getline(lines, header);
    std::getline(lines, r0);
    std::getline(lines, r1);
    CHECK_FALSE(std::getline(lines, extra));
    CHECK(header.find("init") != std::string::npos);
    CHECK(header.find("E[pos]") != std::string::npos);
    CHECK(r0.find("0.75") != std::string::npos);
    CHECK(r0.find("0.25") != std::string::npos);
    CHECK(r1.find("1.75") == std::string::npos);
    CHECK(r1.find("0.75") != std::string::npos);
}
