// cli.hpp — Command-line parsing interface (cxxopts + key=value config file)
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cli {

enum class ShuffleKind { Elitist, Uniform };

std::optional<ShuffleKind> parse_shuffle_kind(std::string_view s);
const char* to_string(ShuffleKind kind);

struct Options {
    // Ranked items per sequence and number of trials
    std::size_t items = 10;
    std::size_t simulations = 5000;

    // Bias exponent for the elitist shuffle (ignored by uniform)
    double inequality = 1.0;
    ShuffleKind shuffle = ShuffleKind::Elitist;

    // 0 => SEED env or built-in constant; random_seed draws a fresh one
    std::uint64_t seed = 0;
    bool random_seed = false;

    // Confidence level 1-alpha of the reported accuracy bound
    double alpha = 0.05;

    // stderr verbosity: 0 quiet, 1 summary, 2 details
    int verbose = 1;
    // Decimal places of the printed table
    int precision = 3;

    // Config file the options were loaded from (empty if none)
    std::string config_path;
};

// Parse CLI arguments with cxxopts. Values from --config are applied first,
// explicit flags override them. Sets want_help/help_text for --help.
// Throws std::invalid_argument (or a cxxopts exception) on bad input.
Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text);

// Apply key=value lines from path onto o. Unknown keys and bad values are
// reported as WARN lines on stderr and skipped. Returns false if the file
// cannot be opened.
bool load_config(const std::string& path, Options& o);

} // namespace cli
