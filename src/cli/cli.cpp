// cli.cpp — Command-line parsing implementation using cxxopts

#include "cli/cli.hpp"

#include <cxxopts.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cli {

// trim/lower helpers for the config reader
static inline std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace((unsigned char)s[a])) ++a;
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b - a);
}
static inline std::string lower(std::string_view s) {
    std::string t; t.reserve(s.size());
    for (char c : s) t.push_back((char)std::tolower((unsigned char)c));
    return t;
}

static inline std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::uint64_t out = 0;
    const char* b = s.data();
    const char* e = b + s.size();
    auto res = std::from_chars(b, e, out);
    if (res.ec != std::errc{} || res.ptr != e) return std::nullopt;
    return out;
}

static inline std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* endp = nullptr;
    double d = std::strtod(s.c_str(), &endp);
    if (!endp || *endp != '\0') return std::nullopt;
    return d;
}

static inline std::optional<bool> parse_bool(std::string_view s) {
    const std::string t = lower(s);
    if (t=="1"||t=="true"||t=="yes"||t=="y"||t=="on")  return true;
    if (t=="0"||t=="false"||t=="no" ||t=="n"||t=="off") return false;
    return std::nullopt;
}

std::optional<ShuffleKind> parse_shuffle_kind(std::string_view s) {
    const std::string t = lower(s);
    if (t == "elitist") return ShuffleKind::Elitist;
    if (t == "uniform") return ShuffleKind::Uniform;
    return std::nullopt;
}

const char* to_string(ShuffleKind kind) {
    switch (kind) {
        case ShuffleKind::Elitist: return "elitist";
        case ShuffleKind::Uniform: return "uniform";
    }
    return "unknown";
}

static void check_alpha(double alpha) {
    if (!(alpha > 0.0 && alpha < 1.0)) {
        throw std::invalid_argument("alpha must be in (0, 1), got " + std::to_string(alpha));
    }
}

bool load_config(const std::string& path, Options& o) {
    std::ifstream fin(path);
    if (!fin) return false;

    std::unordered_map<std::string, std::string> kv;
    std::string line;
    while (std::getline(fin, line)) {
        // strip comments
        auto phash = line.find('#'); if (phash != std::string::npos) line = line.substr(0, phash);
        auto psemi = line.find(';'); if (psemi != std::string::npos) line = line.substr(0, psemi);
        line = trim(line);
        if (line.empty()) continue;
        auto peq = line.find('=');
        if (peq == std::string::npos) {
            std::cerr << "WARN: config line without '=': " << line << "\n";
            continue;
        }
        kv[lower(trim(line.substr(0, peq)))] = trim(line.substr(peq + 1));
    }

    for (const auto& [key, v] : kv) {
        if (key == "items") {
            if (auto x = parse_u64(v)) o.items = static_cast<std::size_t>(*x);
            else std::cerr << "WARN: config items must be a non-negative integer; got '" << v << "'\n";
        } else if (key == "simulations") {
            if (auto x = parse_u64(v); x && *x > 0) o.simulations = static_cast<std::size_t>(*x);
            else std::cerr << "WARN: config simulations must be a positive integer; got '" << v << "'\n";
        } else if (key == "inequality") {
            if (auto x = parse_double(v); x && *x >= 0.0) o.inequality = *x;
            else std::cerr << "WARN: config inequality must be a number >= 0; got '" << v << "'\n";
        } else if (key == "shuffle") {
            if (auto k = parse_shuffle_kind(v)) o.shuffle = *k;
            else std::cerr << "WARN: config shuffle must be elitist|uniform; got '" << v << "'\n";
        } else if (key == "seed") {
            if (lower(v) == "auto") { o.random_seed = true; }
            else if (auto x = parse_u64(v)) { o.seed = *x; o.random_seed = false; }
            else std::cerr << "WARN: config seed must be an integer or 'auto'; got '" << v << "'\n";
        } else if (key == "alpha") {
            if (auto x = parse_double(v); x && *x > 0.0 && *x < 1.0) o.alpha = *x;
            else std::cerr << "WARN: config alpha must be in (0,1); got '" << v << "'\n";
        } else if (key == "verbose") {
            if (auto x = parse_u64(v)) o.verbose = static_cast<int>(std::min<std::uint64_t>(*x, 2));
            else if (auto b = parse_bool(v)) o.verbose = *b ? 1 : 0;
            else std::cerr << "WARN: config verbose must be 0..2; got '" << v << "'\n";
        } else if (key == "precision") {
            if (auto x = parse_u64(v); x && *x <= 17) o.precision = static_cast<int>(*x);
            else std::cerr << "WARN: config precision must be 0..17; got '" << v << "'\n";
        } else {
            std::cerr << "WARN: unknown config key '" << key << "'\n";
        }
    }
    o.config_path = path;
    return true;
}

Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    cxxopts::Options desc("rankshuffle_sim", "Landing statistics of a rank-preserving shuffle");
    desc.add_options()
        ("h,help", "Show this help")
        ("c,config", "key=value config file (flags override it)", cxxopts::value<std::string>())
        ("n,items", "Number of ranked items (default 10)", cxxopts::value<std::size_t>())
        ("s,simulations", "Number of trials (default 5000)", cxxopts::value<std::size_t>())
        ("i,inequality", "Bias exponent >= 0 (default 1.0)", cxxopts::value<double>())
        ("shuffle", "Shuffle procedure: elitist|uniform (default elitist)", cxxopts::value<std::string>())
        ("seed", "Master seed; 0 uses SEED env or a constant (default 0)", cxxopts::value<std::uint64_t>())
        ("random-seed", "Draw a fresh, non-reproducible seed")
        ("alpha", "Confidence 1-alpha of the reported accuracy (default 0.05)", cxxopts::value<double>())
        ("v,verbose", "stderr verbosity 0..2 (default 1)", cxxopts::value<int>())
        ("precision", "Decimal places in the table (default 3)", cxxopts::value<int>())
    ;
    help_text = desc.help();
    auto result = desc.parse(argc, argv);
    if (result.count("help")) { want_help = true; return opt; }

    if (result.count("config")) {
        const auto path = result["config"].as<std::string>();
        if (!load_config(path, opt)) throw std::invalid_argument("cannot open config file " + path);
    }

    if (result.count("items"))       opt.items = result["items"].as<std::size_t>();
    if (result.count("simulations")) opt.simulations = result["simulations"].as<std::size_t>();
    if (result.count("inequality"))  opt.inequality = result["inequality"].as<double>();
    if (result.count("shuffle")) {
        const auto s = result["shuffle"].as<std::string>();
        auto kind = parse_shuffle_kind(s);
        if (!kind) throw std::invalid_argument("--shuffle must be elitist or uniform, got '" + s + "'");
        opt.shuffle = *kind;
    }
    if (result.count("seed"))        { opt.seed = result["seed"].as<std::uint64_t>(); opt.random_seed = false; }
    if (result.count("random-seed")) opt.random_seed = true;
    if (result.count("alpha"))       opt.alpha = result["alpha"].as<double>();
    if (result.count("verbose"))     opt.verbose = std::clamp(result["verbose"].as<int>(), 0, 2);
    if (result.count("precision"))   opt.precision = std::clamp(result["precision"].as<int>(), 0, 17);

    check_alpha(opt.alpha);
    return opt;
}

} // namespace cli
