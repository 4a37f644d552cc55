// table.cpp — plain-text rendering of a landing distribution for the CLI

#include "cli/table.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>

namespace cli {

void write_table(std::ostream& out, const sim::LandingDistribution& dist, int precision) {
    const std::size_t n = dist.n_items();
    const int cell_w = std::max(precision + 3, static_cast<int>(std::to_string(n).size()) + 1);
    const int head_w = std::max(5, static_cast<int>(std::to_string(n).size()) + 1);

    std::ostringstream os;
    os << std::setw(head_w) << "init";
    for (std::size_t f = 0; f < n; ++f) os << ' ' << std::setw(cell_w) << f;
    os << ' ' << std::setw(cell_w + 2) << "E[pos]" << '\n';

    os << std::fixed << std::setprecision(precision);
    for (const auto& [initial, row] : dist) {
        os << std::setw(head_w) << initial;
        for (std::size_t f = 0; f < n; ++f) os << ' ' << std::setw(cell_w) << dist.probability(initial, f);
        os << ' ' << std::setw(cell_w + 2) << dist.expected_position(initial) << '\n';
    }
    out << os.str();
}

} // namespace cli
