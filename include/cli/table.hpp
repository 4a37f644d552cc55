// table.hpp — plain-text rendering of a landing distribution for the CLI
#pragma once

#include <ostream>

#include "sim/landing.hpp"

namespace cli {

// One line per initial position, one column per final position, then the
// mean final position. Unobserved cells print as 0.
void write_table(std::ostream& out, const sim::LandingDistribution& dist, int precision = 3);

} // namespace cli
