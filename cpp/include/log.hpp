#pragma once

#include <ostream>

namespace diag {

// 1: games and progress, 2: decisions and solve stats, 3: every click and constraint
void set_verbosity(int level);
int verbosity();

inline bool enabled(int level){ return verbosity() >= level; }

std::ostream& stream();

}
