#include "log.hpp"

#include <atomic>
#include <iostream>

namespace diag {

static std::atomic<int> g_verbosity{0};

void set_verbosity(int level){ g_verbosity.store(level < 0 ? 0 : level); }
int verbosity(){ return g_verbosity.load(); }

std::ostream& stream(){ return std::clog; }

}
