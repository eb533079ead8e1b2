#pragma once

#include <ostream>

#include "config.hpp"

namespace game {

// Plays cfg.games games, game g seeded with seed+g. Boards and summaries go to `out`,
// per-game failures to `err`. Returns 0 when every game was won, 1 otherwise.
int play_games(const GameConfig& cfg, std::ostream& out, std::ostream& err);

}
