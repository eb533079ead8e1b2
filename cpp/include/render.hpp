#pragma once

#include <ostream>

#include "autoplay.hpp"
#include "board.hpp"

namespace game {

char cell_glyph(CellState s);

// one text row per board row; mines only show once the game is lost
void render_board(std::ostream& os, const Board& board);

void render_progress(std::ostream& os, int round, const Board& board);

void render_summary(std::ostream& os, int game, Outcome outcome, int rounds, double seconds, const Board& board);

}
