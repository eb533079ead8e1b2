#include "render.hpp"

#include <iomanip>
#include <string>

namespace game {

char cell_glyph(CellState s){
    switch(s){
        case CellState::Unknown: return '#';
        case CellState::Flagged: return 'F';
        case CellState::Mine: return '*';
        case CellState::Number0: return '.';
        default: break;
    }
    int n = static_cast<int>(s) - static_cast<int>(CellState::Number0);
    if(n >= 1 && n <= 8) return char('0' + n);
    return '?';
}

void render_board(std::ostream& os, const Board& board){
    const int w = board.width(), h = board.height();
    std::string line;
    line.reserve(w*2);
    for(int y=0;y<h;++y){
        line.clear();
        for(int x=0;x<w;++x){
            if(x) line.push_back(' ');
            CellState s = board.cell_state(x,y);
            // flags are hidden once the mines are on show
            if(s==CellState::Flagged && board.lost()) s = CellState::Unknown;
            line.push_back(cell_glyph(s));
        }
        os << line << '\n';
    }
    os << "flags remaining: " << board.flags_remaining() << '\n';
}

void render_progress(std::ostream& os, int round, const Board& board){
    const int kBarWidth = 40;
    const int safeTotal = board.width()*board.height() - board.mines();
    double done = safeTotal > 0 ? 1.0 - (double)board.remaining_safe() / (double)safeTotal : 1.0;
    int filled = (int)(done * kBarWidth);
    os << "Loop Count " << std::setw(3) << round << ": Blocks remaining = " << std::setw(4) << board.remaining_safe()
       << " [" << std::string(filled, '=') << std::string(kBarWidth - filled, ' ') << "]" << '\n';
}

void render_summary(std::ostream& os, int game, Outcome outcome, int rounds, double seconds, const Board& board){
    os << "game " << game << ": " << outcome_name(outcome) << " after " << rounds << " rounds in "
       << std::fixed << std::setprecision(2) << seconds << "s, " << board.remaining_safe() << " safe cells left, "
       << board.flags_remaining() << " flags remaining" << std::defaultfloat << '\n';
}

}
