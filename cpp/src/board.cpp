#include "board.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "log.hpp"

namespace game {

Board::Board(const GameConfig& cfg){ create(cfg); }

void Board::create(const GameConfig& cfg){
    validate_board(cfg);
    w_ = cfg.width; h_ = cfg.height; mines_ = cfg.mines;
    const int N = w_*h_;
    mine_.assign(N, 0); revealed_.assign(N, 0); flagged_.assign(N, 0); counts_.assign(N, 0);
    remaining_safe_ = N - mines_;
    flags_remaining_ = mines_;
    lost_ = false;

    if(cfg.seed){ rng_.seed(*cfg.seed); }
    else { std::random_device rd; rng_.seed(((uint64_t)rd() << 32) ^ rd()); }

    std::vector<std::pair<int,int>> candidates;
    candidates.reserve(N);
    for(int x=0;x<w_;++x){ for(int y=0;y<h_;++y){ candidates.emplace_back(x,y); } }
    std::shuffle(candidates.begin(), candidates.end(), rng_);
    int assigned = 0;
    for(const auto& c : candidates){
        if(assigned == mines_) break;
        if(in_corner_zone(c.first, c.second, w_, h_)) continue;
        mine_[index(c.first,c.second)] = 1;
        ++assigned;
    }

    for(int y=0;y<h_;++y){
        for(int x=0;x<w_;++x){
            if(!mine_[index(x,y)]) continue;
            for(const auto& d : kNeighborOffsets){
                int nx=x+d.first, ny=y+d.second;
                if(in_bounds(nx,ny)) counts_[index(nx,ny)]++;
            }
        }
    }
    if(diag::enabled(1)){
        diag::stream() << "Board::create: " << h_ << "x" << w_ << " board with " << mines_ << " mines" << std::endl;
    }
}

int Board::checked_index(int x, int y) const {
    if(!in_bounds(x,y)){
        throw std::out_of_range("cell (" + std::to_string(x) + "," + std::to_string(y) + ") outside "
            + std::to_string(w_) + "x" + std::to_string(h_) + " board");
    }
    return index(x,y);
}

std::vector<Reveal> Board::reveal(int x, int y){
    int idx = checked_index(x,y);
    std::vector<Reveal> out;
    if(diag::enabled(3)){ diag::stream() << "Board::reveal: " << x << " " << y << std::endl; }
    if(lost_ || revealed_[idx] || flagged_[idx]) return out;
    if(mine_[idx]){
        lost_ = true;
        if(diag::enabled(1)){ diag::stream() << "Board::reveal: mine at " << x << " " << y << ", game lost" << std::endl; }
        out.push_back(Reveal{x,y,-1});
        return out;
    }

    // explicit frames replay the recursive expansion order; a cell is marked before its neighbours are looked at
    struct Frame { int x; int y; int next; };
    std::vector<Frame> stack;
    auto expose = [&](int cx, int cy){
        int i = index(cx,cy);
        revealed_[i] = 1;
        remaining_safe_--;
        out.push_back(Reveal{cx,cy,counts_[i]});
        if(counts_[i]==0) stack.push_back(Frame{cx,cy,0});
    };
    expose(x,y);
    while(!stack.empty()){
        Frame& f = stack.back();
        if(f.next == (int)kNeighborOffsets.size()){ stack.pop_back(); continue; }
        const auto& d = kNeighborOffsets[f.next++];
        int nx = f.x + d.first, ny = f.y + d.second;
        if(!in_bounds(nx,ny)) continue;
        int ni = index(nx,ny);
        if(revealed_[ni] || flagged_[ni] || mine_[ni]) continue;
        expose(nx,ny);
    }
    return out;
}

void Board::flag(int x, int y){
    int idx = checked_index(x,y);
    if(lost_ || revealed_[idx]) return;
    flagged_[idx] = !flagged_[idx];
    flags_remaining_ += flagged_[idx] ? -1 : 1;
}

bool Board::is_mine(int x, int y) const { return mine_[checked_index(x,y)] != 0; }
bool Board::is_revealed(int x, int y) const { return revealed_[checked_index(x,y)] != 0; }
bool Board::is_flagged(int x, int y) const { return flagged_[checked_index(x,y)] != 0; }
int Board::neighbor_mines(int x, int y) const { return counts_[checked_index(x,y)]; }

CellState Board::cell_state(int x, int y) const {
    int idx = checked_index(x,y);
    if(revealed_[idx]) return static_cast<CellState>(static_cast<int>(CellState::Number0) + counts_[idx]);
    if(lost_ && mine_[idx]) return CellState::Mine;
    if(flagged_[idx]) return CellState::Flagged;
    return CellState::Unknown;
}

std::vector<std::pair<int,int>> Board::mine_positions() const {
    std::vector<std::pair<int,int>> out;
    for(int x=0;x<w_;++x){ for(int y=0;y<h_;++y){ if(mine_[index(x,y)]) out.emplace_back(x,y); } }
    return out;
}

}
