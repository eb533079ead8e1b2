#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include "config.hpp"

namespace game {

enum class CellState : uint8_t {
    Unknown = 0,
    Flagged = 1,
    Mine = 2,
    Number0 = 10,
    Number1,
    Number2,
    Number3,
    Number4,
    Number5,
    Number6,
    Number7,
    Number8
};

// count == -1 marks a revealed mine
struct Reveal { int x; int y; int count; };

inline bool operator==(const Reveal& a, const Reveal& b){ return a.x==b.x && a.y==b.y && a.count==b.count; }

// fixed expansion order of the flood fill
constexpr std::array<std::pair<int,int>,8> kNeighborOffsets = {{
    {1,0}, {1,1}, {0,1}, {-1,1}, {-1,0}, {-1,-1}, {0,-1}, {1,-1}
}};

class Board {
public:
    explicit Board(const GameConfig& cfg);

    // throws ConfigError, leaves the board untouched on failure
    void create(const GameConfig& cfg);

    std::vector<Reveal> reveal(int x, int y);
    void flag(int x, int y);
    bool has_won() const { return remaining_safe_ == 0; }

    int width() const { return w_; }
    int height() const { return h_; }
    int mines() const { return mines_; }
    int remaining_safe() const { return remaining_safe_; }
    int flags_remaining() const { return flags_remaining_; }
    bool lost() const { return lost_; }

    bool in_bounds(int x, int y) const { return x>=0 && y>=0 && x<w_ && y<h_; }
    bool is_mine(int x, int y) const;
    bool is_revealed(int x, int y) const;
    bool is_flagged(int x, int y) const;
    int neighbor_mines(int x, int y) const;
    CellState cell_state(int x, int y) const;

    std::vector<std::pair<int,int>> mine_positions() const;

private:
    int w_ = 0;
    int h_ = 0;
    int mines_ = 0;
    int remaining_safe_ = 0;
    int flags_remaining_ = 0;
    bool lost_ = false;
    std::mt19937_64 rng_;
    std::vector<uint8_t> mine_;
    std::vector<uint8_t> revealed_;
    std::vector<uint8_t> flagged_;
    std::vector<uint8_t> counts_;

    int index(int x, int y) const { return y*w_ + x; }
    int checked_index(int x, int y) const;
};

}
