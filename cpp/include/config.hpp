#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace game {

struct ConfigError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

struct GameConfig {
    int width = 16;
    int height = 16;
    int mines = 40;
    std::optional<uint64_t> seed;
    int games = 1;
    int max_rounds = 0;     // 0 = unbounded
    bool render = true;
    int verbosity = 0;
};

// the relaxation keeps dense cells x cells matrices
constexpr long long kMaxCells = 2500;

// cells outside the four 2x2 corner zones
long long eligible_mine_cells(int width, int height);

bool in_corner_zone(int x, int y, int width, int height);

// throws ConfigError, also for boards above kMaxCells
void validate_board(const GameConfig& cfg);

enum class ParseResult { Ok, Help, Error };

ParseResult parse_args(int argc, const char* const* argv, GameConfig& out, std::string& error);

const char* usage();

}
