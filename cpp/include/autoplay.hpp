#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "board.hpp"
#include "config.hpp"
#include "solver.hpp"

namespace game {

enum class Outcome { Running, Won, Lost, Stalled, Cancelled };

const char* outcome_name(Outcome o);

struct RoundReport {
    int round = 0;
    std::vector<Reveal> revealed;
    std::vector<solve::Cell> flagged;
    int remaining_safe = 0;
    int flags_remaining = 0;
    Outcome outcome = Outcome::Running;
};

// Owns one board/solver pair and plays it round by round.
class Autoplay {
public:
    using RoundCallback = std::function<void(const RoundReport&)>;

    explicit Autoplay(const GameConfig& cfg, const solve::RelaxationSettings& settings = solve::RelaxationSettings());

    // discards the current game; a new board and solver are built from the config
    void restart(std::optional<uint64_t> seed);

    // one decide/reveal/flag round; solve::InferenceError propagates
    Outcome step();

    Outcome run();

    void cancel() { cancelled_ = true; }
    void set_on_round(RoundCallback cb){ on_round_ = std::move(cb); }

    Outcome outcome() const { return outcome_; }
    int rounds() const { return rounds_; }
    const RoundReport& last_report() const { return report_; }
    const Board& board() const { return *board_; }
    Board& board() { return *board_; }
    const solve::ConstraintSolver& solver() const { return *solver_; }
    solve::ConstraintSolver& solver() { return *solver_; }

private:
    GameConfig cfg_;
    solve::RelaxationSettings settings_;
    std::unique_ptr<Board> board_;
    std::unique_ptr<solve::ConstraintSolver> solver_;
    RoundCallback on_round_;
    RoundReport report_{};
    Outcome outcome_ = Outcome::Running;
    int rounds_ = 0;
    bool cancelled_ = false;
};

}
