#pragma once

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include "relaxation.hpp"

namespace solve {

using Cell = std::pair<int,int>;

struct InferenceError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Decision {
    std::vector<Cell> reveal;
    std::vector<Cell> flag;
    bool empty() const { return reveal.empty() && flag.empty(); }
};

// Relaxes "which cells hold mines" to estimates in [0,1] constrained by every disclosed count.
// Decisions are heuristic: a cell whose estimate did not move since the last round is
// revealed on its own, which is not a proof that it is safe.
class ConstraintSolver {
public:
    static constexpr double kEps = 1e-6;

    ConstraintSolver(int width, int height, int mines, const RelaxationSettings& settings = RelaxationSettings());

    // throws InferenceError when the accumulated constraints admit no solution
    Decision decide();

    // (x,y) was revealed showing `count` neighbouring mines
    void add_constraint(int x, int y, int count);

    int width() const { return w_; }
    int height() const { return h_; }
    int mines() const { return mines_; }

    double estimate(int x, int y) const { return estimate_[checked_index(x,y)]; }
    double previous_estimate(int x, int y) const { return previous_[checked_index(x,y)]; }
    int known_count(int x, int y) const { return known_[checked_index(x,y)]; }
    bool is_clicked(int x, int y) const { return clicked_[checked_index(x,y)] != 0; }
    bool is_flagged(int x, int y) const { return flagged_[checked_index(x,y)] != 0; }
    int clicked_count() const { return clicked_count_; }
    int flagged_count() const { return flagged_count_; }
    size_t constraint_count() const { return relax_.equality_count(); }
    const SolveInfo& last_solve() const { return last_; }
    const Relaxation& relaxation() const { return relax_; }

private:
    int w_;
    int h_;
    int mines_;
    Relaxation relax_;
    std::vector<double> estimate_;
    std::vector<double> previous_;
    std::vector<int> known_;
    std::vector<uint8_t> clicked_;
    std::vector<uint8_t> flagged_;
    int clicked_count_ = 0;
    int flagged_count_ = 0;
    SolveInfo last_{};

    int index(int x, int y) const { return y*w_ + x; }
    int checked_index(int x, int y) const;
};

}
