#include "solver.hpp"

#include <cmath>
#include <string>

#include "log.hpp"

namespace solve {

static int checked_cells(int width, int height, int mines){
    if(width < 1 || height < 1) throw std::invalid_argument("solver needs a board of at least 1x1");
    if(mines < 0 || mines > width*height) throw std::invalid_argument("mine count " + std::to_string(mines) + " does not fit the board");
    return width*height;
}

ConstraintSolver::ConstraintSolver(int width, int height, int mines, const RelaxationSettings& settings)
    : w_(width), h_(height), mines_(mines), relax_(checked_cells(width, height, mines), settings) {
    const int N = w_*h_;
    estimate_.assign(N, (double)mines_ / (double)N);
    previous_ = estimate_;
    known_.assign(N, -1);
    clicked_.assign(N, 0);
    flagged_.assign(N, 0);

    std::vector<int> all(N);
    for(int i=0;i<N;++i) all[i] = i;
    relax_.add_equality(std::move(all), (double)mines_);
    relax_.set_start(previous_);
}

int ConstraintSolver::checked_index(int x, int y) const {
    if(x<0 || y<0 || x>=w_ || y>=h_){
        throw std::out_of_range("cell (" + std::to_string(x) + "," + std::to_string(y) + ") outside "
            + std::to_string(w_) + "x" + std::to_string(h_) + " board");
    }
    return index(x,y);
}

Decision ConstraintSolver::decide(){
    last_ = relax_.solve();
    if(last_.status == RelaxStatus::Infeasible){
        throw InferenceError("disclosed counts are inconsistent: relaxation infeasible after "
            + std::to_string(relax_.equality_count()) + " equalities");
    }
    if(last_.status == RelaxStatus::Inaccurate && diag::enabled(1)){
        diag::stream() << "ConstraintSolver::decide: relaxation stopped at " << last_.iterations
                       << " iterations, residuals " << last_.prim_res << "/" << last_.dual_res << std::endl;
    }
    estimate_ = relax_.solution();

    Decision d;
    double minEst = 1.0;
    bool anyUndecided = false;
    for(int x=0;x<w_;++x){
        for(int y=0;y<h_;++y){
            int i = index(x,y);
            if(clicked_[i]) continue;
            // settled since last round: reveal it alone
            if(std::fabs(estimate_[i] - previous_[i]) < kEps){
                clicked_[i] = 1; clicked_count_++;
                previous_ = estimate_;
                d.reveal.emplace_back(x,y);
                if(diag::enabled(2)){
                    diag::stream() << "ConstraintSolver::decide: " << x << " " << y << " unchanged at " << estimate_[i]
                                   << " (" << last_.iterations << " iterations)" << std::endl;
                }
                return d;
            }
            if(!anyUndecided || estimate_[i] < minEst){ minEst = estimate_[i]; anyUndecided = true; }
        }
    }

    for(int x=0;x<w_;++x){
        for(int y=0;y<h_;++y){
            int i = index(x,y);
            if(anyUndecided && !clicked_[i] && std::fabs(estimate_[i] - minEst) < kEps) d.reveal.emplace_back(x,y);
            if(!flagged_[i] && std::fabs(estimate_[i] - 1.0) < kEps) d.flag.emplace_back(x,y);
        }
    }
    for(const auto& c : d.reveal){ clicked_[index(c.first,c.second)] = 1; clicked_count_++; }
    for(const auto& c : d.flag){ flagged_[index(c.first,c.second)] = 1; flagged_count_++; }
    previous_ = estimate_;

    if(diag::enabled(2)){
        diag::stream() << "ConstraintSolver::decide: " << relax_.equality_count() << " equalities, " << last_.iterations
                       << " iterations, min " << minEst << ", reveal " << d.reveal.size() << ", flag " << d.flag.size() << std::endl;
    }
    return d;
}

void ConstraintSolver::add_constraint(int x, int y, int count){
    int idx = checked_index(x,y);
    if(count < 0 || count > 8){
        throw std::invalid_argument("neighbour count " + std::to_string(count) + " at (" + std::to_string(x) + "," + std::to_string(y) + ") outside 0..8");
    }
    if(known_[idx] >= 0 && known_[idx] != count){
        throw std::logic_error("cell (" + std::to_string(x) + "," + std::to_string(y) + ") already disclosed "
            + std::to_string(known_[idx]) + ", now " + std::to_string(count));
    }
    known_[idx] = count;
    if(diag::enabled(3)){ diag::stream() << "ConstraintSolver::add_constraint: " << x << " " << y << " " << count << std::endl; }

    std::vector<int> vars;
    vars.reserve(8);
    for(int nx=x-1; nx<=x+1; ++nx){
        for(int ny=y-1; ny<=y+1; ++ny){
            if(nx==x && ny==y) continue;
            if(nx<0 || ny<0 || nx>=w_ || ny>=h_) continue;
            // a flagged cell is not known to be clear, so it stays in the sum
            if(clicked_[index(nx,ny)] && !flagged_[index(nx,ny)]) continue;
            vars.push_back(index(nx,ny));
        }
    }
    relax_.add_equality(std::move(vars), (double)count);
    relax_.add_equality(std::vector<int>{idx}, 0.0);
}

}
