#pragma once

#include <cstddef>
#include <vector>

namespace solve {

struct RelaxationSettings {
    double rho = 0.1;           // penalty on the box rows
    double eq_scale = 1e3;      // equality rows use rho*eq_scale
    double sigma = 1e-6;
    double alpha = 1.6;         // over-relaxation
    double eps_abs = 1e-9;
    double eps_rel = 1e-9;
    double eps_prim_inf = 1e-6;
    int max_iter = 25000;
    int check_every = 10;
};

enum class RelaxStatus { Solved, Inaccurate, Infeasible };

struct SolveInfo {
    RelaxStatus status = RelaxStatus::Solved;
    int iterations = 0;
    double prim_res = 0.0;
    double dual_res = 0.0;
    bool refactored = false;
};

// sum of x[v] over vars == rhs
struct Equality {
    std::vector<int> vars;
    double rhs = 0.0;
};

// Feasibility of { x : A x = b, 0 <= x <= 1 } with unit-coefficient rows, solved by
// ADMM with a zero objective. Rows are only ever appended; the iterates persist
// between solves so each solve starts from the previous one.
class Relaxation {
public:
    explicit Relaxation(int n, const RelaxationSettings& settings = RelaxationSettings());

    // throws std::out_of_range / std::invalid_argument on bad indices
    void add_equality(std::vector<int> vars, double rhs);

    // primal start point; clears the dual state
    void set_start(const std::vector<double>& x);

    SolveInfo solve();

    // box-projected iterate, every entry in [0,1]
    const std::vector<double>& solution() const { return z_; }

    int variables() const { return n_; }
    size_t equality_count() const { return rows_.size(); }
    const std::vector<Equality>& equalities() const { return rows_; }
    const RelaxationSettings& settings() const { return st_; }

private:
    int n_;
    RelaxationSettings st_;
    std::vector<Equality> rows_;
    std::vector<double> scale_;     // 1/sqrt(|vars|), 0 for empty rows
    bool empty_conflict_ = false;
    std::vector<double> gram_;      // rho_eq * sum of normalised a a^T
    std::vector<double> chol_;      // lower factor of sigma I + rho I + gram
    size_t factored_rows_ = 0;
    bool factored_ = false;

    std::vector<double> x_;
    std::vector<double> z_;
    std::vector<double> y_box_;
    std::vector<double> y_eq_;

    double rho_eq() const { return st_.rho * st_.eq_scale; }
    void factor();
    void factor_solve(std::vector<double>& v) const;
};

}
