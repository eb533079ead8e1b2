#include "relaxation.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "log.hpp"

namespace solve {

static inline double clamp01(double v){ return v < 0.0 ? 0.0 : (v > 1.0 ? 1.0 : v); }

static inline double inf_norm(const std::vector<double>& v){
    double m = 0.0; for(double e : v){ m = std::max(m, std::fabs(e)); } return m;
}

Relaxation::Relaxation(int n, const RelaxationSettings& settings) : n_(n), st_(settings) {
    if(n_ <= 0) throw std::invalid_argument("relaxation needs at least one variable");
    gram_.assign((size_t)n_*n_, 0.0);
    x_.assign(n_, 0.0);
    z_.assign(n_, 0.0);
    y_box_.assign(n_, 0.0);
}

void Relaxation::add_equality(std::vector<int> vars, double rhs){
    std::vector<int> sorted = vars;
    std::sort(sorted.begin(), sorted.end());
    for(size_t i=0;i<sorted.size();++i){
        if(sorted[i] < 0 || sorted[i] >= n_) throw std::out_of_range("variable " + std::to_string(sorted[i]) + " out of range");
        if(i>0 && sorted[i]==sorted[i-1]) throw std::invalid_argument("variable " + std::to_string(sorted[i]) + " repeated in one equality");
    }
    double s = 0.0;
    if(vars.empty()){
        if(std::fabs(rhs) > st_.eps_abs) empty_conflict_ = true;
    } else {
        s = 1.0 / std::sqrt((double)vars.size());
        const double w = rho_eq() * s * s;
        for(int i : vars){ for(int j : vars){ gram_[(size_t)i*n_ + j] += w; } }
    }
    rows_.push_back(Equality{std::move(vars), rhs});
    scale_.push_back(s);
    y_eq_.push_back(0.0);
}

void Relaxation::set_start(const std::vector<double>& x){
    if((int)x.size() != n_) throw std::invalid_argument("start point has wrong size");
    x_ = x;
    for(int i=0;i<n_;++i) z_[i] = clamp01(x_[i]);
    std::fill(y_box_.begin(), y_box_.end(), 0.0);
    std::fill(y_eq_.begin(), y_eq_.end(), 0.0);
}

void Relaxation::factor(){
    const size_t n = (size_t)n_;
    chol_.assign(n*n, 0.0);
    const double diag = st_.sigma + st_.rho;
    for(size_t j=0;j<n;++j){
        double d = gram_[j*n + j] + diag;
        const double* lj = &chol_[j*n];
        for(size_t k=0;k<j;++k) d -= lj[k]*lj[k];
        if(d <= 0.0) throw std::logic_error("relaxation normal matrix is not positive definite");
        double ljj = std::sqrt(d);
        chol_[j*n + j] = ljj;
        for(size_t i=j+1;i<n;++i){
            double v = gram_[i*n + j];
            const double* li = &chol_[i*n];
            for(size_t k=0;k<j;++k) v -= li[k]*lj[k];
            chol_[i*n + j] = v / ljj;
        }
    }
    factored_rows_ = rows_.size();
    factored_ = true;
}

void Relaxation::factor_solve(std::vector<double>& v) const {
    const size_t n = (size_t)n_;
    for(size_t i=0;i<n;++i){
        const double* li = &chol_[i*n];
        double s = v[i];
        for(size_t k=0;k<i;++k) s -= li[k]*v[k];
        v[i] = s / li[i];
    }
    for(size_t ii=n; ii-->0;){
        double s = v[ii];
        for(size_t k=ii+1;k<n;++k) s -= chol_[k*n + ii]*v[k];
        v[ii] = s / chol_[ii*n + ii];
    }
}

SolveInfo Relaxation::solve(){
    SolveInfo info{};
    if(empty_conflict_){
        info.status = RelaxStatus::Infeasible;
        return info;
    }
    if(!factored_ || factored_rows_ != rows_.size()){
        factor();
        info.refactored = true;
    }

    const int m = (int)rows_.size();
    const double rho = st_.rho, req = rho_eq(), alpha = st_.alpha, sigma = st_.sigma;
    std::vector<double> rhs(n_), xt(n_), atv(n_), zeros(n_, 0.0);
    std::vector<double> dy_eq(m, 0.0), dy_box(n_, 0.0);
    bool have_dy = false;

    auto row_dot = [&](int r, const std::vector<double>& v){
        double s = 0.0; for(int i : rows_[r].vars) s += v[i]; return s * scale_[r];
    };
    // atv = A^T w (+ extra)
    auto transpose_apply = [&](const std::vector<double>& w, const std::vector<double>& extra){
        atv = extra;
        for(int r=0;r<m;++r){ double c = w[r]*scale_[r]; if(c==0.0) continue; for(int i : rows_[r].vars) atv[i] += c; }
        return inf_norm(atv);
    };

    for(int it=0;;++it){
        if(it % st_.check_every == 0){
            double prim = 0.0, ax_norm = 0.0;
            for(int r=0;r<m;++r){
                if(scale_[r]==0.0) continue;
                double ax = row_dot(r, x_);
                double b = rows_[r].rhs * scale_[r];
                prim = std::max(prim, std::fabs(ax - b));
                ax_norm = std::max(ax_norm, std::max(std::fabs(ax), std::fabs(b)));
            }
            for(int i=0;i<n_;++i){
                prim = std::max(prim, std::fabs(x_[i] - z_[i]));
                ax_norm = std::max(ax_norm, std::max(std::fabs(x_[i]), std::fabs(z_[i])));
            }
            double dual_scale = std::max(transpose_apply(y_eq_, zeros), inf_norm(y_box_));
            double dual = transpose_apply(y_eq_, y_box_);
            info.prim_res = prim; info.dual_res = dual; info.iterations = it;
            if(prim <= st_.eps_abs + st_.eps_rel*ax_norm && dual <= st_.eps_abs + st_.eps_rel*dual_scale){
                info.status = RelaxStatus::Solved;
                return info;
            }
            if(have_dy){
                double dnorm = std::max(inf_norm(dy_eq), inf_norm(dy_box));
                if(dnorm > st_.eps_abs){
                    double cert = transpose_apply(dy_eq, dy_box);
                    double support = 0.0;
                    for(int r=0;r<m;++r) support += rows_[r].rhs * scale_[r] * dy_eq[r];
                    for(int i=0;i<n_;++i) support += std::max(dy_box[i], 0.0);
                    if(cert <= st_.eps_prim_inf*dnorm && support < -st_.eps_prim_inf*dnorm){
                        info.status = RelaxStatus::Infeasible;
                        return info;
                    }
                }
            }
            if(it >= st_.max_iter){
                info.status = RelaxStatus::Inaccurate;
                return info;
            }
        }

        for(int i=0;i<n_;++i) rhs[i] = sigma*x_[i] + rho*z_[i] - y_box_[i];
        for(int r=0;r<m;++r){
            if(scale_[r]==0.0) continue;
            double c = scale_[r] * (req*rows_[r].rhs*scale_[r] - y_eq_[r]);
            for(int i : rows_[r].vars) rhs[i] += c;
        }
        xt = rhs;
        factor_solve(xt);

        // equality rows project onto the single point b
        for(int r=0;r<m;++r){
            if(scale_[r]==0.0){ dy_eq[r] = 0.0; continue; }
            double b = rows_[r].rhs * scale_[r];
            double v = alpha*row_dot(r, xt) + (1.0-alpha)*b;
            dy_eq[r] = req*(v - b);
            y_eq_[r] += dy_eq[r];
        }
        for(int i=0;i<n_;++i){
            double v = alpha*xt[i] + (1.0-alpha)*z_[i];
            double zn = clamp01(v + y_box_[i]/rho);
            dy_box[i] = rho*(v - zn);
            y_box_[i] += dy_box[i];
            z_[i] = zn;
            x_[i] = alpha*xt[i] + (1.0-alpha)*x_[i];
        }
        have_dy = true;
    }
}

}
