#include "autoplay.hpp"

#include "log.hpp"

namespace game {

const char* outcome_name(Outcome o){
    switch(o){
        case Outcome::Running: return "running";
        case Outcome::Won: return "won";
        case Outcome::Lost: return "lost";
        case Outcome::Stalled: return "stalled";
        case Outcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

Autoplay::Autoplay(const GameConfig& cfg, const solve::RelaxationSettings& settings) : cfg_(cfg), settings_(settings) {
    restart(cfg.seed);
}

void Autoplay::restart(std::optional<uint64_t> seed){
    GameConfig c = cfg_;
    c.seed = seed;
    auto board = std::make_unique<Board>(c);
    auto solver = std::make_unique<solve::ConstraintSolver>(board->width(), board->height(), board->mines(), settings_);
    board_ = std::move(board);
    solver_ = std::move(solver);
    report_ = RoundReport{};
    outcome_ = Outcome::Running;
    rounds_ = 0;
    cancelled_ = false;
}

Outcome Autoplay::step(){
    if(outcome_ != Outcome::Running) return outcome_;
    if(cancelled_){ outcome_ = Outcome::Cancelled; return outcome_; }
    if(board_->lost()){ outcome_ = Outcome::Lost; return outcome_; }
    if(board_->has_won()){ outcome_ = Outcome::Won; return outcome_; }
    if(cfg_.max_rounds > 0 && rounds_ >= cfg_.max_rounds){ outcome_ = Outcome::Stalled; return outcome_; }

    rounds_++;
    report_ = RoundReport{};
    report_.round = rounds_;

    auto finish = [&](Outcome o){
        outcome_ = o;
        report_.outcome = o;
        report_.remaining_safe = board_->remaining_safe();
        report_.flags_remaining = board_->flags_remaining();
        if(on_round_) on_round_(report_);
        return o;
    };

    solve::Decision d = solver_->decide();
    if(d.empty()){
        if(diag::enabled(1)){ diag::stream() << "Autoplay::step: solver has nothing left to decide" << std::endl; }
        return finish(Outcome::Stalled);
    }

    for(const auto& c : d.reveal){
        for(const Reveal& r : board_->reveal(c.first, c.second)){
            report_.revealed.push_back(r);
            if(r.count < 0) return finish(Outcome::Lost);
            solver_->add_constraint(r.x, r.y, r.count);
        }
    }
    for(const auto& c : d.flag){
        if(diag::enabled(2)){ diag::stream() << "Autoplay::step: flagging " << c.first << " " << c.second << std::endl; }
        board_->flag(c.first, c.second);
        report_.flagged.push_back(c);
    }
    return finish(board_->has_won() ? Outcome::Won : Outcome::Running);
}

Outcome Autoplay::run(){
    while(step() == Outcome::Running){}
    return outcome_;
}

}
