#include <catch2/catch.hpp>

#include <vector>

#include "autoplay.hpp"

using game::Autoplay;
using game::GameConfig;
using game::Outcome;
using game::Reveal;
using game::RoundReport;

static GameConfig make_config(int w, int h, int mines, uint64_t seed){
    GameConfig cfg;
    cfg.width = w; cfg.height = h; cfg.mines = mines; cfg.seed = seed;
    return cfg;
}

static bool same_report(const RoundReport& a, const RoundReport& b){
    return a.round == b.round && a.revealed == b.revealed && a.flagged == b.flagged
        && a.remaining_safe == b.remaining_safe && a.flags_remaining == b.flags_remaining && a.outcome == b.outcome;
}

TEST_CASE("mine-free board is won in a single round", "[autoplay]"){
    Autoplay play(make_config(5, 5, 0, 1));
    REQUIRE(play.outcome() == Outcome::Running);
    REQUIRE(play.run() == Outcome::Won);
    REQUIRE(play.rounds() == 1);
    REQUIRE(play.last_report().revealed.size() == 25);
    REQUIRE(play.board().has_won());
}

TEST_CASE("single row with its only mine in the middle", "[autoplay][scenario]"){
    // the centre column is the only cell outside the corner zones
    Autoplay play(make_config(5, 1, 1, 3));
    REQUIRE(play.board().is_mine(2, 0));

    REQUIRE(play.step() == Outcome::Running);
    const auto& first = play.last_report();
    REQUIRE(first.round == 1);
    REQUIRE(first.revealed == std::vector<Reveal>{{0,0,0}, {1,0,1}});
    REQUIRE(first.remaining_safe == 2);

    REQUIRE(play.step() == Outcome::Won);
    const auto& second = play.last_report();
    REQUIRE(second.round == 2);
    REQUIRE(second.flagged == std::vector<solve::Cell>{{2,0}});
    REQUIRE(second.flags_remaining == 0);
    REQUIRE(second.remaining_safe == 0);
    REQUIRE(play.board().is_flagged(2, 0));

    // terminal outcomes stick
    REQUIRE(play.step() == Outcome::Won);
    REQUIRE(play.rounds() == 2);
}

TEST_CASE("a false count leads the player onto the mine", "[autoplay][scenario]"){
    Autoplay play(make_config(5, 1, 1, 3));
    // claims (2,0) and (4,0) are clear
    play.solver().add_constraint(3, 0, 0);

    REQUIRE(play.step() == Outcome::Lost);
    const auto& report = play.last_report();
    REQUIRE(report.outcome == Outcome::Lost);
    REQUIRE(report.revealed == std::vector<Reveal>{{2,0,-1}});
    REQUIRE(play.board().lost());
    REQUIRE_FALSE(play.board().is_revealed(3, 0));
    REQUIRE_FALSE(play.board().is_revealed(4, 0));
    REQUIRE(play.step() == Outcome::Lost);
}

TEST_CASE("round limit stalls the game", "[autoplay]"){
    GameConfig cfg = make_config(5, 1, 1, 3);
    cfg.max_rounds = 1;
    Autoplay play(cfg);
    REQUIRE(play.run() == Outcome::Stalled);
    REQUIRE(play.rounds() == 1);
    REQUIRE_FALSE(play.board().has_won());
}

TEST_CASE("cancel stops before the next round", "[autoplay]"){
    Autoplay play(make_config(8, 8, 6, 9));
    int calls = 0;
    play.set_on_round([&](const RoundReport&){ ++calls; });
    play.cancel();
    REQUIRE(play.run() == Outcome::Cancelled);
    REQUIRE(play.rounds() == 0);
    REQUIRE(calls == 0);
}

TEST_CASE("round callback sees every round in order", "[autoplay]"){
    Autoplay play(make_config(5, 1, 1, 3));
    std::vector<int> rounds;
    std::vector<Outcome> outcomes;
    play.set_on_round([&](const RoundReport& r){ rounds.push_back(r.round); outcomes.push_back(r.outcome); });
    REQUIRE(play.run() == Outcome::Won);
    REQUIRE(rounds == std::vector<int>{1, 2});
    REQUIRE(outcomes == std::vector<Outcome>{Outcome::Running, Outcome::Won});
}

TEST_CASE("restart begins a fresh game", "[autoplay]"){
    Autoplay play(make_config(5, 1, 1, 3));
    play.cancel();
    REQUIRE(play.run() == Outcome::Cancelled);

    play.restart(uint64_t(3));
    REQUIRE(play.outcome() == Outcome::Running);
    REQUIRE(play.rounds() == 0);
    REQUIRE(play.board().remaining_safe() == 4);
    REQUIRE(play.solver().clicked_count() == 0);
    REQUIRE(play.run() == Outcome::Won);
}

TEST_CASE("same seed replays the same game", "[autoplay]"){
    std::vector<RoundReport> a, b;
    Autoplay first(make_config(8, 8, 6, 7));
    Autoplay second(make_config(8, 8, 6, 7));
    first.set_on_round([&](const RoundReport& r){ a.push_back(r); });
    second.set_on_round([&](const RoundReport& r){ b.push_back(r); });
    REQUIRE(first.run() == second.run());
    REQUIRE(a.size() == b.size());
    for(size_t i=0;i<a.size();++i){
        INFO("round " << i+1);
        REQUIRE(same_report(a[i], b[i]));
    }
}

TEST_CASE("random games end in a consistent terminal state", "[autoplay]"){
    for(uint64_t seed=1; seed<=3; ++seed){
        GameConfig cfg = make_config(8, 8, 6, seed);
        cfg.max_rounds = 200;
        Autoplay play(cfg);
        Outcome o = play.run();
        INFO("seed " << seed << " ended " << game::outcome_name(o));
        REQUIRE(o != Outcome::Running);
        REQUIRE(o != Outcome::Cancelled);
        if(o == Outcome::Won) REQUIRE(play.board().has_won());
        if(o == Outcome::Lost) REQUIRE(play.board().lost());
        REQUIRE(play.rounds() <= 200);
        for(const auto& m : play.board().mine_positions()){
            REQUIRE_FALSE((play.solver().is_clicked(m.first, m.second) && !play.board().lost()));
        }
    }
}
