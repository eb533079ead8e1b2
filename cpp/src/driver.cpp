#include "driver.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>

#include "autoplay.hpp"
#include "log.hpp"
#include "render.hpp"
#include "solver.hpp"

namespace game {

int play_games(const GameConfig& cfg, std::ostream& out, std::ostream& err){
    int won = 0, failed = 0;
    for(int g=0; g<cfg.games; ++g){
        std::optional<uint64_t> seed;
        if(cfg.seed) seed = *cfg.seed + (uint64_t)g;

        auto started = std::chrono::steady_clock::now();
        Outcome outcome = Outcome::Running;
        try {
            GameConfig gameCfg = cfg;
            gameCfg.seed = seed;
            Autoplay play(gameCfg);
            if(diag::enabled(1)){
                play.set_on_round([&play](const RoundReport& r){
                    render_progress(diag::stream(), r.round, play.board());
                    if(diag::enabled(3)) render_board(diag::stream(), play.board());
                });
            }
            outcome = play.run();
            double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            if(cfg.render) render_board(out, play.board());
            render_summary(out, g+1, outcome, play.rounds(), secs, play.board());
        } catch(const solve::InferenceError& e){
            err << "game " << g+1 << ": inference failed: " << e.what() << std::endl;
            ++failed;
            continue;
        } catch(const std::exception& e){
            err << "game " << g+1 << ": error: " << e.what() << std::endl;
            ++failed;
            continue;
        }
        if(outcome == Outcome::Won) ++won;
        else ++failed;
    }
    if(cfg.games > 1){
        out << "won " << won << " of " << cfg.games << " games" << std::endl;
    }
    return failed == 0 ? 0 : 1;
}

}
