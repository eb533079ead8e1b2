#include <iostream>
#include <string>

#include "config.hpp"
#include "driver.hpp"
#include "log.hpp"

int main(int argc, char** argv){
    std::ios::sync_with_stdio(false);

    game::GameConfig cfg;
    std::string error;
    switch(game::parse_args(argc, argv, cfg, error)){
        case game::ParseResult::Help: std::cout << game::usage(); return 0;
        case game::ParseResult::Error: std::cerr << "error: " << error << "\n" << game::usage(); return 2;
        case game::ParseResult::Ok: break;
    }
    diag::set_verbosity(cfg.verbosity);

    try {
        game::validate_board(cfg);
    } catch(const game::ConfigError& e){
        std::cerr << "error: " << e.what() << std::endl;
        return 2;
    }

    return game::play_games(cfg, std::cout, std::cerr);
}
