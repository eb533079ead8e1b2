#include "config.hpp"

#include <cctype>
#include <cstdint>
#include <string>

namespace game {

bool in_corner_zone(int x, int y, int width, int height){
    bool left = x < 2, right = x > width - 3;
    bool top = y < 2, bottom = y > height - 3;
    return (left || right) && (top || bottom);
}

long long eligible_mine_cells(int width, int height){
    if(width <= 0 || height <= 0) return 0;
    // the corner columns and rows overlap on boards narrower than 4
    long long cornerCols = width < 4 ? width : 4;
    long long cornerRows = height < 4 ? height : 4;
    return (long long)width*height - cornerCols*cornerRows;
}

void validate_board(const GameConfig& cfg){
    if(cfg.width < 1 || cfg.height < 1){
        throw ConfigError("board must be at least 1x1, got " + std::to_string(cfg.width) + "x" + std::to_string(cfg.height));
    }
    if((long long)cfg.width*cfg.height > kMaxCells){
        throw ConfigError("board of " + std::to_string(cfg.width) + "x" + std::to_string(cfg.height)
            + " exceeds the limit of " + std::to_string(kMaxCells) + " cells");
    }
    if(cfg.mines < 0){
        throw ConfigError("mine count must not be negative, got " + std::to_string(cfg.mines));
    }
    long long eligible = eligible_mine_cells(cfg.width, cfg.height);
    if(cfg.mines > eligible){
        throw ConfigError(std::to_string(cfg.mines) + " mines do not fit a " + std::to_string(cfg.width) + "x"
            + std::to_string(cfg.height) + " board (" + std::to_string(eligible) + " cells outside the corner zones)");
    }
}

static bool parse_uint(const std::string& s, uint64_t& out){
    size_t i=0;
    if(i<s.size() && s[i]=='+') ++i;
    uint64_t v=0; bool any=false;
    while(i<s.size() && std::isdigit((unsigned char)s[i])){
        uint64_t d = (uint64_t)(s[i++]-'0');
        if(v > (UINT64_MAX - d) / 10) return false;
        v = v*10 + d;
        any=true;
    }
    if(!any || i!=s.size()) return false;
    out = v;
    return true;
}

static bool take_value(int argc, const char* const* argv, int& i, const std::string& name, std::string& value, std::string& error){
    if(i+1 >= argc){ error = "missing value for " + name; return false; }
    value = argv[++i];
    return true;
}

static bool take_int(int argc, const char* const* argv, int& i, const std::string& name, int lo, int& out, std::string& error){
    std::string value; if(!take_value(argc,argv,i,name,value,error)) return false;
    uint64_t v=0;
    if(!parse_uint(value,v) || v < (uint64_t)lo || v > 1000000){ error = "invalid value for " + name + ": '" + value + "'"; return false; }
    out = (int)v;
    return true;
}

ParseResult parse_args(int argc, const char* const* argv, GameConfig& out, std::string& error){
    for(int i=1;i<argc;++i){
        std::string arg = argv[i];
        if(arg=="--help" || arg=="-h") return ParseResult::Help;
        if(arg=="--rows" || arg=="-r"){ if(!take_int(argc,argv,i,arg,1,out.height,error)) return ParseResult::Error; }
        else if(arg=="--columns" || arg=="-c"){ if(!take_int(argc,argv,i,arg,1,out.width,error)) return ParseResult::Error; }
        else if(arg=="--mines" || arg=="-m"){ if(!take_int(argc,argv,i,arg,0,out.mines,error)) return ParseResult::Error; }
        else if(arg=="--games" || arg=="-g"){ if(!take_int(argc,argv,i,arg,1,out.games,error)) return ParseResult::Error; }
        else if(arg=="--max-rounds"){ if(!take_int(argc,argv,i,arg,0,out.max_rounds,error)) return ParseResult::Error; }
        else if(arg=="--seed" || arg=="-s"){
            std::string value; if(!take_value(argc,argv,i,arg,value,error)) return ParseResult::Error;
            uint64_t v=0;
            if(!parse_uint(value,v)){ error = "invalid value for " + arg + ": '" + value + "'"; return ParseResult::Error; }
            out.seed = v;
        }
        else if(arg=="--no-render"){ out.render = false; }
        else if(arg=="--verbose"){ out.verbosity++; }
        else if(arg.size()>=2 && arg[0]=='-' && arg[1]=='v' && arg.find_first_not_of('v',1)==std::string::npos){
            out.verbosity += (int)arg.size() - 1;
        }
        else { error = "unknown argument '" + arg + "'"; return ParseResult::Error; }
    }
    return ParseResult::Ok;
}

const char* usage(){
    return
        "usage: mineslp [options]\n"
        "Solve minesweeper boards by iterated linear relaxation.\n"
        "\n"
        "  -r, --rows N         board rows (default 16)\n"
        "  -c, --columns N      board columns (default 16)\n"
        "  -m, --mines N        number of mines (default 40)\n"
        "  -s, --seed N         seed for reproducible boards\n"
        "  -g, --games N        number of games to play (default 1)\n"
        "      --max-rounds N   give up after N rounds (default: no limit)\n"
        "      --no-render      do not print the final board\n"
        "  -v, --verbose        increase verbosity (repeatable)\n"
        "  -h, --help           show this help\n";
}

}
