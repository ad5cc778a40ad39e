// src/cli/budgetme.cpp - daily allowance ledger CLI
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>

#include "../config.h"
#include "../constants.h"
#include "../format.h"
#include "../ledger.h"
#include "../log.h"
#include "../paths.h"
#include "../session.h"
#include "../storage/store_factory.h"

using namespace bme;

static void usage(){
    std::cout <<
R"(budgetme - daily allowance tracker

Usage:
  budgetme [--conf=PATH] [--verbose|--quiet] [command]

Commands:
  (none)                       Print the current balance
  list                         Print every spend, oldest first, then the balance
  spend <amount> <reason> [specific] [-o|--loan]
                               Record a spend (scaled by the reason's cringe factor)
  undo                         Take back the newest spend
  redo                         Re-apply the newest undone spend
  garnish                      Move a negative balance into debt
  set <key> <values...>        Change a setting
  get <key> [keyword]          Show a setting

Keys:
  rate <dollars/day>           cringe <keyword> <factor>     synonym <a> <b>
  provider <local|aws>         path <dir|none>               log_level <level>
  access_key, secret_key, bucket_name, region, endpoint   (aws only)

Examples:
  budgetme spend 4.50 coffee "oat latte"
  budgetme set cringe coffee 2
  budgetme set synonym coffee latte
)";
}

struct Args {
    std::string conf_path;
    bool verbose = false;
    bool quiet = false;
    std::vector<std::string> words;
};

static Args parse_args(int argc, char** argv){
    Args a;
    for(int i=1;i<argc;i++){
        std::string s = argv[i];
        if(!a.words.empty()){
            a.words.push_back(s);
        } else if(s.rfind("--conf=",0)==0){
            a.conf_path = s.substr(7);
        } else if(s=="--conf" && i+1<argc){
            a.conf_path = argv[++i];
        } else if(s=="--verbose" || s=="-v"){
            a.verbose = true;
        } else if(s=="--quiet" || s=="-q"){
            a.quiet = true;
        } else if(s=="-h" || s=="--help"){
            usage(); std::exit(0);
        } else if(s.size() > 1 && s[0]=='-' && s[1]=='-'){
            throw std::runtime_error("unknown option " + s);
        } else {
            a.words.push_back(s);
        }
    }
    if(a.verbose && a.quiet) throw std::runtime_error("--verbose and --quiet are mutually exclusive");
    return a;
}

static void setup_logging(const Args& a, const Config& cfg){
    LogLevel level = LogLevel::WARN;
    if(!cfg.log_level.empty() && !log_parse_level(cfg.log_level, level)){
        log_warn(LogCategory::CONFIG, "Config: unknown log_level '" + cfg.log_level + "', using warn");
        level = LogLevel::WARN;
    }
    if(a.verbose) level = LogLevel::DEBUG;
    if(a.quiet) level = LogLevel::ERR;
    log_init(level, static_cast<uint32_t>(LogCategory::ALL), expand_home(cfg.log_file));
    log_enable_timestamps(a.verbose);
}

int main(int argc, char** argv){
    try{
        Args a = parse_args(argc, argv);

        Command cmd;
        std::string perr;
        if(!parse_command(a.words, cmd, perr)){
            std::cerr << "error: " << perr << "\n";
            usage(); return EXIT_FATAL;
        }

        const std::string conf_path = a.conf_path.empty() ? default_config_path() : a.conf_path;
        Config cfg;
        if(!load_config(conf_path, cfg))
            log_info(LogCategory::CONFIG, "No config at " + conf_path + ", using defaults");
        setup_logging(a, cfg);
        ui::set_colors(ui::detect_terminal_colors());

        auto save = [&conf_path](const Config& c, std::string& err){
            if(save_config(conf_path, c, err)) return true;
            err = conf_path + ": " + err;
            return false;
        };
        Session session(cfg, make_store, std::cout, std::cerr, save);
        int rc = session.run(cmd, now_ms());
        log_shutdown();
        return rc;
    }catch(const std::exception& ex){
        std::cerr << "fatal: " << ex.what() << "\n";
        log_shutdown();
        return EXIT_FATAL;
    }
}
