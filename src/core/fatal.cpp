#include "lazymc/core/fatal.hpp"
#include "lazymc/core/error_code.hpp"
#include "lazymc/core/logger.hpp"

#include <cstdlib>
#include <iostream>

namespace{
void print_hints(const fatal::error_hints& hints){
    std::vector<std::string> lines = fatal::hint_lines(hints);
    if(lines.empty()) return;

    std::cerr << "\n";
    for(const std::string& line : lines){
        std::cerr << "  - " << line << "\n";
    }
}
}

std::vector<std::string> fatal::hint_lines(const error_hints& hints){
    std::vector<std::string> lines;
    if(hints.config){
        lines.emplace_back("Use a different config file by passing its path: lazymc_config_check <FILE>");
    }
    if(hints.config_test){
        lines.emplace_back("Validate the config file with: lazymc_config_check <FILE>");
    }
    return lines;
}

void fatal::quit_error(std::string_view msg, const error_code& ec, const error_hints& hints){
    logger::log_error(msg, "quit_error", ec);
    print_hints(hints);
    std::cerr.flush();
    std::exit(1);
}

void fatal::quit_error_msg(std::string_view msg, const error_hints& hints){
    logger::log_error("lazymc", "quit_error", msg);
    print_hints(hints);
    std::cerr.flush();
    std::exit(1);
}
