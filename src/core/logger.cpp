#include "lazymc/core/logger.hpp"
#include "lazymc/core/error_code.hpp"
#include "lazymc/core/string_util.hpp"

#include <atomic>
#include <iostream>
#include <string>

namespace logger{
    static std::atomic<int> g_log_level{static_cast<int>(log_level::info)};

    static bool should_log(log_level level){
        return static_cast<int>(level) >= g_log_level.load(std::memory_order_relaxed);
    }

    static void log_line(std::string_view level_name, std::string_view msg){
        std::clog << "[" << level_name << "] " << msg << "\n";
    }

    static void log_line(std::string_view level_name, std::string_view location, std::string_view function, std::string_view msg){
        std::clog << "[" << level_name << "] "
                  << "[" << location << "::" << function << "] "
                  << msg << "\n";
    }

    static void log_line(std::string_view level_name, std::string_view msg, std::string_view function, const error_code& ec){
        std::clog << "[" << level_name << "] "
                  << "[" << function << "] "
                  << msg
                  << " "
                  << ::to_string(ec)
                  << "\n";
    }

    void set_log_level(log_level level){
        g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    std::optional<log_level> parse_log_level(std::string_view text){
        std::string lowered = string_util::to_lower(string_util::trim(text));
        if(lowered == "debug") return log_level::debug;
        if(lowered == "info") return log_level::info;
        if(lowered == "warn" || lowered == "warning") return log_level::warn;
        if(lowered == "error") return log_level::error;
        return std::nullopt;
    }

    void log_info(std::string_view msg){
        if(should_log(log_level::info)) log_line("INFO", msg);
    }
    void log_info(std::string_view location, std::string_view function, std::string_view msg){
        if(should_log(log_level::info)) log_line("INFO", location, function, msg);
    }

    void log_warn(std::string_view location, std::string_view function, std::string_view msg){
        if(should_log(log_level::warn)) log_line("WARN", location, function, msg);
    }

    void log_error(std::string_view location, std::string_view function, std::string_view msg){
        if(should_log(log_level::error)) log_line("ERROR", location, function, msg);
    }

    void log_error(std::string_view msg, std::string_view function, const error_code& ec){
        if(should_log(log_level::error)) log_line("ERROR", msg, function, ec);
    }
}
