#pragma once

#include <optional>
#include <string_view>

struct error_code;

namespace logger{
    enum class log_level : int{
        debug = 0,
        info = 1,
        warn = 2,
        error = 3
    };

    void set_log_level(log_level level);
    std::optional<log_level> parse_log_level(std::string_view text);

    void log_info(std::string_view msg);
    void log_info(std::string_view location, std::string_view function, std::string_view msg);
    void log_warn(std::string_view location, std::string_view function, std::string_view msg);
    void log_error(std::string_view location, std::string_view function, std::string_view msg);
    void log_error(std::string_view msg, std::string_view function, const error_code& ec);
}
