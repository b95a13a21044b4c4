#pragma once
#include <string>
#include <string_view>
#include <vector>

struct error_code;

namespace fatal{
    struct error_hints{
        bool config = false;
        bool config_test = false;
    };

    std::vector<std::string> hint_lines(const error_hints& hints);

    [[noreturn]] void quit_error(std::string_view msg, const error_code& ec, const error_hints& hints = {});
    [[noreturn]] void quit_error_msg(std::string_view msg, const error_hints& hints = {});
}
