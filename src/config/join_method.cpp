#include "lazymc/config/join_method.hpp"
#include "lazymc/core/string_util.hpp"
#include <string>

std::string_view to_string(join_method method){
    switch(method){
        case join_method::kick:
            return "kick";
        case join_method::hold:
            return "hold";
        case join_method::forward:
            return "forward";
        case join_method::lobby:
            return "lobby";
    }
    return "unknown";
}

std::optional<join_method> parse_join_method_strict(std::string_view text){
    if(text == "kick") return join_method::kick;
    if(text == "hold") return join_method::hold;
    if(text == "forward") return join_method::forward;
    if(text == "lobby") return join_method::lobby;
    return std::nullopt;
}

std::optional<join_method> parse_join_method(std::string_view text){
    std::string lowered = string_util::to_lower(text);
    return parse_join_method_strict(lowered);
}
