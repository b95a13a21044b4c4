#include "lazymc/config/escape.hpp"
#include "lazymc/core/string_util.hpp"

std::string escape::decode(std::string_view input){
    std::string out = string_util::replace_all(input, "\\n", "\n");
    out = string_util::replace_all(out, "\\r", "\r");
    out = string_util::replace_all(out, "\\t", "\t");
    return string_util::replace_all(out, "\\\\", "\\");
}
