#pragma once
#include <string>
#include <string_view>

namespace escape{
    // \n, \r, \t, then \\, each as a full pass over the text.
    std::string decode(std::string_view input);
}
