#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace string_util{
    std::string trim(std::string_view sv);
    std::string to_lower(std::string_view sv);
    std::vector<std::string> split(std::string_view sv, char delim);
    std::string replace_all(std::string_view sv, std::string_view from, std::string_view to);
}
