#include "lazymc/core/string_util.hpp"
#include <cctype>

std::string string_util::trim(std::string_view sv){
    std::size_t begin = 0;
    while(begin < sv.size() && std::isspace(static_cast<unsigned char>(sv[begin])) != 0){
        ++begin;
    }

    std::size_t end = sv.size();
    while(end > begin && std::isspace(static_cast<unsigned char>(sv[end - 1])) != 0){
        --end;
    }

    return std::string(sv.substr(begin, end - begin));
}

std::string string_util::to_lower(std::string_view sv){
    std::string out;
    out.reserve(sv.size());
    for(char ch : sv){
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

std::vector<std::string> string_util::split(std::string_view sv, char delim){
    std::vector<std::string> out;
    std::size_t start = 0;
    while(true){
        std::size_t pos = sv.find(delim, start);
        if(pos == std::string_view::npos){
            out.emplace_back(sv.substr(start));
            return out;
        }
        out.emplace_back(sv.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string string_util::replace_all(std::string_view sv, std::string_view from, std::string_view to){
    if(from.empty()) return std::string(sv);

    std::string out;
    out.reserve(sv.size());
    std::size_t start = 0;
    while(true){
        std::size_t pos = sv.find(from, start);
        if(pos == std::string_view::npos){
            out.append(sv.substr(start));
            return out;
        }
        out.append(sv.substr(start, pos - start));
        out.append(to);
        start = pos + from.size();
    }
}
