#include "lazymc/config/config.hpp"
#include <utility>

socket_address default_socket_address(std::string_view literal){
    auto sa_exp = net::parse_socket_address(literal);
    if(!sa_exp) return socket_address{};
    return *sa_exp;
}

config::config(std::filesystem::path origin) : origin(std::move(origin)){}

const std::optional<std::filesystem::path>& config::path() const noexcept{ return origin; }
