#include "lazymc/config/env_reader.hpp"
#include "lazymc/config/config.hpp"
#include "lazymc/config/defaults.hpp"
#include "lazymc/config/escape.hpp"
#include "lazymc/core/string_util.hpp"
#include <charconv>

namespace{
template<class T>
std::optional<T> parse_unsigned(std::string_view text){
    if(!text.empty() && text.front() == '+') text.remove_prefix(1);
    if(text.empty()) return std::nullopt;

    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if(ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}
}

std::string env_reader::key(std::string_view name){
    std::string out(config_defaults::env_prefix);
    out.append(name);
    return out;
}

std::optional<bool> env_reader::parse_bool(std::string_view text){
    std::string lowered = string_util::to_lower(text);
    if(lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") return true;
    if(lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") return false;
    return std::nullopt;
}

std::optional<std::uint16_t> env_reader::parse_u16(std::string_view text){
    return parse_unsigned<std::uint16_t>(text);
}

std::optional<std::uint32_t> env_reader::parse_u32(std::string_view text){
    return parse_unsigned<std::uint32_t>(text);
}

std::optional<std::string> env_reader::get_string(const env_source& env, std::string_view name){
    std::optional<std::string> raw = env.get(key(name));
    if(!raw) return std::nullopt;
    return escape::decode(*raw);
}

std::string env_reader::get_string_or(const env_source& env, std::string_view name, std::string_view fallback){
    std::optional<std::string> value = get_string(env, name);
    if(!value) return std::string(fallback);
    return *value;
}

bool env_reader::get_bool(const env_source& env, std::string_view name, bool fallback){
    std::optional<std::string> raw = env.get(key(name));
    if(!raw) return fallback;
    return parse_bool(*raw).value_or(fallback);
}

std::uint16_t env_reader::get_u16(const env_source& env, std::string_view name, std::uint16_t fallback){
    std::optional<std::string> raw = env.get(key(name));
    if(!raw) return fallback;
    return parse_u16(*raw).value_or(fallback);
}

std::uint32_t env_reader::get_u32(const env_source& env, std::string_view name, std::uint32_t fallback){
    std::optional<std::string> raw = env.get(key(name));
    if(!raw) return fallback;
    return parse_u32(*raw).value_or(fallback);
}

socket_address env_reader::get_socket_address(
    const env_source& env, std::string_view name, std::string_view fallback
){
    std::optional<std::string> raw = env.get(key(name));
    if(raw){
        auto sa_exp = net::resolve_socket_address(*raw);
        if(sa_exp) return *sa_exp;
    }
    return default_socket_address(fallback);
}

std::vector<std::string> env_reader::get_string_list(
    const env_source& env, std::string_view name, std::initializer_list<std::string_view> fallback
){
    std::optional<std::string> raw = env.get(key(name));
    if(!raw){
        std::vector<std::string> out;
        for(std::string_view item : fallback) out.emplace_back(item);
        return out;
    }

    std::vector<std::string> out;
    for(const std::string& item : string_util::split(*raw, ',')){
        out.push_back(escape::decode(string_util::trim(item)));
    }
    return out;
}
