#include "lazymc/config/env_source.hpp"
#include <cstdlib>
#include <memory>
#include <utility>

env_source::env_source(lookup_fn lookup) : lookup(std::move(lookup)){}

env_source env_source::process(){
    return env_source([](std::string_view key) -> std::optional<std::string> {
        std::string key_str(key);
        const char* value = std::getenv(key_str.c_str());
        if(value == nullptr) return std::nullopt;
        return std::string(value);
    });
}

env_source env_source::from_map(env_map vars){
    auto shared = std::make_shared<const env_map>(std::move(vars));
    return env_source([shared](std::string_view key) -> std::optional<std::string> {
        auto it = shared->find(std::string(key));
        if(it == shared->end()) return std::nullopt;
        return it->second;
    });
}

std::optional<std::string> env_source::get(std::string_view key) const{
    if(!lookup) return std::nullopt;
    return lookup(key);
}
