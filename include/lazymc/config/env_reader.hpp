#pragma once
#include "lazymc/config/env_source.hpp"
#include "lazymc/net/socket_address.hpp"
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Names are given without the LAZYMC_ prefix. None of these fail: absent or
// malformed values yield the fallback.
namespace env_reader{
    std::string key(std::string_view name);

    std::optional<bool> parse_bool(std::string_view text);
    std::optional<std::uint16_t> parse_u16(std::string_view text);
    std::optional<std::uint32_t> parse_u32(std::string_view text);

    std::optional<std::string> get_string(const env_source& env, std::string_view name);
    std::string get_string_or(const env_source& env, std::string_view name, std::string_view fallback);
    bool get_bool(const env_source& env, std::string_view name, bool fallback);
    std::uint16_t get_u16(const env_source& env, std::string_view name, std::uint16_t fallback);
    std::uint32_t get_u32(const env_source& env, std::string_view name, std::uint32_t fallback);
    socket_address get_socket_address(const env_source& env, std::string_view name, std::string_view fallback);
    std::vector<std::string> get_string_list(
        const env_source& env, std::string_view name, std::initializer_list<std::string_view> fallback
    );
}
