#pragma once
#include "lazymc/config/join_method.hpp"
#include "lazymc/core/error_code.hpp"
#include "lazymc/net/socket_address.hpp"
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <toml++/toml.hpp>
#include <vector>

// Typed, strict view of one TOML table. An absent table behaves like an
// empty one, so every getter falls back to its default.
class toml_section{
    const toml::table* tbl = nullptr;
    std::string path;

    const toml::node* find(std::string_view key) const;
    std::string field(std::string_view key) const;
    error_code fail(config_loader::config_error code, std::string_view key, const toml::node* node, std::string_view detail) const;
public:
    toml_section(const toml::table* tbl, std::string path);

    static std::expected <toml_section, error_code> root_child(const toml::table& root, std::string_view name);
    std::expected <toml_section, error_code> child(std::string_view name) const;

    bool present() const noexcept;
    bool contains(std::string_view key) const;

    std::expected <bool, error_code> get_bool(std::string_view key, bool fallback) const;
    std::expected <std::uint16_t, error_code> get_u16(std::string_view key, std::uint16_t fallback) const;
    std::expected <std::uint32_t, error_code> get_u32(std::string_view key, std::uint32_t fallback) const;
    std::expected <std::string, error_code> get_string(std::string_view key, std::string_view fallback) const;
    std::expected <std::optional<std::string>, error_code> get_optional_string(
        std::string_view key, std::optional<std::string> fallback
    ) const;
    std::expected <std::string, error_code> require_string(std::string_view key) const;
    std::expected <socket_address, error_code> get_socket_address(std::string_view key, std::string_view fallback) const;
    std::expected <std::vector<join_method>, error_code> get_join_methods(
        std::string_view key, std::initializer_list<join_method> fallback
    ) const;
};
