#pragma once
#include "lazymc/config/config.hpp"
#include "lazymc/core/error_code.hpp"
#include <expected>
#include <toml++/toml.hpp>

// Each reader reports every invalid field of its section through the logger
// and returns the first error.
namespace file_sections{
    std::expected <public_config, error_code> read_public(const toml::table& root);
    std::expected <server_config, error_code> read_server(const toml::table& root);
    std::expected <time_config, error_code> read_time(const toml::table& root);
    std::expected <motd_config, error_code> read_motd(const toml::table& root);
    std::expected <join_config, error_code> read_join(const toml::table& root);
    std::expected <lockout_config, error_code> read_lockout(const toml::table& root);
    std::expected <rcon_config, error_code> read_rcon(const toml::table& root);
    std::expected <advanced_config, error_code> read_advanced(const toml::table& root);
    std::expected <version_config, error_code> read_version(const toml::table& root);
}
