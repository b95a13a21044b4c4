#pragma once
#include "lazymc/config/config.hpp"
#include "lazymc/config/env_source.hpp"
#include <string>

namespace env_sections{
    public_config public_from_env(const env_source& env);
    server_config server_from_env(const env_source& env, std::string command);
    time_config time_from_env(const env_source& env);
    motd_config motd_from_env(const env_source& env);
    join_kick_config join_kick_from_env(const env_source& env);
    join_hold_config join_hold_from_env(const env_source& env);
    join_forward_config join_forward_from_env(const env_source& env);
    join_lobby_config join_lobby_from_env(const env_source& env);
    join_config join_from_env(const env_source& env);
    lockout_config lockout_from_env(const env_source& env);
    rcon_config rcon_from_env(const env_source& env);
    advanced_config advanced_from_env(const env_source& env);
    version_config version_from_env(const env_source& env);
}
