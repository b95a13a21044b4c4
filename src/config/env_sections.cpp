#include "lazymc/config/env_sections.hpp"
#include "lazymc/config/defaults.hpp"
#include "lazymc/config/env_reader.hpp"
#include <utility>

public_config env_sections::public_from_env(const env_source& env){
    public_config cfg;
    cfg.address = env_reader::get_socket_address(env, "PUBLIC_ADDRESS", config_defaults::public_address);
    cfg.version = env_reader::get_string_or(env, "PUBLIC_VERSION", config_defaults::proto_version);
    cfg.protocol = env_reader::get_u32(env, "PUBLIC_PROTOCOL", config_defaults::proto_protocol);
    return cfg;
}

server_config env_sections::server_from_env(const env_source& env, std::string command){
    server_config cfg;
    cfg.directory = env_reader::get_string_or(env, "SERVER_DIRECTORY", config_defaults::server_directory);
    cfg.command = std::move(command);
    cfg.address = env_reader::get_socket_address(env, "SERVER_ADDRESS", config_defaults::server_address);
    cfg.freeze_process = env_reader::get_bool(env, "SERVER_FREEZE_PROCESS", config_defaults::server_freeze_process);
    cfg.wake_on_start = env_reader::get_bool(env, "SERVER_WAKE_ON_START", false);
    cfg.wake_on_crash = env_reader::get_bool(env, "SERVER_WAKE_ON_CRASH", false);
    cfg.probe_on_start = env_reader::get_bool(env, "SERVER_PROBE_ON_START", false);
    cfg.forge = env_reader::get_bool(env, "SERVER_FORGE", false);
    cfg.start_timeout = env_reader::get_u32(env, "SERVER_START_TIMEOUT", config_defaults::server_start_timeout);
    cfg.stop_timeout = env_reader::get_u32(env, "SERVER_STOP_TIMEOUT", config_defaults::server_stop_timeout);
    cfg.wake_whitelist = env_reader::get_bool(env, "SERVER_WAKE_WHITELIST", config_defaults::server_wake_whitelist);
    cfg.block_banned_ips = env_reader::get_bool(env, "SERVER_BLOCK_BANNED_IPS", config_defaults::server_block_banned_ips);
    cfg.drop_banned_ips = env_reader::get_bool(env, "SERVER_DROP_BANNED_IPS", false);
    cfg.send_proxy_v2 = env_reader::get_bool(env, "SERVER_SEND_PROXY_V2", false);
    return cfg;
}

time_config env_sections::time_from_env(const env_source& env){
    time_config cfg;
    cfg.sleep_after = env_reader::get_u32(env, "TIME_SLEEP_AFTER", config_defaults::time_sleep_after);
    cfg.min_online_time = env_reader::get_u32(env, "TIME_MIN_ONLINE_TIME", config_defaults::time_min_online_time);
    return cfg;
}

motd_config env_sections::motd_from_env(const env_source& env){
    motd_config cfg;
    cfg.sleeping = env_reader::get_string_or(env, "MOTD_SLEEPING", config_defaults::motd_sleeping);
    cfg.starting = env_reader::get_string_or(env, "MOTD_STARTING", config_defaults::motd_starting);
    cfg.stopping = env_reader::get_string_or(env, "MOTD_STOPPING", config_defaults::motd_stopping);
    cfg.from_server = env_reader::get_bool(env, "MOTD_FROM_SERVER", false);
    return cfg;
}

join_kick_config env_sections::join_kick_from_env(const env_source& env){
    join_kick_config cfg;
    cfg.starting = env_reader::get_string_or(env, "JOIN_KICK_STARTING", config_defaults::join_kick_starting);
    cfg.stopping = env_reader::get_string_or(env, "JOIN_KICK_STOPPING", config_defaults::join_kick_stopping);
    return cfg;
}

join_hold_config env_sections::join_hold_from_env(const env_source& env){
    join_hold_config cfg;
    cfg.timeout = env_reader::get_u32(env, "JOIN_HOLD_TIMEOUT", config_defaults::join_hold_timeout);
    return cfg;
}

join_forward_config env_sections::join_forward_from_env(const env_source& env){
    join_forward_config cfg;
    cfg.address = env_reader::get_socket_address(env, "JOIN_FORWARD_ADDRESS", config_defaults::join_forward_address);
    cfg.send_proxy_v2 = env_reader::get_bool(env, "JOIN_FORWARD_SEND_PROXY_V2", false);
    return cfg;
}

join_lobby_config env_sections::join_lobby_from_env(const env_source& env){
    join_lobby_config cfg;
    cfg.timeout = env_reader::get_u32(env, "JOIN_LOBBY_TIMEOUT", config_defaults::join_lobby_timeout);
    cfg.message = env_reader::get_string_or(env, "JOIN_LOBBY_MESSAGE", config_defaults::join_lobby_message);
    cfg.ready_sound = env_reader::get_string_or(env, "JOIN_LOBBY_READY_SOUND", config_defaults::join_lobby_ready_sound);
    return cfg;
}

join_config env_sections::join_from_env(const env_source& env){
    join_config cfg;
    cfg.methods.clear();
    for(const std::string& name : env_reader::get_string_list(env, "JOIN_METHODS", {"hold", "kick"})){
        std::optional<join_method> method = parse_join_method(name);
        if(method) cfg.methods.push_back(*method);
    }
    cfg.kick = join_kick_from_env(env);
    cfg.hold = join_hold_from_env(env);
    cfg.forward = join_forward_from_env(env);
    cfg.lobby = join_lobby_from_env(env);
    return cfg;
}

lockout_config env_sections::lockout_from_env(const env_source& env){
    lockout_config cfg;
    cfg.enabled = env_reader::get_bool(env, "LOCKOUT_ENABLED", false);
    cfg.message = env_reader::get_string_or(env, "LOCKOUT_MESSAGE", config_defaults::lockout_message);
    return cfg;
}

rcon_config env_sections::rcon_from_env(const env_source& env){
    rcon_config cfg;
    cfg.enabled = env_reader::get_bool(env, "RCON_ENABLED", config_defaults::rcon_enabled);
    cfg.port = env_reader::get_u16(env, "RCON_PORT", config_defaults::rcon_port);
    cfg.password = env_reader::get_string_or(env, "RCON_PASSWORD", "");
    cfg.randomize_password = env_reader::get_bool(env, "RCON_RANDOMIZE_PASSWORD", config_defaults::rcon_randomize_password);
    cfg.send_proxy_v2 = env_reader::get_bool(env, "RCON_SEND_PROXY_V2", false);
    return cfg;
}

advanced_config env_sections::advanced_from_env(const env_source& env){
    advanced_config cfg;
    cfg.rewrite_server_properties = env_reader::get_bool(
        env, "ADVANCED_REWRITE_SERVER_PROPERTIES", config_defaults::advanced_rewrite_server_properties
    );
    return cfg;
}

version_config env_sections::version_from_env(const env_source& env){
    version_config cfg;
    cfg.version = env_reader::get_string(env, "CONFIG_VERSION");
    return cfg;
}
