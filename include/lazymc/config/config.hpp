#pragma once
#include "lazymc/config/defaults.hpp"
#include "lazymc/config/join_method.hpp"
#include "lazymc/net/socket_address.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Parses one of the literal addresses in config_defaults.
socket_address default_socket_address(std::string_view literal);

struct public_config{
    socket_address address = default_socket_address(config_defaults::public_address);
    std::string version{config_defaults::proto_version};
    std::uint32_t protocol = config_defaults::proto_protocol;
};

struct server_config{
    // Relative to the config file directory when loaded from a file.
    std::filesystem::path directory{std::string(config_defaults::server_directory)};
    std::string command;
    socket_address address = default_socket_address(config_defaults::server_address);
    bool freeze_process = config_defaults::server_freeze_process;
    bool wake_on_start = false;
    bool wake_on_crash = false;
    bool probe_on_start = false;
    bool forge = false;
    std::uint32_t start_timeout = config_defaults::server_start_timeout;
    std::uint32_t stop_timeout = config_defaults::server_stop_timeout;
    bool wake_whitelist = config_defaults::server_wake_whitelist;
    bool block_banned_ips = config_defaults::server_block_banned_ips;
    bool drop_banned_ips = false;
    bool send_proxy_v2 = false;
};

struct time_config{
    std::uint32_t sleep_after = config_defaults::time_sleep_after;
    std::uint32_t min_online_time = config_defaults::time_min_online_time;
};

struct motd_config{
    std::string sleeping{config_defaults::motd_sleeping};
    std::string starting{config_defaults::motd_starting};
    std::string stopping{config_defaults::motd_stopping};
    bool from_server = false;
};

struct join_kick_config{
    std::string starting{config_defaults::join_kick_starting};
    std::string stopping{config_defaults::join_kick_stopping};
};

struct join_hold_config{
    std::uint32_t timeout = config_defaults::join_hold_timeout;
};

struct join_forward_config{
    socket_address address = default_socket_address(config_defaults::join_forward_address);
    bool send_proxy_v2 = false;
};

struct join_lobby_config{
    std::uint32_t timeout = config_defaults::join_lobby_timeout;
    std::string message{config_defaults::join_lobby_message};
    std::optional<std::string> ready_sound{std::string(config_defaults::join_lobby_ready_sound)};
};

struct join_config{
    std::vector<join_method> methods{join_method::hold, join_method::kick};
    join_kick_config kick;
    join_hold_config hold;
    join_forward_config forward;
    join_lobby_config lobby;
};

struct lockout_config{
    bool enabled = false;
    std::string message{config_defaults::lockout_message};
};

struct rcon_config{
    bool enabled = config_defaults::rcon_enabled;
    std::uint16_t port = config_defaults::rcon_port;
    std::string password;
    bool randomize_password = config_defaults::rcon_randomize_password;
    bool send_proxy_v2 = false;
};

struct advanced_config{
    bool rewrite_server_properties = config_defaults::advanced_rewrite_server_properties;
};

struct version_config{
    std::optional<std::string> version;
};

class config{
    std::optional<std::filesystem::path> origin;
public:
    public_config pub;
    server_config server;
    time_config time;
    motd_config motd;
    join_config join;
    lockout_config lockout;
    rcon_config rcon;
    advanced_config advanced;
    version_config version;

    config() = default;
    explicit config(std::filesystem::path origin);

    // File the config was loaded from, empty when built from the environment.
    const std::optional<std::filesystem::path>& path() const noexcept;
};
