#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace config_defaults{
    inline constexpr std::string_view config_file = "lazymc.toml";
    inline constexpr std::string_view config_version = "0.2.8";
    inline constexpr std::string_view env_prefix = "LAZYMC_";

    inline constexpr std::string_view proto_version = "1.20.3";
    inline constexpr std::uint32_t proto_protocol = 765;

    inline constexpr std::string_view public_address = "0.0.0.0:25565";

    inline constexpr std::string_view server_directory = ".";
    inline constexpr std::string_view server_address = "127.0.0.1:25566";
    inline constexpr bool server_freeze_process = true;
    inline constexpr std::uint32_t server_start_timeout = 300;
    inline constexpr std::uint32_t server_stop_timeout = 150;
    inline constexpr bool server_wake_whitelist = true;
    inline constexpr bool server_block_banned_ips = true;

    inline constexpr std::uint32_t time_sleep_after = 60;
    inline constexpr std::uint32_t time_min_online_time = 60;

    inline constexpr std::string_view motd_sleeping = "☠ Server is sleeping\n§2☻ Join to start it up";
    inline constexpr std::string_view motd_starting = "§2☻ Server is starting...\n§7⌛ Please wait...";
    inline constexpr std::string_view motd_stopping = "☠ Server going to sleep...\n⌛ Please wait...";

    inline constexpr std::string_view join_kick_starting =
        "Server is starting... §c♥§r\n\nThis may take some time.\n\nPlease try to reconnect in a minute.";
    inline constexpr std::string_view join_kick_stopping =
        "Server is going to sleep... §7☠§r\n\nPlease try to reconnect in a minute to wake it again.";
    inline constexpr std::uint32_t join_hold_timeout = 25;
    inline constexpr std::string_view join_forward_address = "127.0.0.1:25565";
    inline constexpr std::uint32_t join_lobby_timeout = 10 * 60;
    inline constexpr std::string_view join_lobby_message = "§2Server is starting\n§7⌛ Please wait...";
    inline constexpr std::string_view join_lobby_ready_sound = "block.note_block.chime";

    inline constexpr std::string_view lockout_message =
        "Server is closed §7☠§r\n\nPlease come back another time.";

#if defined(_WIN32)
    inline constexpr bool rcon_enabled = true;
#else
    inline constexpr bool rcon_enabled = false;
#endif
    inline constexpr std::uint16_t rcon_port = 25575;
    inline constexpr bool rcon_randomize_password = true;
    inline constexpr std::size_t rcon_random_password_length = 32;

    inline constexpr bool advanced_rewrite_server_properties = true;
}
