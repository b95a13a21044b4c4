#include "lazymc/config/file_sections.hpp"
#include "lazymc/config/config_loader.hpp"
#include "lazymc/config/defaults.hpp"
#include "lazymc/config/toml_section.hpp"
#include "lazymc/core/logger.hpp"
#include <optional>
#include <utility>

namespace{
class field_sink{
    std::optional<error_code> first_error;
public:
    template<class D, class S>
    void set(D& dst, std::expected<S, error_code> src){
        if(!src){
            if(!first_error) first_error = src.error();
            return;
        }
        dst = std::move(*src);
    }

    template<class T>
    std::expected <T, error_code> finish(T value) const{
        if(first_error) return std::unexpected(*first_error);
        return value;
    }
};
}

std::expected <public_config, error_code> file_sections::read_public(const toml::table& root){
    auto sec_exp = toml_section::root_child(root, "public");
    if(!sec_exp) return std::unexpected(sec_exp.error());
    const toml_section& sec = *sec_exp;

    public_config cfg;
    field_sink sink;
    sink.set(cfg.address, sec.get_socket_address("address", config_defaults::public_address));
    sink.set(cfg.version, sec.get_string("version", config_defaults::proto_version));
    sink.set(cfg.protocol, sec.get_u32("protocol", config_defaults::proto_protocol));
    return sink.finish(std::move(cfg));
}

std::expected <server_config, error_code> file_sections::read_server(const toml::table& root){
    auto sec_exp = toml_section::root_child(root, "server");
    if(!sec_exp) return std::unexpected(sec_exp.error());
    const toml_section& sec = *sec_exp;

    if(!sec.present()){
        logger::log_error("lazymc::config", "server", "missing required table [server]");
        return std::unexpected(error_code::from_config(config_loader::config_error::missing_required_key));
    }

    server_config cfg;
    field_sink sink;
    sink.set(cfg.directory, sec.get_string("directory", config_defaults::server_directory));
    sink.set(cfg.command, sec.require_string("command"));
    sink.set(cfg.address, sec.get_socket_address("address", config_defaults::server_address));
    sink.set(cfg.freeze_process, sec.get_bool("freeze_process", config_defaults::server_freeze_process));
    sink.set(cfg.wake_on_start, sec.get_bool("wake_on_start", false));
    sink.set(cfg.wake_on_crash, sec.get_bool("wake_on_crash", false));
    sink.set(cfg.probe_on_start, sec.get_bool("probe_on_start", false));
    sink.set(cfg.forge, sec.get_bool("forge", false));
    sink.set(cfg.start_timeout, sec.get_u32("start_timeout", config_defaults::server_start_timeout));
    sink.set(cfg.stop_timeout, sec.get_u32("stop_timeout", config_defaults::server_stop_timeout));
    sink.set(cfg.wake_whitelist, sec.get_bool("wake_whitelist", config_defaults::server_wake_whitelist));
    sink.set(cfg.block_banned_ips, sec.get_bool("block_banned_ips", config_defaults::server_block_banned_ips));
    sink.set(cfg.drop_banned_ips, sec.get_bool("drop_banned_ips", false));
    sink.set(cfg.send_proxy_v2, sec.get_bool("send_proxy_v2", false));
    return sink.finish(std::move(cfg));
}

std::expected <time_config, error_code> file_sections::read_time(const toml::table& root){
    auto sec_exp = toml_section::root_child(root, "time");
    if(!sec_exp) return std::unexpected(sec_exp.error());
    const toml_section& sec = *sec_exp;

    time_config cfg;
    field_sink sink;
    sink.set(cfg.sleep_after, sec.get_u32("sleep_after", config_defaults::time_sleep_after));

    std::string_view min_online_key = "min_online_time";
    if(!sec.contains(min_online_key) && sec.contains("minimum_online_time")){
        min_online_key = "minimum_online_time";
    }
    sink.set(cfg.min_online_time, sec.get_u32(min_online_key, config_defaults::time_min_online_time));
    return sink.finish(std::move(cfg));
}

std::expected <motd_config, error_code> file_sections::read_motd(const toml::table& root){
    auto sec_exp = toml_section::root_child(root, "motd");
    if(!sec_exp) return std::unexpected(sec_exp.error());
    const toml_section& sec = *sec_exp;

    motd_config cfg;
    field_sink sink;
    sink.set(cfg.sleeping, sec.get_string("sleeping", config_defaults::motd_sleeping));
    sink.set(cfg.starting, sec.get_string("starting", config_defaults::motd_starting));
    sink.set(cfg.stopping, sec.get_string("stopping", config_defaults::motd_stopping));
    sink.set(cfg.from_server, sec.get_bool("from_server", false));
    return sink.finish(std::move(cfg));
}

std::expected <join_config, error_code> file_sections::read_join(const toml::table& root){
    auto sec_exp = toml_section::root_child(root, "join");
    if(!sec_exp) return std::unexpected(sec_exp.error());
    const toml_section& sec = *sec_exp;

    join_config cfg;
    field_sink sink;
    sink.set(cfg.methods, sec.get_join_methods("methods", {join_method::hold, join_method::kick}));

    auto kick_exp = sec.child("kick");
    if(!kick_exp) return std::unexpected(kick_exp.error());
    sink.set(cfg.kick.starting, kick_exp->get_string("starting", config_defaults::join_kick_starting));
    sink.set(cfg.kick.stopping, kick_exp->get_string("stopping", config_defaults::join_kick_stopping));

    auto hold_exp = sec.child("hold");
    if(!hold_exp) return std::unexpected(hold_exp.error());
    sink.set(cfg.hold.timeout, hold_exp->get_u32("timeout", config_defaults::join_hold_timeout));

    auto forward_exp = sec.child("forward");
    if(!forward_exp) return std::unexpected(forward_exp.error());
    sink.set(cfg.forward.address, forward_exp->get_socket_address("address", config_defaults::join_forward_address));
    sink.set(cfg.forward.send_proxy_v2, forward_exp->get_bool("send_proxy_v2", false));

    auto lobby_exp = sec.child("lobby");
    if(!lobby_exp) return std::unexpected(lobby_exp.error());
    sink.set(cfg.lobby.timeout, lobby_exp->get_u32("timeout", config_defaults::join_lobby_timeout));
    sink.set(cfg.lobby.message, lobby_exp->get_string("message", config_defaults::join_lobby_message));
    sink.set(cfg.lobby.ready_sound, lobby_exp->get_optional_string(
        "ready_sound", std::string(config_defaults::join_lobby_ready_sound)
    ));

    return sink.finish(std::move(cfg));
}

std::expected <lockout_config, error_code> file_sections::read_lockout(const toml::table& root){
    auto sec_exp = toml_section::root_child(root, "lockout");
    if(!sec_exp) return std::unexpected(sec_exp.error());
    const toml_section& sec = *sec_exp;

    lockout_config cfg;
    field_sink sink;
    sink.set(cfg.enabled, sec.get_bool("enabled", false));
    sink.set(cfg.message, sec.get_string("message", config_defaults::lockout_message));
    return sink.finish(std::move(cfg));
}

std::expected <rcon_config, error_code> file_sections::read_rcon(const toml::table& root){
    auto sec_exp = toml_section::root_child(root, "rcon");
    if(!sec_exp) return std::unexpected(sec_exp.error());
    const toml_section& sec = *sec_exp;

    rcon_config cfg;
    field_sink sink;
    sink.set(cfg.enabled, sec.get_bool("enabled", config_defaults::rcon_enabled));
    sink.set(cfg.port, sec.get_u16("port", config_defaults::rcon_port));
    sink.set(cfg.password, sec.get_string("password", ""));
    sink.set(cfg.randomize_password, sec.get_bool("randomize_password", config_defaults::rcon_randomize_password));
    sink.set(cfg.send_proxy_v2, sec.get_bool("send_proxy_v2", false));
    return sink.finish(std::move(cfg));
}

std::expected <advanced_config, error_code> file_sections::read_advanced(const toml::table& root){
    auto sec_exp = toml_section::root_child(root, "advanced");
    if(!sec_exp) return std::unexpected(sec_exp.error());
    const toml_section& sec = *sec_exp;

    advanced_config cfg;
    field_sink sink;
    sink.set(cfg.rewrite_server_properties, sec.get_bool(
        "rewrite_server_properties", config_defaults::advanced_rewrite_server_properties
    ));
    return sink.finish(std::move(cfg));
}

std::expected <version_config, error_code> file_sections::read_version(const toml::table& root){
    auto sec_exp = toml_section::root_child(root, "config");
    if(!sec_exp) return std::unexpected(sec_exp.error());
    const toml_section& sec = *sec_exp;

    version_config cfg;
    field_sink sink;
    sink.set(cfg.version, sec.get_optional_string("version", std::nullopt));
    return sink.finish(std::move(cfg));
}
