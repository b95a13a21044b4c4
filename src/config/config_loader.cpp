#include "lazymc/config/config_loader.hpp"
#include "lazymc/config/env_reader.hpp"
#include "lazymc/config/env_sections.hpp"
#include "lazymc/config/file_sections.hpp"
#include "lazymc/config/version_check.hpp"
#include "lazymc/core/fatal.hpp"
#include "lazymc/core/logger.hpp"
#include "lazymc/core/path_util.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <optional>
#include <toml++/toml.hpp>
#include <utility>

std::string config_loader::config_strerror(int code){
    switch(static_cast<config_error>(code)){
        case config_error::file_not_found:
            return "config file not found";
        case config_error::read_failed:
            return "config read failed";
        case config_error::parse_failed:
            return "config is not valid TOML";
        case config_error::invalid_type:
            return "config field has the wrong type";
        case config_error::out_of_range:
            return "config number out of range";
        case config_error::invalid_address:
            return "config address could not be parsed or resolved";
        case config_error::unknown_join_method:
            return "config join method unknown";
        case config_error::missing_required_key:
            return "config missing required key";
        case config_error::missing_server_command:
            return "missing required environment variable LAZYMC_SERVER_COMMAND";
    }
    return "unknown config error";
}

std::filesystem::path config_loader::candidate_path(const std::filesystem::path& path){
    return path_util::normalize(path);
}

std::expected <config, error_code> config_loader::parse_toml(
    std::string_view content, const std::filesystem::path& origin
){
    toml::table root;
    try{
        root = toml::parse(content, origin.string());
    }
    catch(const toml::parse_error& err){
        const toml::source_region& where = err.source();
        logger::log_error(
            "lazymc::config", __func__,
            std::string(err.description())
                + " (line " + std::to_string(where.begin.line)
                + ", column " + std::to_string(where.begin.column) + ")"
        );
        return std::unexpected(error_code::from_config(config_error::parse_failed));
    }

    config cfg = origin.empty() ? config() : config(origin);

    auto public_exp = file_sections::read_public(root);
    if(!public_exp) return std::unexpected(public_exp.error());
    cfg.pub = std::move(*public_exp);

    auto server_exp = file_sections::read_server(root);
    if(!server_exp) return std::unexpected(server_exp.error());
    cfg.server = std::move(*server_exp);

    auto time_exp = file_sections::read_time(root);
    if(!time_exp) return std::unexpected(time_exp.error());
    cfg.time = *time_exp;

    auto motd_exp = file_sections::read_motd(root);
    if(!motd_exp) return std::unexpected(motd_exp.error());
    cfg.motd = std::move(*motd_exp);

    auto join_exp = file_sections::read_join(root);
    if(!join_exp) return std::unexpected(join_exp.error());
    cfg.join = std::move(*join_exp);

    auto lockout_exp = file_sections::read_lockout(root);
    if(!lockout_exp) return std::unexpected(lockout_exp.error());
    cfg.lockout = std::move(*lockout_exp);

    auto rcon_exp = file_sections::read_rcon(root);
    if(!rcon_exp) return std::unexpected(rcon_exp.error());
    cfg.rcon = std::move(*rcon_exp);

    auto advanced_exp = file_sections::read_advanced(root);
    if(!advanced_exp) return std::unexpected(advanced_exp.error());
    cfg.advanced = *advanced_exp;

    auto version_exp = file_sections::read_version(root);
    if(!version_exp) return std::unexpected(version_exp.error());
    cfg.version = std::move(*version_exp);

    version_check::warn_if_incompatible(cfg.version.version);
    return cfg;
}

std::expected <config, error_code> config_loader::load_from_file(const std::filesystem::path& path){
    std::filesystem::path origin = candidate_path(path);

    errno = 0;
    std::ifstream in(origin, std::ios::in | std::ios::binary);
    if(!in.is_open()){
        int ec = errno;
        if(ec != 0) return std::unexpected(error_code::from_errno(ec));
        return std::unexpected(error_code::from_config(config_error::file_not_found));
    }

    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if(in.bad()){
        return std::unexpected(error_code::from_config(config_error::read_failed));
    }

    return parse_toml(content, origin);
}

std::expected <config, error_code> config_loader::load_from_env(const env_source& env){
    std::optional<std::string> command = env_reader::get_string(env, "SERVER_COMMAND");
    if(!command || command->empty()){
        return std::unexpected(error_code::from_config(config_error::missing_server_command));
    }

    config cfg;
    cfg.pub = env_sections::public_from_env(env);
    cfg.server = env_sections::server_from_env(env, std::move(*command));
    cfg.time = env_sections::time_from_env(env);
    cfg.motd = env_sections::motd_from_env(env);
    cfg.join = env_sections::join_from_env(env);
    cfg.lockout = env_sections::lockout_from_env(env);
    cfg.rcon = env_sections::rcon_from_env(env);
    cfg.advanced = env_sections::advanced_from_env(env);
    cfg.version = env_sections::version_from_env(env);
    return cfg;
}

std::optional<std::filesystem::path> config_loader::select_file(const std::filesystem::path& path){
    std::filesystem::path candidate = candidate_path(path);
    if(path_util::is_regular_file(candidate)) return candidate;

    logger::log_info(
        "lazymc::config", __func__,
        "Config file not found at " + candidate.string() + ", using environment variables and defaults"
    );
    return std::nullopt;
}

std::expected <config, error_code> config_loader::load(const std::filesystem::path& path, const env_source& env){
    std::optional<std::filesystem::path> file = select_file(path);
    if(file) return load_from_file(*file);
    return load_from_env(env);
}

config config_loader::load_or_quit(const std::filesystem::path& path, const env_source& env){
    std::optional<std::filesystem::path> file = select_file(path);
    if(file){
        auto cfg_exp = load_from_file(*file);
        if(!cfg_exp){
            fatal::quit_error("Failed to load config", cfg_exp.error(), {.config = true, .config_test = true});
        }
        return std::move(*cfg_exp);
    }

    auto cfg_exp = load_from_env(env);
    if(!cfg_exp){
        fatal::quit_error_msg("Missing required environment variable: " + env_reader::key("SERVER_COMMAND"));
    }
    return std::move(*cfg_exp);
}
