#include "lazymc/config/config_loader.hpp"
#include "lazymc/config/defaults.hpp"
#include "lazymc/config/derived.hpp"
#include "lazymc/config/env_reader.hpp"
#include "lazymc/core/logger.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace{
std::string join_methods_string(const std::vector<join_method>& methods){
    if(methods.empty()) return "(none)";

    std::string out;
    for(join_method method : methods){
        if(!out.empty()) out += ", ";
        out += to_string(method);
    }
    return out;
}

void log_summary(const config& cfg){
    logger::log_info("config source: " + (cfg.path() ? cfg.path()->string() : std::string("environment")));
    logger::log_info("public address: " + cfg.pub.address.to_string()
        + " / version hint: " + cfg.pub.version
        + " / protocol hint: " + std::to_string(cfg.pub.protocol));
    logger::log_info("server directory: " + derived::server_directory(cfg).string());
    logger::log_info("server command: " + cfg.server.command);
    logger::log_info("server address: " + cfg.server.address.to_string());
    logger::log_info("server timeouts: start " + std::to_string(cfg.server.start_timeout)
        + "s / stop " + std::to_string(cfg.server.stop_timeout) + "s");
    logger::log_info("sleep after: " + std::to_string(cfg.time.sleep_after)
        + "s / min online: " + std::to_string(cfg.time.min_online_time) + "s");
    logger::log_info("join methods: " + join_methods_string(cfg.join.methods));
    logger::log_info("join forward address: " + cfg.join.forward.address.to_string());
    logger::log_info(std::string("lockout: ") + (cfg.lockout.enabled ? "enabled" : "disabled"));
    logger::log_info(std::string("rcon: ") + (cfg.rcon.enabled ? "enabled" : "disabled")
        + " / port " + std::to_string(cfg.rcon.port));
    logger::log_info("config version: " + cfg.version.version.value_or("(unknown)"));
}
}

int main(int argc, char** argv){
    env_source env = env_source::process();

    if(std::optional<std::string> level_text = env.get(env_reader::key("LOG"))){
        std::optional<logger::log_level> level = logger::parse_log_level(*level_text);
        if(level) logger::set_log_level(*level);
        else logger::log_warn("lazymc", __func__, "ignoring unknown log level '" + *level_text + "'");
    }

    std::filesystem::path config_path =
        argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path(config_defaults::config_file);

    const config cfg = config_loader::load_or_quit(config_path, env);
    logger::log_info("config load success");
    log_summary(cfg);
    return 0;
}
