#include "lazymc/config/derived.hpp"
#include "lazymc/config/defaults.hpp"
#include "lazymc/core/path_util.hpp"
#include "lazymc/crypto/random.hpp"

std::filesystem::path derived::server_directory(const config& cfg){
    if(!cfg.path()) return cfg.server.directory;

    std::optional<std::filesystem::path> config_dir = path_util::parent_dir(*cfg.path());
    if(!config_dir) return cfg.server.directory;
    return path_util::resolve_from_root(*config_dir, cfg.server.directory);
}

std::expected <std::string, error_code> derived::rcon_password(const rcon_config& rcon){
    if(!rcon.randomize_password) return rcon.password;
    return crypto::random_alphanumeric(config_defaults::rcon_random_password_length);
}
