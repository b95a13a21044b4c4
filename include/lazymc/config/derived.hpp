#pragma once
#include "lazymc/config/config.hpp"
#include "lazymc/core/error_code.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace derived{
    // server.directory joined onto the config file's directory when the
    // config came from a file, as-is otherwise. Existence is not checked.
    std::filesystem::path server_directory(const config& cfg);

    // Password the backend should be given for this run.
    std::expected <std::string, error_code> rcon_password(const rcon_config& rcon);
}
