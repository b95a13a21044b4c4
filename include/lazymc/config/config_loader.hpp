#pragma once
#include "lazymc/config/config.hpp"
#include "lazymc/config/env_source.hpp"
#include "lazymc/core/error_code.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace config_loader{
    enum class config_error : int{
        file_not_found = 1,
        read_failed,
        parse_failed,
        invalid_type,
        out_of_range,
        invalid_address,
        unknown_join_method,
        missing_required_key,
        missing_server_command
    };

    std::string config_strerror(int code);

    // Canonical form of the candidate path if it can be computed, else the path as given.
    std::filesystem::path candidate_path(const std::filesystem::path& path);

    std::expected <config, error_code> parse_toml(
        std::string_view content, const std::filesystem::path& origin
    );
    std::expected <config, error_code> load_from_file(const std::filesystem::path& path);
    std::expected <config, error_code> load_from_env(const env_source& env);

    // Candidate path when it is a regular file. Otherwise logs the
    // environment fallback and returns nullopt.
    std::optional<std::filesystem::path> select_file(const std::filesystem::path& path);

    // File if the candidate is a regular file, environment otherwise.
    std::expected <config, error_code> load(const std::filesystem::path& path, const env_source& env);

    // Same as load, but exits the process with hints on failure.
    config load_or_quit(const std::filesystem::path& path, const env_source& env);
}
